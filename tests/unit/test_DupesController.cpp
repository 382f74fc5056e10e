#include "dupes/Controller.hpp"
#include "concurrency/ThreadPoolManager.hpp"
#include "config/ConfigRegistry.hpp"
#include "error/Error.hpp"
#include "util/files.hpp"
#include "TestTree.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace fm;
using namespace fm::dupes;
using namespace fm::test;

namespace {

std::set<std::string> remaining(const TestTree& t) {
    std::set<std::string> out;
    for (const auto& e : std::filesystem::recursive_directory_iterator(t.root()))
        if (e.is_regular_file()) out.insert(util::relativeKey(t.root(), e.path()));
    return out;
}

}

class DupesControllerTest : public ::testing::Test {
protected:
    TestTree reports;

    static void seed(const TestTree& t) {
        t.write("photos/2019/img_001.jpg", std::string(3000, 'p'));
        t.write("photos/backup/img_001.jpg", std::string(3000, 'p'));
        t.write("photos/backup/img_001 (1).jpg", std::string(3000, 'p'));
        t.write("docs/report.txt", "quarterly numbers");
        t.write("docs/old/report.txt", "quarterly numbers");
        t.write("docs/notes.txt", "unique");
        t.write("same_size_a", "aaaa");
        t.write("same_size_b", "bbbb");

        t.setMtime("photos/2019/img_001.jpg", T0);
        t.setMtime("photos/backup/img_001.jpg", T0 + DAY);
        t.setMtime("photos/backup/img_001 (1).jpg", T0 + 2 * DAY);
        t.setMtime("docs/report.txt", T0 + DAY);
        t.setMtime("docs/old/report.txt", T0);
    }

    model::Summary run(const Options& opts) const {
        concurrency::ThreadPoolManager pools(std::make_shared<std::atomic<bool>>(false), config::ConcurrencyConfig{});
        return Controller::run(opts, pools, config::ConfigRegistry::get());
    }
};

TEST_F(DupesControllerTest, ReloadedReportDeletesWhatALiveRunDeletes) {
    TestTree live, staged;
    seed(live);
    seed(staged);

    const auto liveSummary = run({ .path = live.root(), .output_json = reports.path("live.json"), .remove = true });

    const auto reportPath = reports.path("staged.json");
    const auto detect = run({ .path = staged.root(), .output_json = reportPath });
    EXPECT_EQ(detect.files_deleted, 0u);
    EXPECT_EQ(remaining(staged).size(), 8u);

    const auto reloaded = run({ .input_json = reportPath, .output_json = reports.path("again.json"), .remove = true });

    EXPECT_EQ(liveSummary.files_deleted, 3u);
    EXPECT_EQ(reloaded.files_deleted, liveSummary.files_deleted);
    EXPECT_EQ(reloaded.bytes_reclaimed, liveSummary.bytes_reclaimed);
    EXPECT_EQ(reloaded.errors(), 0u);
    EXPECT_EQ(remaining(staged), remaining(live));
    EXPECT_EQ(remaining(live), (std::set<std::string>{
        "docs/notes.txt", "docs/old/report.txt", "photos/2019/img_001.jpg", "same_size_a", "same_size_b"}));
}

TEST_F(DupesControllerTest, DryRunDeletesNothing) {
    TestTree t;
    seed(t);
    const auto before = remaining(t);

    const auto s = run({ .path = t.root(), .output_json = reports.path("dry.json"), .remove = true, .dry_run = true });

    EXPECT_TRUE(s.dry_run);
    EXPECT_EQ(s.files_deleted, 3u);
    EXPECT_EQ(s.bytes_reclaimed, 2u * 3000 + 17);
    EXPECT_EQ(remaining(t), before);
    EXPECT_TRUE(std::filesystem::exists(reports.path("dry.json")));
}

TEST_F(DupesControllerTest, ReportIsWrittenEvenWithoutDuplicates) {
    TestTree t;
    t.write("one", "1");
    t.write("two", "22");

    const auto s = run({ .path = t.root(), .output_json = reports.path("none.json") });
    EXPECT_EQ(s.groups, 0u);
    EXPECT_EQ(TestTree::readFile(reports.path("none.json")), "[]\n");
}

TEST_F(DupesControllerTest, NonUtf8NameDoesNotAbortTheRun) {
    TestTree t;
    t.write("keep.bin", "duplicated payload");
    t.write("bad\xff.bin", "duplicated payload");
    t.setMtime("keep.bin", T0);
    t.setMtime("bad\xff.bin", T0 + DAY);

    model::Summary s;
    ASSERT_NO_THROW(s = run({ .path = t.root(), .output_json = reports.path("bad.json"), .remove = true }));
    EXPECT_EQ(s.groups, 1u);
    EXPECT_EQ(s.files_deleted, 1u);
    EXPECT_EQ(s.errors(), 0u);
    EXPECT_EQ(remaining(t), (std::set<std::string>{"keep.bin"}));
    EXPECT_TRUE(std::filesystem::exists(reports.path("bad.json")));
}

TEST_F(DupesControllerTest, MissingSourceIsAConfigError) {
    EXPECT_THROW(run({}), error::ConfigError);
    EXPECT_THROW(run({ .path = reports.path("absent") }), error::ConfigError);
}

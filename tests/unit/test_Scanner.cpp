#include "fs/Scanner.hpp"
#include "fs/model/FileRecord.hpp"
#include "fs/tasks/ScanDir.hpp"
#include "concurrency/ThreadPool.hpp"
#include "error/Error.hpp"
#include "TestTree.hpp"

#include <gtest/gtest.h>

#include <algorithm>

#include <unistd.h>

using namespace fm;
using namespace fm::fs;
using namespace fm::fs::model;
using namespace fm::test;

namespace {

std::vector<std::string> keys(const ScanSession& s) {
    std::vector<std::string> out;
    for (const auto& r : s.records) out.push_back(r.relative_path);
    return out;
}

}

class ScannerTest : public ::testing::Test {
protected:
    TestTree tree;
    concurrency::ThreadPool pool{"scan-test", 4};
};

TEST_F(ScannerTest, FindsNestedFilesWithRelativeKeys) {
    tree.write("a.txt", "a");
    tree.write("sub/b.txt", "bb");
    tree.write("sub/deeper/c.txt", "ccc");
    tree.mkdir("empty");

    const auto session = Scanner::scan(tree.root(), pool);

    EXPECT_EQ(keys(session), (std::vector<std::string>{"a.txt", "sub/b.txt", "sub/deeper/c.txt"}));
    EXPECT_EQ(session.totalBytes(), 6u);
    EXPECT_TRUE(session.warnings.empty());
    EXPECT_FALSE(session.interrupted);
    EXPECT_EQ(session.directories_visited, 4u);

    const auto* c = session.find("sub/deeper/c.txt");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->size_bytes, 3u);
    EXPECT_EQ(c->absolute_path, tree.path("sub/deeper/c.txt"));
    EXPECT_EQ(session.find("missing"), nullptr);
}

TEST_F(ScannerTest, RecordsCarryModificationTime) {
    tree.write("f", "x");
    tree.setMtime("f", T0 + 3 * DAY);

    const auto session = Scanner::scan(tree.root(), pool);
    ASSERT_EQ(session.records.size(), 1u);
    EXPECT_EQ(session.records[0].modified_time, T0 + 3 * DAY);
    EXPECT_FALSE(session.records[0].digest);
}

TEST_F(ScannerTest, DoesNotFollowSymlinks) {
    tree.write("real/file", "data");
    std::filesystem::create_symlink(tree.path("real/file"), tree.path("link_to_file"));
    std::filesystem::create_directory_symlink(tree.path("real"), tree.path("link_to_dir"));

    const auto session = Scanner::scan(tree.root(), pool);

    EXPECT_EQ(keys(session), (std::vector<std::string>{"real/file"}));
    EXPECT_EQ(session.symlinks_skipped, 2u);
}

TEST_F(ScannerTest, UnreadableDirectoryBecomesWarning) {
    if (::geteuid() == 0) GTEST_SKIP() << "root ignores directory permissions";

    tree.write("ok/file", "1");
    tree.write("locked/hidden", "2");
    std::filesystem::permissions(tree.path("locked"), std::filesystem::perms::none);

    const auto session = Scanner::scan(tree.root(), pool);

    EXPECT_EQ(keys(session), (std::vector<std::string>{"ok/file"}));
    ASSERT_EQ(session.warnings.size(), 1u);
    EXPECT_EQ(session.warnings[0].path, tree.path("locked"));
}

TEST_F(ScannerTest, DirectoryGoneAfterDiscoveryBecomesWarning) {
    tree.write("ok/file", "1");
    tree.write("not_a_dir", "2");

    auto state = std::make_shared<tasks::ScanState>(tree.root(), pool);
    pool.submit(std::make_shared<tasks::ScanDir>(state, tree.path("ok")));
    pool.submit(std::make_shared<tasks::ScanDir>(state, tree.path("removed")));
    pool.submit(std::make_shared<tasks::ScanDir>(state, tree.path("not_a_dir")));
    pool.wait();

    const auto& session = state->session;
    EXPECT_EQ(keys(session), (std::vector<std::string>{"ok/file"}));
    ASSERT_EQ(session.warnings.size(), 2u);

    std::vector<std::filesystem::path> warned;
    for (const auto& w : session.warnings) {
        warned.push_back(w.path);
        EXPECT_FALSE(w.reason.empty());
    }
    std::sort(warned.begin(), warned.end());
    EXPECT_EQ(warned, (std::vector<std::filesystem::path>{tree.path("not_a_dir"), tree.path("removed")}));
    EXPECT_EQ(state->directories.load(), 3u);
    EXPECT_FALSE(state->incomplete.load());
}

TEST_F(ScannerTest, SkipsExcludedPathsAndTempSiblings) {
    tree.write("keep", "1");
    tree.write("state.json", "{}");
    tree.write(".keep.fmtmp-Ab12Cd34", "partial");
    tree.write(".notes.fmtmp-draft", "a user file");

    const auto session = Scanner::scan(tree.root(), pool, {tree.path("state.json")});

    EXPECT_EQ(keys(session), (std::vector<std::string>{".notes.fmtmp-draft", "keep"}));
}

TEST_F(ScannerTest, MissingRootIsNotFound) {
    EXPECT_THROW(Scanner::scan(tree.path("nope"), pool), error::NotFoundError);
}

TEST_F(ScannerTest, NonAsciiNamesKeepTheirBytes) {
    tree.write("fotos/\xc3\xa9t\xc3\xa9/\xe6\x97\xa5\xe6\x9c\xac.jpg", "jpg");

    const auto session = Scanner::scan(tree.root(), pool);
    ASSERT_EQ(session.records.size(), 1u);
    EXPECT_EQ(session.records[0].relative_path, "fotos/\xc3\xa9t\xc3\xa9/\xe6\x97\xa5\xe6\x9c\xac.jpg");
}

TEST(FileRecordTest, FromPathAndMetadataComparison) {
    const TestTree tree;
    tree.write("dir/f", "12345");
    tree.setMtime("dir/f", T0);

    const auto rec = FileRecord::fromPath(tree.root(), tree.path("dir/f"));
    EXPECT_EQ(rec.relative_path, "dir/f");
    EXPECT_EQ(rec.size_bytes, 5u);
    EXPECT_EQ(rec.modified_time, T0);

    FileRecord other = rec;
    other.modified_time = T0 + 1'000'000;
    EXPECT_FALSE(rec.sameMetadata(other));
    EXPECT_TRUE(rec.sameMetadata(other, 1'000'000));
    other.size_bytes = 6;
    EXPECT_FALSE(rec.sameMetadata(other, 1'000'000));

    EXPECT_THROW(FileRecord::fromPath(tree.root(), tree.path("dir/none")), error::NotFoundError);
    EXPECT_THROW(FileRecord::fromPath(tree.root(), tree.path("dir")), error::IOError);
}

#include "dupes/Remover.hpp"
#include "dupes/Detector.hpp"
#include "fs/Scanner.hpp"
#include "concurrency/ThreadPool.hpp"
#include "TestTree.hpp"

#include <gtest/gtest.h>

using namespace fm;
using namespace fm::dupes;
using namespace fm::dupes::model;
using namespace fm::test;

class RemoverTest : public ::testing::Test {
protected:
    TestTree tree;
    concurrency::ThreadPool pool{"remove-test", 3};

    std::vector<DuplicateGroup> groups() {
        auto session = fs::Scanner::scan(tree.root(), pool);
        return Detector::detect(session, pool, {.chunk_size = 16}).groups;
    }

    void seed() {
        tree.write("orig", "payload!");
        tree.write("copy1", "payload!");
        tree.write("sub/copy2", "payload!");
        tree.write("other", "unrelated");
        tree.setMtime("orig", T0);
        tree.setMtime("copy1", T0 + DAY);
        tree.setMtime("sub/copy2", T0 + 2 * DAY);
    }
};

TEST_F(RemoverTest, DeletesEverythingButTheRetainedFile) {
    seed();
    const auto r = Remover::run(groups(), pool, false);

    EXPECT_EQ(r.files_deleted, 2u);
    EXPECT_EQ(r.bytes_reclaimed, 16u);
    EXPECT_EQ(r.errors, 0u);
    EXPECT_TRUE(tree.exists("orig"));
    EXPECT_FALSE(tree.exists("copy1"));
    EXPECT_FALSE(tree.exists("sub/copy2"));
    EXPECT_TRUE(tree.exists("other"));
    EXPECT_EQ(tree.read("orig"), "payload!");
}

TEST_F(RemoverTest, DryRunTouchesNothing) {
    seed();
    const auto r = Remover::run(groups(), pool, true);

    EXPECT_EQ(r.files_deleted, 2u);
    EXPECT_EQ(r.bytes_reclaimed, 16u);
    EXPECT_TRUE(tree.exists("orig"));
    EXPECT_TRUE(tree.exists("copy1"));
    EXPECT_TRUE(tree.exists("sub/copy2"));
    EXPECT_EQ(tree.mtime("copy1"), T0 + DAY);
}

TEST_F(RemoverTest, ChangedOrVanishedDuplicatesAreLeftAlone) {
    seed();
    const auto g = groups();

    tree.write("copy1", "payload! but longer now");
    std::filesystem::remove(tree.path("sub/copy2"));

    const auto r = Remover::run(g, pool, false);
    EXPECT_EQ(r.files_deleted, 0u);
    EXPECT_EQ(r.files_changed, 1u);
    EXPECT_EQ(r.files_missing, 1u);
    EXPECT_TRUE(tree.exists("copy1"));
}

TEST_F(RemoverTest, GroupWithMissingRetainedFileIsSkipped) {
    seed();
    const auto g = groups();
    std::filesystem::remove(tree.path("orig"));

    const auto r = Remover::run(g, pool, false);
    EXPECT_EQ(r.groups_skipped, 1u);
    EXPECT_EQ(r.files_deleted, 0u);
    EXPECT_TRUE(tree.exists("copy1"));
    EXPECT_TRUE(tree.exists("sub/copy2"));
}

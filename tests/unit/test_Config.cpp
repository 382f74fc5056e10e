#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "error/Error.hpp"
#include "TestTree.hpp"

#include <gtest/gtest.h>

using namespace fm;
using namespace fm::config;
using namespace fm::test;

TEST(ConfigTest, MissingFileYieldsDefaults) {
    const TestTree tree;
    const auto cfg = loadConfig(tree.path("absent.yaml"));
    EXPECT_EQ(cfg.hashing.chunk_size_bytes, DEFAULT_HASH_CHUNK_SIZE);
    EXPECT_EQ(cfg.concurrency.hash_threads, 0u);
    EXPECT_EQ(cfg.sync.mtime_tolerance_ms, 0u);
    EXPECT_EQ(cfg.duplicates.report_dir, std::filesystem::path("reports"));
}

TEST(ConfigTest, ParsesSections) {
    const TestTree tree;
    tree.write("fm.yaml", R"(
concurrency:
  scan_threads: 3
  hash_threads: 2
hashing:
  chunk_size_kb: 64
duplicates:
  report_dir: /var/lib/fm/reports
  min_size_bytes: 4096
sync:
  cache_dir: /var/cache/fm
  mtime_tolerance_ms: 2000
logging:
  log_dir: /var/log/fm
  log_levels:
    console_log_level: warn
    file_log_level: debug
)");

    const auto cfg = loadConfig(tree.path("fm.yaml"));
    EXPECT_EQ(cfg.concurrency.scan_threads, 3u);
    EXPECT_EQ(cfg.concurrency.hash_threads, 2u);
    EXPECT_EQ(cfg.concurrency.io_threads, 0u);
    EXPECT_EQ(cfg.hashing.chunk_size_bytes, 64u * 1024);
    EXPECT_EQ(cfg.duplicates.report_dir, std::filesystem::path("/var/lib/fm/reports"));
    EXPECT_EQ(cfg.duplicates.min_size_bytes, 4096u);
    EXPECT_EQ(cfg.sync.cache_dir, std::filesystem::path("/var/cache/fm"));
    EXPECT_EQ(cfg.sync.mtime_tolerance_ms, 2000u);
    EXPECT_EQ(cfg.logging.log_dir, std::filesystem::path("/var/log/fm"));
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::debug);
}

TEST(ConfigTest, MalformedYamlIsConfigError) {
    const TestTree tree;
    tree.write("bad.yaml", "concurrency: [unterminated\n");
    EXPECT_THROW(loadConfig(tree.path("bad.yaml")), error::ConfigError);

    tree.write("scalar.yaml", "just a string\n");
    EXPECT_THROW(loadConfig(tree.path("scalar.yaml")), error::ConfigError);
}

TEST(ConfigTest, ZeroChunkSizeIsRejected) {
    const TestTree tree;
    tree.write("zero.yaml", "hashing:\n  chunk_size_kb: 0\n");
    EXPECT_THROW(loadConfig(tree.path("zero.yaml")), error::ConfigError);
}

TEST(ConfigRegistryTest, FirstInitWins) {
    ASSERT_TRUE(ConfigRegistry::isInitialized());
    ASSERT_TRUE(logging::LogRegistry::isInitialized());

    const auto chunk = ConfigRegistry::get().hashing.chunk_size_bytes;
    Config other;
    other.hashing.chunk_size_bytes = chunk + 1;
    ConfigRegistry::init(other);
    EXPECT_EQ(ConfigRegistry::get().hashing.chunk_size_bytes, chunk);
}

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace fm::config {

constexpr static uintmax_t DEFAULT_HASH_CHUNK_SIZE = 1024 * 1024; // 1MB

struct ConcurrencyConfig {
    unsigned int scan_threads = 0;  // 0 = auto, I/O bound
    unsigned int hash_threads = 0;  // 0 = auto, CPU bound
    unsigned int io_threads = 0;    // 0 = auto, I/O bound (copy/delete)
};

struct HashingConfig {
    uintmax_t chunk_size_bytes = DEFAULT_HASH_CHUNK_SIZE;
};

struct DuplicatesConfig {
    std::filesystem::path report_dir = "reports";
    uintmax_t min_size_bytes = 0;
};

struct SyncConfig {
    std::filesystem::path cache_dir = ".filesmanager/cache";
    unsigned int mtime_tolerance_ms = 0;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum filesmanager = spdlog::level::info;  // Start/end of run, summaries
    spdlog::level::level_enum scan         = spdlog::level::info;  // Unreadable subtrees surface as warnings
    spdlog::level::level_enum hash         = spdlog::level::info;  // Per-file hash failures
    spdlog::level::level_enum cache        = spdlog::level::info;  // Corrupt or unwritable cache
    spdlog::level::level_enum dupes        = spdlog::level::info;  // Per-file deletion records
    spdlog::level::level_enum sync         = spdlog::level::info;  // Per-file copy records
    spdlog::level::level_enum cli          = spdlog::level::warn;  // Argument parsing edge cases
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "logs";
    LogLevelsConfig levels;
};

struct Config {
    ConcurrencyConfig concurrency;
    HashingConfig hashing;
    DuplicatesConfig duplicates;
    SyncConfig sync;
    LoggingConfig logging;
};

// Missing file yields defaults; malformed file throws error::ConfigError
Config loadConfig(const std::filesystem::path& path);

}

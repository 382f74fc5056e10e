#pragma once

#include <cstdint>
#include <filesystem>

namespace fm::sync::model {

struct Summary {
    uint64_t source_files{};
    uint64_t destination_files{};
    uint64_t scan_warnings{};

    uint64_t files_copied{};     // or that would be copied, in dry-run
    uintmax_t bytes_copied{};
    uint64_t files_skipped{};
    uint64_t hashed_files{};
    uint64_t cache_hits{};

    uint64_t plan_errors{};      // unreadable sources found while planning
    uint64_t copy_errors{};
    uint64_t cache_errors{};
    uint64_t cancelled{};

    std::filesystem::path cache_path{};
    bool dry_run = false;
    bool interrupted = false;

    [[nodiscard]] uint64_t errors() const { return plan_errors + copy_errors + cache_errors; }

    void log() const;
};

}

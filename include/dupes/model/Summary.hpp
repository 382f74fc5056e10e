#pragma once

#include <cstdint>
#include <filesystem>

namespace fm::dupes::model {

struct Summary {
    uint64_t files_scanned{};
    uint64_t scan_warnings{};
    uint64_t hash_failures{};
    uint64_t groups{};
    uint64_t duplicate_files{};
    uintmax_t wasted_bytes{};

    uint64_t files_deleted{};        // or that would be deleted, in dry-run
    uintmax_t bytes_reclaimed{};     // or reclaimable, in dry-run
    uint64_t files_missing{};
    uint64_t files_skipped{};        // size changed since detection
    uint64_t groups_skipped{};       // retained file gone
    uint64_t delete_errors{};

    std::filesystem::path report_path{};
    bool dry_run = false;
    bool interrupted = false;

    [[nodiscard]] uint64_t errors() const { return hash_failures + delete_errors; }

    void log() const;
};

}

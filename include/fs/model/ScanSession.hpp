#pragma once

#include "fs/model/FileRecord.hpp"

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace fm::fs::model {

struct ScanWarning {
    std::filesystem::path path;
    std::string reason;
};

// Everything one scan discovered under root. Records are sorted by relative path
// once the scan completes; during the scan they are appended in discovery order.
struct ScanSession {
    std::filesystem::path root;
    std::vector<FileRecord> records;
    std::vector<ScanWarning> warnings;
    std::unordered_set<std::string> excluded;  // absolute, lexically normal paths
    uint64_t directories_visited{};
    uint64_t symlinks_skipped{};
    bool interrupted = false;

    explicit ScanSession(std::filesystem::path r) : root(std::move(r)) {}

    [[nodiscard]] uintmax_t totalBytes() const;

    // Lookup by relative path; the session must be finalized (sorted)
    [[nodiscard]] const FileRecord* find(const std::string& rel) const;
};

}

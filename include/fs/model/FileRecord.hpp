#pragma once

#include "crypto/Digest.hpp"
#include "util/timestamp.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fm::fs::model {

struct FileRecord {
    std::filesystem::path absolute_path{};
    std::string relative_path{};  // identity within a scan root, '/'-separated UTF-8
    uintmax_t size_bytes{};
    util::EpochNanos modified_time{};
    std::optional<crypto::Digest256> digest{};

    FileRecord() = default;
    FileRecord(std::filesystem::path abs, std::string rel, uintmax_t size, util::EpochNanos mtime)
        : absolute_path(std::move(abs)), relative_path(std::move(rel)), size_bytes(size), modified_time(mtime) {}

    // Reads size and mtime of absPath; throws the error:: taxonomy on failure
    static FileRecord fromPath(const std::filesystem::path& root, const std::filesystem::path& absPath);

    [[nodiscard]] bool sameMetadata(const FileRecord& other, util::EpochNanos tolerance = 0) const;
};

}

#pragma once

#include "crypto/Digest.hpp"
#include "util/timestamp.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace fm::fs::model {
struct FileRecord;
}

namespace fm::cache {

// Last verified state of one source file. The relative path is the key of the
// persisted mapping, so it is not repeated inside the JSON object.
struct CacheEntry {
    std::string relative_path{};
    uintmax_t size_bytes{};
    util::EpochNanos modified_time{};
    crypto::Digest256 digest{};
    util::EpochNanos last_verified_time{};

    CacheEntry() = default;

    // Entry describing rec as verified now; rec must carry a digest
    static CacheEntry fromRecord(const fs::model::FileRecord& rec);

    // Evidence is valid only while size and mtime match exactly
    [[nodiscard]] bool isFreshFor(const fs::model::FileRecord& rec) const;
};

void to_json(nlohmann::json& j, const CacheEntry& e);

// Throws nlohmann::json::exception on missing or mistyped fields and
// error::CorruptCacheError on a malformed digest
void from_json(const nlohmann::json& j, CacheEntry& e);

}

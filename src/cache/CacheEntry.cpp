#include "cache/CacheEntry.hpp"
#include "fs/model/FileRecord.hpp"
#include "error/Error.hpp"

#include <nlohmann/json.hpp>

namespace fm::cache {

CacheEntry CacheEntry::fromRecord(const fs::model::FileRecord& rec) {
    if (!rec.digest) throw error::Error("Cannot cache a file without a digest", rec.absolute_path);

    CacheEntry e;
    e.relative_path = rec.relative_path;
    e.size_bytes = rec.size_bytes;
    e.modified_time = rec.modified_time;
    e.digest = *rec.digest;
    e.last_verified_time = util::nowEpochNanos();
    return e;
}

bool CacheEntry::isFreshFor(const fs::model::FileRecord& rec) const {
    return size_bytes == rec.size_bytes && modified_time == rec.modified_time;
}

void to_json(nlohmann::json& j, const CacheEntry& e) {
    j = {
        {"size_bytes", e.size_bytes},
        {"modified_time", e.modified_time},
        {"digest", e.digest.hex()},
        {"last_verified_time", e.last_verified_time}
    };
}

void from_json(const nlohmann::json& j, CacheEntry& e) {
    e.size_bytes = j.at("size_bytes").get<uintmax_t>();
    e.modified_time = j.at("modified_time").get<util::EpochNanos>();
    e.last_verified_time = j.value("last_verified_time", util::EpochNanos{0});

    const auto hex = j.at("digest").get<std::string>();
    const auto digest = crypto::Digest256::fromHex(hex);
    if (!digest) throw error::CorruptCacheError("Malformed digest '" + hex + "'");
    e.digest = *digest;
}

}

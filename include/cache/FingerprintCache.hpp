#pragma once

#include "cache/CacheEntry.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace fm::cache {

// Persisted relative_path -> CacheEntry mapping for one sync pair. All access is
// serialized; the document on disk is only ever replaced whole (temp file + rename).
class FingerprintCache {
public:
    static constexpr int FORMAT_VERSION = 1;

    explicit FingerprintCache(std::filesystem::path path);

    // Never throws for content problems: an absent file is an empty cache, an unparsable
    // one is logged and treated as empty, malformed entries are dropped one by one.
    void load();

    [[nodiscard]] std::optional<CacheEntry> lookup(const std::string& rel) const;

    // Throws error::IOError without touching the cache when the key is not valid UTF-8,
    // since the JSON document could not hold it.
    void upsert(CacheEntry entry);

    // Rewrites the whole document. Throws error::IOError / error::PermissionError.
    void flush();

    // upsert + flush under a single lock
    void commit(CacheEntry entry);

    static bool isFresh(const CacheEntry& entry, const fs::model::FileRecord& rec) { return entry.isFreshFor(rec); }

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::map<std::string, CacheEntry> entries() const;
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // Number of entries dropped while loading
    [[nodiscard]] size_t droppedOnLoad() const { return dropped_; }

private:
    void requireSerializableKey(const std::string& rel) const;
    void flushLocked();

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::map<std::string, CacheEntry> entries_;
    size_t dropped_{0};
};

}

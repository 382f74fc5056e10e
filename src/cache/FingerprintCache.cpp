#include "cache/FingerprintCache.hpp"
#include "error/Error.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace fm::cache;
using namespace fm::logging;
using json = nlohmann::json;

namespace {

json parseDocument(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw fm::error::IOError("Failed to open cache file", path);

    std::stringstream buf;
    buf << in.rdbuf();

    try {
        auto doc = json::parse(buf.str());
        if (!doc.is_object()) throw fm::error::CorruptCacheError("Cache document is not an object", path);
        return doc;
    } catch (const json::parse_error& e) {
        throw fm::error::CorruptCacheError(std::string("Unparsable cache document: ") + e.what(), path);
    }
}

}

FingerprintCache::FingerprintCache(std::filesystem::path path) : path_(std::move(path)) {}

void FingerprintCache::load() {
    std::scoped_lock lock(mutex_);
    entries_.clear();
    dropped_ = 0;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        LogRegistry::cache()->info("[FingerprintCache] No cache at {}, starting empty", path_.string());
        return;
    }

    json doc;
    try {
        doc = parseDocument(path_);

        const json* mapping = &doc;
        if (doc.contains("entries")) {
            const auto version = doc.value("version", FORMAT_VERSION);
            if (version != FORMAT_VERSION)
                throw error::CorruptCacheError("Unsupported cache version " + std::to_string(version), path_);
            mapping = &doc.at("entries");
            if (!mapping->is_object()) throw error::CorruptCacheError("Cache entries are not an object", path_);
        } else {
            LogRegistry::cache()->info("[FingerprintCache] Reading legacy cache layout from {}", path_.string());
        }

        for (const auto& [rel, value] : mapping->items()) {
            try {
                auto entry = value.get<CacheEntry>();
                entry.relative_path = rel;
                entries_.emplace(rel, std::move(entry));
            } catch (const json::exception& e) {
                ++dropped_;
                LogRegistry::cache()->warn("[FingerprintCache] Dropping malformed entry '{}': {}", rel, e.what());
            } catch (const error::CorruptCacheError& e) {
                ++dropped_;
                LogRegistry::cache()->warn("[FingerprintCache] Dropping malformed entry '{}': {}", rel, e.what());
            }
        }
    } catch (const error::CorruptCacheError& e) {
        LogRegistry::cache()->warn("[FingerprintCache] {} ({}), starting with an empty cache", e.what(), path_.string());
        entries_.clear();
        return;
    } catch (const error::IOError& e) {
        LogRegistry::cache()->warn("[FingerprintCache] {} ({}), starting with an empty cache", e.what(), path_.string());
        entries_.clear();
        return;
    } catch (const json::exception& e) {
        LogRegistry::cache()->warn("[FingerprintCache] Malformed cache header in {}: {}, starting with an empty cache",
                                   path_.string(), e.what());
        entries_.clear();
        return;
    }

    LogRegistry::cache()->info("[FingerprintCache] Loaded {} entries from {}{}", entries_.size(), path_.string(),
                               dropped_ ? " (" + std::to_string(dropped_) + " dropped)" : "");
}

std::optional<CacheEntry> FingerprintCache::lookup(const std::string& rel) const {
    std::scoped_lock lock(mutex_);
    if (const auto it = entries_.find(rel); it != entries_.end()) return it->second;
    return std::nullopt;
}

void FingerprintCache::upsert(CacheEntry entry) {
    requireSerializableKey(entry.relative_path);
    std::scoped_lock lock(mutex_);
    auto key = entry.relative_path;
    entries_.insert_or_assign(std::move(key), std::move(entry));
}

void FingerprintCache::flush() {
    std::scoped_lock lock(mutex_);
    flushLocked();
}

void FingerprintCache::commit(CacheEntry entry) {
    requireSerializableKey(entry.relative_path);
    std::scoped_lock lock(mutex_);
    auto key = entry.relative_path;
    entries_.insert_or_assign(std::move(key), std::move(entry));
    flushLocked();
}

size_t FingerprintCache::size() const {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

std::map<std::string, CacheEntry> FingerprintCache::entries() const {
    std::scoped_lock lock(mutex_);
    return entries_;
}

void FingerprintCache::requireSerializableKey(const std::string& rel) const {
    if (!util::isValidUtf8(rel))
        throw error::IOError("Cannot cache a path that is not valid UTF-8: " + rel, path_);
}

void FingerprintCache::flushLocked() {
    std::string text;
    try {
        json mapping = json::object();
        for (const auto& [rel, entry] : entries_) mapping[rel] = entry;

        const json doc = {
            {"version", FORMAT_VERSION},
            {"stale_entries", "retained"},
            {"entries", std::move(mapping)}
        };
        text = doc.dump(2);
    } catch (const json::exception& e) {
        throw error::IOError(std::string("Failed to serialize cache: ") + e.what(), path_);
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) error::throwFromErrorCode(ec, "Failed to create cache directory", path_.parent_path());
    }

    const auto tmp = util::tempSiblingFor(path_);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) error::throwFromErrorCode(std::error_code(errno, std::generic_category()),
                                            "Failed to open cache temp file", tmp);
        out << text;
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tmp, ec);
            throw error::IOError("Failed to write cache temp file", tmp);
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        std::error_code rmEc;
        std::filesystem::remove(tmp, rmEc);
        error::throwFromErrorCode(ec, "Failed to replace cache file", path_);
    }

    LogRegistry::cache()->debug("[FingerprintCache] Flushed {} entries to {}", entries_.size(), path_.string());
}

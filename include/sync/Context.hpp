#pragma once

#include "cache/CacheEntry.hpp"
#include "fs/model/ScanSession.hpp"
#include "sync/model/Summary.hpp"

#include <filesystem>
#include <future>
#include <limits>
#include <memory>
#include <optional>
#include <vector>

namespace fm::cache {
class FingerprintCache;
}

namespace fm::concurrency {
struct Task;
class ThreadPoolManager;
}

namespace fm::sync {

struct Options {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::optional<std::filesystem::path> cache_path{};
    bool deep = false;
    bool dry_run = false;
    // Copies dispatched before the run stops; the rest of the plan is left for a later run
    size_t max_copies = std::numeric_limits<size_t>::max();
};

// State of one sync run, shared by the planner and the executor
struct Context {
    Options options;
    fs::model::ScanSession source;
    fs::model::ScanSession destination;
    std::shared_ptr<cache::FingerprintCache> cache;
    concurrency::ThreadPoolManager& pools;

    size_t chunkSize;
    util::EpochNanos mtimeTolerance{};  // shallow comparison slack, in nanoseconds

    // Verified digests of skipped files, written back in one batch after planning
    std::vector<cache::CacheEntry> pendingUpserts;

    std::vector<std::future<bool>> futures;
    model::Summary summary;

    Context(Options opts, fs::model::ScanSession src, fs::model::ScanSession dst,
            std::shared_ptr<cache::FingerprintCache> cache, concurrency::ThreadPoolManager& pools,
            size_t chunkSize, util::EpochNanos mtimeTolerance);

    [[nodiscard]] bool isInterrupted() const;

    // Submits task to the I/O pool and tracks its future
    void push(const std::shared_ptr<concurrency::Task>& task);

    // Barrier over everything pushed so far; returns how many tasks reported failure
    size_t processFutures();

    // Writes pendingUpserts to the cache with a single flush
    void flushPendingUpserts();
};

}

#include "sync/Context.hpp"
#include "cache/FingerprintCache.hpp"
#include "concurrency/ThreadPoolManager.hpp"
#include "error/Error.hpp"
#include "logging/LogRegistry.hpp"

using namespace fm::sync;
using namespace fm::logging;

Context::Context(Options opts, fs::model::ScanSession src, fs::model::ScanSession dst,
                 std::shared_ptr<cache::FingerprintCache> cache, concurrency::ThreadPoolManager& pools,
                 const size_t chunkSize, const util::EpochNanos mtimeTolerance)
    : options(std::move(opts)),
      source(std::move(src)),
      destination(std::move(dst)),
      cache(std::move(cache)),
      pools(pools),
      chunkSize(chunkSize),
      mtimeTolerance(mtimeTolerance) {
    summary.dry_run = options.dry_run;
    if (this->cache) summary.cache_path = this->cache->path();
}

bool Context::isInterrupted() const { return pools.isInterrupted(); }

void Context::push(const std::shared_ptr<concurrency::Task>& task) {
    futures.push_back(task->getFuture().value());
    pools.ioPool().submit(task);
}

size_t Context::processFutures() {
    pools.ioPool().wait();
    size_t failed = 0;
    for (auto& f : futures)
        if (!f.get()) ++failed;
    futures.clear();
    return failed;
}

void Context::flushPendingUpserts() {
    if (pendingUpserts.empty() || !cache) return;

    size_t recorded = 0;
    for (auto& e : pendingUpserts) {
        try {
            cache->upsert(std::move(e));
            ++recorded;
        } catch (const error::Error& ex) {
            ++summary.cache_errors;
            LogRegistry::cache()->warn("[Sync] Skipping cache entry: {}", ex.what());
        }
    }
    pendingUpserts.clear();

    try {
        cache->flush();
        LogRegistry::cache()->debug("[Sync] Recorded {} verified files in the cache", recorded);
    } catch (const error::Error& e) {
        ++summary.cache_errors;
        LogRegistry::cache()->error("[Sync] Failed to write cache: {}", e.what());
    }
}

#include "sync/Planner.hpp"
#include "sync/Context.hpp"
#include "cache/FingerprintCache.hpp"
#include "concurrency/ThreadPoolManager.hpp"
#include "fs/Fingerprinter.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <fstream>

using namespace fm::sync;
using namespace fm::sync::model;
using namespace fm::fs::model;
using namespace fm::logging;

namespace {

bool readable(const std::filesystem::path& p) {
    const std::ifstream in(p, std::ios::binary);
    return static_cast<bool>(in);
}

}

std::vector<Action> Planner::build(Context& ctx) {
    auto plan = ctx.options.deep ? buildDeep(ctx) : buildShallow(ctx);

    uint64_t copies = 0;
    uintmax_t bytes = 0;
    for (const auto& a : plan) {
        if (a.type != ActionType::Copy) continue;
        ++copies;
        bytes += a.source.size_bytes;
    }

    LogRegistry::sync()->info("[Planner] {} scan: {} to copy ({}), {} unchanged, {} errors",
                              ctx.options.deep ? "Deep" : "Shallow", copies, util::bytesToSize(bytes),
                              plan.size() - copies, ctx.summary.plan_errors);
    return plan;
}

std::vector<Action> Planner::buildShallow(Context& ctx) {
    std::vector<Action> plan;
    plan.reserve(ctx.source.records.size());

    for (const auto& src : ctx.source.records) {
        const auto* dst = ctx.destination.find(src.relative_path);

        if (!dst) {
            plan.push_back({ ActionType::Copy, Reason::Missing, src, std::nullopt });
            continue;
        }

        if (src.sameMetadata(*dst, ctx.mtimeTolerance))
            plan.push_back({ ActionType::Skip, Reason::Unchanged, src, *dst });
        else
            plan.push_back({ ActionType::Copy, Reason::MetadataChanged, src, *dst });
    }

    return plan;
}

std::vector<Action> Planner::buildDeep(Context& ctx) {
    // Pair up both sides, take fresh source digests from the cache, hash everything else
    // in one batch.
    struct Pair {
        FileRecord src;
        std::optional<FileRecord> dst;
        bool fromCache = false;
    };

    std::vector<Pair> pairs;
    pairs.reserve(ctx.source.records.size());
    std::vector<FileRecord*> toHash;

    for (const auto& src : ctx.source.records) {
        Pair p{ src, std::nullopt };
        if (const auto* dst = ctx.destination.find(src.relative_path)) p.dst = *dst;
        pairs.push_back(std::move(p));
    }

    for (auto& p : pairs) {
        if (!p.dst) continue;

        if (ctx.cache) {
            if (const auto entry = ctx.cache->lookup(p.src.relative_path);
                entry && cache::FingerprintCache::isFresh(*entry, p.src)) {
                p.src.digest = entry->digest;
                p.fromCache = true;
                ++ctx.summary.cache_hits;
            }
        }

        if (!p.fromCache) toHash.push_back(&p.src);
        toHash.push_back(&*p.dst);
    }

    if (!toHash.empty()) {
        const fs::Fingerprinter fp(ctx.pools.hashPool(), ctx.chunkSize, ctx.pools.interruptFlag());
        const auto outcome = fp.fingerprint(toHash);
        ctx.summary.hashed_files += outcome.hashed;
        if (outcome.interrupted) {
            LogRegistry::sync()->warn("[Planner] Hashing was interrupted, plan abandoned");
            return {};
        }
    }

    std::vector<Action> plan;
    plan.reserve(pairs.size());

    for (auto& p : pairs) {
        if (!p.dst) {
            plan.push_back({ ActionType::Copy, Reason::Missing, p.src, std::nullopt });
            continue;
        }

        if (!p.src.digest) {
            if (readable(p.src.absolute_path)) {
                LogRegistry::sync()->warn("[Planner] Could not verify {}, copying it", p.src.relative_path);
                plan.push_back({ ActionType::Copy, Reason::Unverifiable, p.src, p.dst });
            } else {
                ++ctx.summary.plan_errors;
                LogRegistry::sync()->error("[Planner] Source {} is unreadable, not syncing it", p.src.relative_path);
            }
            continue;
        }

        if (!p.dst->digest) {
            LogRegistry::sync()->warn("[Planner] Could not hash destination of {}, copying it", p.src.relative_path);
            plan.push_back({ ActionType::Copy, Reason::Unverifiable, p.src, p.dst });
            continue;
        }

        if (*p.src.digest == *p.dst->digest) {
            ctx.pendingUpserts.push_back(cache::CacheEntry::fromRecord(p.src));
            plan.push_back({ ActionType::Skip, Reason::Unchanged, p.src, p.dst });
        } else {
            plan.push_back({ ActionType::Copy, Reason::ContentChanged, p.src, p.dst });
        }
    }

    return plan;
}

#include "sync/Executor.hpp"
#include "sync/Context.hpp"
#include "sync/model/Action.hpp"
#include "sync/tasks/Copy.hpp"
#include "concurrency/ThreadPoolManager.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <memory>

using namespace fm::sync;
using namespace fm::sync::model;
using namespace fm::logging;

void Executor::run(Context& ctx, const std::vector<Action>& plan) {
    if (ctx.options.dry_run) {
        dryRun(ctx, plan);
        return;
    }

    std::vector<std::shared_ptr<tasks::Copy>> copies;
    size_t deferred = 0;
    const auto destRoot = ctx.destination.root;

    for (const auto& a : plan) {
        if (a.type == ActionType::Skip) {
            ++ctx.summary.files_skipped;
            LogRegistry::sync()->debug("[Executor] Skip ({}): {}", to_string(a.reason), a.source.relative_path);
            continue;
        }

        if (copies.size() >= ctx.options.max_copies) {
            ++deferred;
            continue;
        }

        LogRegistry::sync()->debug("[Executor] Copy ({}): {}", to_string(a.reason), a.source.relative_path);
        auto task = std::make_shared<tasks::Copy>(a.source, destRoot / std::filesystem::path(a.source.relative_path),
                                                  ctx.cache, ctx.chunkSize, ctx.pools.interruptFlag());
        copies.push_back(task);
        ctx.push(task);
    }

    if (deferred) LogRegistry::sync()->info("[Executor] Copy limit reached, {} copies left for a later run", deferred);

    if (const auto failed = ctx.processFutures(); failed)
        LogRegistry::sync()->warn("[Executor] {} of {} copies did not complete", failed, copies.size());

    for (const auto& c : copies) {
        if (c->cacheFailed) ++ctx.summary.cache_errors;

        switch (c->outcome) {
        case tasks::Copy::Outcome::Copied:
            ++ctx.summary.files_copied;
            ctx.summary.bytes_copied += c->bytes;
            break;
        case tasks::Copy::Outcome::Failed: ++ctx.summary.copy_errors; break;
        case tasks::Copy::Outcome::Interrupted:
        case tasks::Copy::Outcome::Pending:
        case tasks::Copy::Outcome::Cancelled: ++ctx.summary.cancelled; break;
        }
    }
}

void Executor::dryRun(Context& ctx, const std::vector<Action>& plan) {
    for (const auto& a : plan) {
        if (a.type == ActionType::Skip) {
            ++ctx.summary.files_skipped;
            continue;
        }

        LogRegistry::sync()->info("[Dry Run] Would copy ({}): {} ({})", to_string(a.reason),
                                  a.source.relative_path, util::bytesToSize(a.source.size_bytes));
        ++ctx.summary.files_copied;
        ctx.summary.bytes_copied += a.source.size_bytes;
    }
}

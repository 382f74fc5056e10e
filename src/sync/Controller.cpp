#include "sync/Controller.hpp"
#include "sync/Executor.hpp"
#include "sync/Planner.hpp"
#include "cache/FingerprintCache.hpp"
#include "concurrency/ThreadPoolManager.hpp"
#include "config/Config.hpp"
#include "crypto/util/hash.hpp"
#include "error/Error.hpp"
#include "fs/Scanner.hpp"
#include "logging/LogRegistry.hpp"

#include <unistd.h>

using namespace fm::sync;
using namespace fm::sync::model;
using namespace fm::logging;

namespace stdfs = std::filesystem;

namespace {

stdfs::path normalized(const stdfs::path& p) {
    std::error_code ec;
    auto abs = stdfs::weakly_canonical(p, ec);
    if (ec) abs = stdfs::absolute(p, ec);
    return abs.lexically_normal();
}

bool isWithin(const stdfs::path& inner, const stdfs::path& outer) {
    const auto rel = inner.lexically_relative(outer);
    return !rel.empty() && *rel.begin() != "..";
}

}

void Controller::validate(const Options& opts) {
    std::error_code ec;
    if (!stdfs::is_directory(opts.source, ec))
        throw error::ConfigError("Source directory not found: " + opts.source.string(), opts.source);

    if (stdfs::exists(opts.destination, ec) && !stdfs::is_directory(opts.destination, ec))
        throw error::ConfigError("Destination exists and is not a directory: " + opts.destination.string(),
                                 opts.destination);

    const auto src = normalized(opts.source), dst = normalized(opts.destination);
    if (src == dst) throw error::ConfigError("Source and destination are the same directory", dst);
    if (isWithin(dst, src))
        throw error::ConfigError("Destination " + dst.string() + " lies inside source " + src.string(), dst);
}

void Controller::prepareDestination(const Options& opts) {
    std::error_code ec;
    if (!stdfs::exists(opts.destination, ec)) {
        if (opts.dry_run) {
            LogRegistry::sync()->info("[Dry Run] Would create destination directory {}", opts.destination.string());
            return;
        }
        stdfs::create_directories(opts.destination, ec);
        if (ec) throw error::ConfigError("Cannot create destination " + opts.destination.string() + ": " + ec.message(),
                                         opts.destination);
        LogRegistry::sync()->info("[Sync] Created destination directory {}", opts.destination.string());
    }

    if (!opts.dry_run && ::access(opts.destination.c_str(), W_OK) != 0)
        throw error::ConfigError("Destination is not writable: " + opts.destination.string(), opts.destination);
}

stdfs::path Controller::defaultCachePath(const stdfs::path& cacheDir, const stdfs::path& source,
                                         const stdfs::path& destination) {
    const auto key = normalized(source).string() + '\0' + normalized(destination).string();
    crypto::hash::Blake2b state;
    state.update(key.data(), key.size());
    return cacheDir / ("sync_" + state.finish().hex().substr(0, 16) + ".json");
}

Summary Controller::run(const Options& opts, concurrency::ThreadPoolManager& pools, const config::Config& cnf) {
    validate(opts);
    prepareDestination(opts);

    const auto cachePath = opts.cache_path ? *opts.cache_path
                                           : defaultCachePath(cnf.sync.cache_dir, opts.source, opts.destination);

    LogRegistry::sync()->info("[Sync] Syncing {} -> {} ({} scan{})", opts.source.string(), opts.destination.string(),
                              opts.deep ? "deep" : "shallow", opts.dry_run ? ", dry run" : "");

    auto cache = std::make_shared<cache::FingerprintCache>(cachePath);
    cache->load();

    const std::vector<stdfs::path> exclude{ cachePath };

    auto source = fs::Scanner::scan(opts.source, pools.scanPool(), exclude);
    auto destination = stdfs::exists(opts.destination)
        ? fs::Scanner::scan(opts.destination, pools.scanPool(), exclude)
        : fs::model::ScanSession(stdfs::absolute(opts.destination).lexically_normal());

    const auto tolerance = static_cast<util::EpochNanos>(cnf.sync.mtime_tolerance_ms) * 1'000'000;
    Context ctx(opts, std::move(source), std::move(destination), cache, pools,
                static_cast<size_t>(cnf.hashing.chunk_size_bytes), tolerance);

    ctx.summary.source_files = ctx.source.records.size();
    ctx.summary.destination_files = ctx.destination.records.size();
    ctx.summary.scan_warnings = ctx.source.warnings.size() + ctx.destination.warnings.size();

    if (ctx.source.interrupted || ctx.destination.interrupted || ctx.isInterrupted()) {
        ctx.summary.interrupted = true;
        ctx.summary.log();
        return ctx.summary;
    }

    const auto plan = Planner::build(ctx);

    if (ctx.isInterrupted()) {
        ctx.summary.interrupted = true;
        ctx.summary.log();
        return ctx.summary;
    }

    if (!opts.dry_run) ctx.flushPendingUpserts();

    Executor::run(ctx, plan);

    ctx.summary.interrupted = ctx.isInterrupted();
    ctx.summary.log();
    return ctx.summary;
}

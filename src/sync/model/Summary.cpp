#include "sync/model/Summary.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

using namespace fm::sync::model;
using namespace fm::logging;

void Summary::log() const {
    const auto log = LogRegistry::sync();
    log->info("[Summary] Source files: {}, destination files: {} ({} scan warnings)",
              source_files, destination_files, scan_warnings);

    if (dry_run)
        log->info("[Summary] [Dry Run] Would copy {} files ({}), {} unchanged", files_copied,
                  util::bytesToSize(bytes_copied), files_skipped);
    else
        log->info("[Summary] Copied {} files ({}), skipped {} unchanged", files_copied,
                  util::bytesToSize(bytes_copied), files_skipped);

    if (hashed_files || cache_hits)
        log->info("[Summary] Hashed {} files, {} digests reused from the cache", hashed_files, cache_hits);

    if (errors())
        log->warn("[Summary] Errors: {} ({} planning, {} copy, {} cache)", errors(), plan_errors, copy_errors, cache_errors);
    if (cancelled) log->warn("[Summary] {} copies were cancelled", cancelled);
    if (!cache_path.empty()) log->info("[Summary] Cache: {}", cache_path.string());
    if (interrupted) log->warn("[Summary] Sync was interrupted; rerun to resume");
}

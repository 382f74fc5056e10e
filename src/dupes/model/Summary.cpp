#include "dupes/model/Summary.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

using namespace fm::dupes::model;
using namespace fm::logging;

void Summary::log() const {
    const auto log = LogRegistry::dupes();
    log->info("[Summary] Files scanned: {} ({} warnings)", files_scanned, scan_warnings);
    log->info("[Summary] Duplicate groups: {}, duplicate files: {}, wasted space: {}",
              groups, duplicate_files, util::bytesToSize(wasted_bytes));

    if (dry_run)
        log->info("[Summary] [Dry Run] Would delete {} files, would free {}", files_deleted, util::bytesToSize(bytes_reclaimed));
    else
        log->info("[Summary] Deleted {} files, freed {}", files_deleted, util::bytesToSize(bytes_reclaimed));

    if (files_missing || files_skipped || groups_skipped)
        log->warn("[Summary] Skipped: {} missing files, {} changed files, {} groups without their retained file",
                  files_missing, files_skipped, groups_skipped);

    if (errors()) log->warn("[Summary] Errors: {} ({} hash, {} delete)", errors(), hash_failures, delete_errors);
    if (!report_path.empty()) log->info("[Summary] Report: {}", report_path.string());
    if (interrupted) log->warn("[Summary] Operation was interrupted; results are partial");
}

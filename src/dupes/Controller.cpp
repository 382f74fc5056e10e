#include "dupes/Controller.hpp"
#include "dupes/Detector.hpp"
#include "dupes/Remover.hpp"
#include "dupes/Report.hpp"
#include "fs/Scanner.hpp"
#include "concurrency/ThreadPoolManager.hpp"
#include "config/Config.hpp"
#include "error/Error.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

using namespace fm::dupes;
using namespace fm::dupes::model;
using namespace fm::logging;

Summary Controller::run(const Options& opts, concurrency::ThreadPoolManager& pools, const config::Config& cnf) {
    if (!opts.path && !opts.input_json)
        throw error::ConfigError("Either --path or --input-json must be provided");

    if (opts.path && opts.input_json)
        LogRegistry::dupes()->warn("[Duplicates] Both --path and --input-json given, using {}", opts.input_json->string());

    if (!opts.input_json) {
        std::error_code ec;
        if (!std::filesystem::is_directory(*opts.path, ec))
            throw error::ConfigError("Directory not found: " + opts.path->string(), *opts.path);
    }

    Summary summary;
    summary.dry_run = opts.dry_run;

    std::vector<DuplicateGroup> groups;

    if (opts.input_json) {
        auto loaded = Report::load(*opts.input_json);
        groups = std::move(loaded.groups);
        summary.files_missing = loaded.files_missing;
        summary.files_skipped = loaded.files_skipped;
        summary.groups_skipped = loaded.groups_skipped;
        for (const auto& g : groups) summary.files_scanned += g.members.size();
    } else {
        LogRegistry::dupes()->info("[Duplicates] Starting duplicate scan in: {}", opts.path->string());

        auto session = fs::Scanner::scan(*opts.path, pools.scanPool());
        summary.files_scanned = session.records.size();
        summary.scan_warnings = session.warnings.size();

        if (session.interrupted) {
            summary.interrupted = true;
            summary.log();
            return summary;
        }

        const DetectorOptions dopts{
            .chunk_size = static_cast<size_t>(cnf.hashing.chunk_size_bytes),
            .min_size_bytes = cnf.duplicates.min_size_bytes,
            .interrupt = pools.interruptFlag()
        };

        auto detection = Detector::detect(session, pools.hashPool(), dopts);
        summary.hash_failures = detection.hashing.failures.size();
        if (detection.interrupted) {
            summary.interrupted = true;
            summary.log();
            return summary;
        }
        groups = std::move(detection.groups);
    }

    summary.groups = groups.size();
    summary.duplicate_files = duplicateFileCount(groups);
    summary.wasted_bytes = totalWastedBytes(groups);

    LogRegistry::dupes()->info("[Duplicates] Total separate duplicate files: {}", summary.duplicate_files);
    LogRegistry::dupes()->info("[Duplicates] Total potential wasted space: {}", util::bytesToSize(summary.wasted_bytes));

    const auto stamp = opts.stamp.empty() ? util::getCurrentTimestamp() : opts.stamp;
    summary.report_path = opts.output_json ? *opts.output_json : Report::defaultPath(cnf.duplicates.report_dir, stamp);
    Report::write(summary.report_path, groups);

    if (opts.remove) {
        const auto removal = Remover::run(groups, pools.ioPool(), opts.dry_run);
        summary.files_deleted = removal.files_deleted;
        summary.bytes_reclaimed = removal.bytes_reclaimed;
        summary.files_missing += removal.files_missing;
        summary.files_skipped += removal.files_changed;
        summary.groups_skipped += removal.groups_skipped;
        summary.delete_errors = removal.errors;
    } else if (opts.dry_run) {
        LogRegistry::dupes()->info("[Duplicates] --dry-run has no effect without --delete");
    }

    summary.interrupted = pools.isInterrupted();
    summary.log();
    return summary;
}

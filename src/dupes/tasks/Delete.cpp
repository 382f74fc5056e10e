#include "dupes/tasks/Delete.hpp"
#include "logging/LogRegistry.hpp"

#include <filesystem>

using namespace fm::dupes::tasks;
using namespace fm::logging;

namespace stdfs = std::filesystem;

Delete::Delete(fs::model::FileRecord tgt, const bool dryRun)
    : target(std::move(tgt)), dryRun(dryRun) {}

void Delete::operator()() {
    const auto& path = target.absolute_path;

    std::error_code ec;
    const auto st = stdfs::symlink_status(path, ec);
    if (ec || !stdfs::exists(st)) {
        outcome = Outcome::Missing;
        LogRegistry::dupes()->warn("[DeleteTask] File not found (already deleted?): {}", path.string());
        resolve(false);
        return;
    }

    const auto size = stdfs::is_regular_file(st) ? stdfs::file_size(path, ec) : 0;
    if (!stdfs::is_regular_file(st) || ec || size != target.size_bytes) {
        outcome = Outcome::Changed;
        LogRegistry::dupes()->warn("[DeleteTask] {} changed since it was grouped, leaving it in place", path.string());
        resolve(false);
        return;
    }

    if (dryRun) {
        outcome = Outcome::WouldDelete;
        LogRegistry::dupes()->info("[Dry Run] Would delete: {}", path.string());
        resolve(true);
        return;
    }

    if (!stdfs::remove(path, ec) || ec) {
        if (!ec) {
            outcome = Outcome::Missing;
            LogRegistry::dupes()->warn("[DeleteTask] File vanished before removal: {}", path.string());
        } else {
            outcome = Outcome::Failed;
            error = ec.message();
            LogRegistry::dupes()->error("[DeleteTask] Failed to delete {}: {}", path.string(), error);
        }
        resolve(false);
        return;
    }

    outcome = Outcome::Deleted;
    LogRegistry::dupes()->info("[DeleteTask] Deleted duplicate: {}", path.string());
    resolve(true);
}

void Delete::cancel() {
    if (outcome == Outcome::Pending) outcome = Outcome::Cancelled;
    PromisedTask::cancel();
}

#include "dupes/Remover.hpp"
#include "dupes/tasks/Delete.hpp"
#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <filesystem>
#include <future>
#include <memory>

using namespace fm::dupes;
using namespace fm::dupes::model;
using namespace fm::dupes::tasks;
using namespace fm::logging;

namespace {

bool retainedIntact(const DuplicateGroup& g) {
    std::error_code ec;
    const auto& p = g.retained().absolute_path;
    const auto st = std::filesystem::symlink_status(p, ec);
    if (ec || !std::filesystem::is_regular_file(st)) return false;
    const auto size = std::filesystem::file_size(p, ec);
    return !ec && size == g.size_bytes;
}

}

Removal Remover::run(const std::vector<DuplicateGroup>& groups, concurrency::ThreadPool& ioPool, const bool dryRun) {
    Removal out;

    if (dryRun) LogRegistry::dupes()->info("[Remover] DRY RUN: No files will be deleted.");
    else LogRegistry::dupes()->info("[Remover] Starting deletion of duplicates...");

    std::vector<std::shared_ptr<Delete>> tasks;
    std::vector<std::future<bool>> futures;

    for (const auto& g : groups) {
        if (g.members.size() < 2) continue;

        if (!retainedIntact(g)) {
            LogRegistry::dupes()->warn("[Remover] Retained file {} is missing or changed, skipping group {}",
                                       g.retained().absolute_path.string(), g.digest.hex());
            ++out.groups_skipped;
            continue;
        }

        for (size_t i = 1; i < g.members.size(); ++i) {
            auto task = std::make_shared<Delete>(g.members[i], dryRun);
            futures.push_back(task->getFuture().value());
            tasks.push_back(task);
            ioPool.submit(task);
        }
    }

    ioPool.wait();
    for (auto& f : futures) f.get();

    for (const auto& t : tasks) {
        switch (t->outcome) {
        case Delete::Outcome::Deleted:
        case Delete::Outcome::WouldDelete:
            ++out.files_deleted;
            out.bytes_reclaimed += t->target.size_bytes;
            break;
        case Delete::Outcome::Missing: ++out.files_missing; break;
        case Delete::Outcome::Changed: ++out.files_changed; break;
        case Delete::Outcome::Failed: ++out.errors; break;
        case Delete::Outcome::Pending:
        case Delete::Outcome::Cancelled: ++out.cancelled; break;
        }
    }

    if (dryRun)
        LogRegistry::dupes()->info("[Remover] [Dry Run] Would delete {} files. Would free {}.",
                                   out.files_deleted, util::bytesToSize(out.bytes_reclaimed));
    else
        LogRegistry::dupes()->info("[Remover] Deletion complete. Deleted {} files. Freed {}.",
                                   out.files_deleted, util::bytesToSize(out.bytes_reclaimed));

    if (out.cancelled) LogRegistry::dupes()->warn("[Remover] {} deletions were cancelled", out.cancelled);
    return out;
}

#include "fs/Scanner.hpp"
#include "fs/tasks/ScanDir.hpp"
#include "concurrency/ThreadPool.hpp"
#include "error/Error.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <chrono>

using namespace fm::fs;
using namespace fm::fs::model;
using namespace fm::fs::tasks;
using namespace fm::logging;
using namespace std::chrono;

ScanSession Scanner::scan(const std::filesystem::path& root,
                          concurrency::ThreadPool& pool,
                          const std::vector<std::filesystem::path>& exclude) {
    std::error_code ec;
    const auto absRoot = std::filesystem::absolute(root, ec).lexically_normal();
    if (ec) error::throwFromErrorCode(ec, "Failed to resolve scan root", root);
    if (!std::filesystem::is_directory(absRoot, ec))
        throw error::NotFoundError("Scan root is not a directory: " + absRoot.string(), absRoot);

    LogRegistry::scan()->info("[Scanner] Scanning {} with {} workers", absRoot.string(), pool.workerCount());
    const auto start = steady_clock::now();

    auto state = std::make_shared<ScanState>(absRoot, pool);
    for (const auto& p : exclude) {
        std::error_code xec;
        state->session.excluded.insert(std::filesystem::absolute(p, xec).lexically_normal().string());
    }

    if (!pool.submit(std::make_shared<ScanDir>(state, absRoot))) state->incomplete.store(true);
    pool.wait();

    ScanSession session = std::move(state->session);
    session.directories_visited = state->directories.load();
    session.symlinks_skipped = state->symlinks.load();
    session.interrupted = state->incomplete.load() || pool.isInterrupted();

    std::ranges::sort(session.records, {}, &FileRecord::relative_path);
    std::ranges::sort(session.warnings, {}, [](const ScanWarning& w) { return w.path.string(); });

    const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
    LogRegistry::scan()->info("[Scanner] {}: {} files ({}) in {} directories, {} warnings, {} symlinks skipped, {}ms{}",
                              absRoot.string(), session.records.size(), util::bytesToSize(session.totalBytes()),
                              session.directories_visited, session.warnings.size(), session.symlinks_skipped,
                              elapsed, session.interrupted ? " (interrupted)" : "");

    return session;
}

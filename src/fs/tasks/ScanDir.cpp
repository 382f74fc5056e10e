#include "fs/tasks/ScanDir.hpp"
#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <vector>

using namespace fm::fs::tasks;
using namespace fm::fs::model;
using namespace fm::logging;

namespace stdfs = std::filesystem;

void ScanDir::operator()() {
    state->directories.fetch_add(1);

    std::vector<FileRecord> found;
    std::vector<ScanWarning> warnings;
    std::vector<stdfs::path> subdirs;

    std::error_code ec;
    stdfs::directory_iterator it(dir, stdfs::directory_options::none, ec);
    if (ec) {
        LogRegistry::scan()->warn("[Scanner] Skipping unreadable directory {}: {}", dir.string(), ec.message());
        std::scoped_lock lock(state->mutex);
        state->session.warnings.push_back({dir, ec.message()});
        return;
    }

    for (const stdfs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            warnings.push_back({dir, "listing aborted: " + ec.message()});
            LogRegistry::scan()->warn("[Scanner] Listing of {} aborted: {}", dir.string(), ec.message());
            break;
        }

        const auto& entry = *it;
        const auto& path = entry.path();

        std::error_code sec;
        const auto st = entry.symlink_status(sec);
        if (sec) {
            warnings.push_back({path, sec.message()});
            LogRegistry::scan()->warn("[Scanner] Cannot stat {}: {}", path.string(), sec.message());
            continue;
        }

        // symbolic links are never followed, whatever they point to
        if (stdfs::is_symlink(st)) {
            state->symlinks.fetch_add(1);
            LogRegistry::scan()->debug("[Scanner] Not following symlink {}", path.string());
            continue;
        }

        if (stdfs::is_directory(st)) {
            subdirs.push_back(path);
            continue;
        }

        if (!stdfs::is_regular_file(st)) continue;

        if (util::isTempSibling(path) || state->session.excluded.contains(path.lexically_normal().string())) {
            LogRegistry::scan()->info("[Scanner] Excluding {}", path.string());
            continue;
        }

        const auto size = entry.file_size(sec);
        if (sec) {
            warnings.push_back({path, sec.message()});
            continue;
        }

        const auto mtime = entry.last_write_time(sec);
        if (sec) {
            warnings.push_back({path, sec.message()});
            continue;
        }

        found.emplace_back(path, util::relativeKey(state->session.root, path), size, util::toEpochNanos(mtime));
    }

    for (auto& sub : subdirs)
        state->pool.submit(std::make_shared<ScanDir>(state, std::move(sub)));

    std::scoped_lock lock(state->mutex);
    auto& s = state->session;
    s.records.insert(s.records.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    s.warnings.insert(s.warnings.end(), std::make_move_iterator(warnings.begin()), std::make_move_iterator(warnings.end()));
}

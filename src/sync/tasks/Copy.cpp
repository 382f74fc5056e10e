#include "sync/tasks/Copy.hpp"
#include "cache/FingerprintCache.hpp"
#include "crypto/util/hash.hpp"
#include "error/Error.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <vector>

using namespace fm::sync::tasks;
using namespace fm::logging;

namespace stdfs = std::filesystem;

Copy::Copy(fs::model::FileRecord src, stdfs::path tgt, std::shared_ptr<cache::FingerprintCache> cache,
           const size_t chunkSize, std::shared_ptr<std::atomic<bool>> interrupt)
    : source(std::move(src)),
      target(std::move(tgt)),
      cache(std::move(cache)),
      chunkSize(chunkSize),
      interrupt(std::move(interrupt)) {}

void Copy::operator()() {
    stdfs::path tmp;
    try {
        std::error_code ec;
        if (target.has_parent_path()) {
            stdfs::create_directories(target.parent_path(), ec);
            if (ec) error::throwFromErrorCode(ec, "Failed to create directory", target.parent_path());
        }

        tmp = util::tempSiblingFor(target);
        copyInto(tmp);

        stdfs::rename(tmp, target, ec);
        if (ec) error::throwFromErrorCode(ec, "Failed to move copy into place", target);
        tmp.clear();

        outcome = Outcome::Copied;
        LogRegistry::sync()->info("[CopyTask] Copied {} ({})", source.relative_path, util::bytesToSize(bytes));
    } catch (const error::Interrupted& e) {
        outcome = Outcome::Interrupted;
        error = e.what();
        LogRegistry::sync()->warn("[CopyTask] {}", error);
    } catch (const error::Error& e) {
        outcome = Outcome::Failed;
        error = std::string(e.kind()) + ": " + e.what();
        LogRegistry::sync()->error("[CopyTask] Failed to copy {}: {}", source.relative_path, error);
    }

    if (!tmp.empty()) {
        std::error_code ec;
        stdfs::remove(tmp, ec);
        if (ec) LogRegistry::sync()->warn("[CopyTask] Could not remove temp file {}: {}", tmp.string(), ec.message());
    }

    // the cache only ever learns about copies that are fully in place
    if (outcome == Outcome::Copied && cache) {
        try {
            cache->commit(cache::CacheEntry::fromRecord(source));
        } catch (const error::Error& e) {
            cacheFailed = true;
            LogRegistry::cache()->error("[CopyTask] Failed to record {} in the cache: {}", source.relative_path, e.what());
        }
    }

    resolve(outcome == Outcome::Copied);
}

void Copy::copyInto(const stdfs::path& tmp) {
    const auto& src = source.absolute_path;

    // state before the copy is the state recorded if nothing moves underneath us
    const auto before = fs::model::FileRecord::fromPath(source.absolute_path.parent_path(), src);
    std::error_code ec;
    const auto srcTime = stdfs::last_write_time(src, ec);
    if (ec) error::throwFromErrorCode(ec, "Failed to read mtime of", src);
    const auto srcPerms = stdfs::status(src, ec).permissions();
    if (ec) error::throwFromErrorCode(ec, "Failed to stat", src);

    errno = 0;
    std::ifstream in(src, std::ios::binary);
    if (!in) error::throwFromErrorCode(std::error_code(errno ? errno : EIO, std::generic_category()),
                                       "Failed to open source", src);

    errno = 0;
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) error::throwFromErrorCode(std::error_code(errno ? errno : EIO, std::generic_category()),
                                        "Failed to create temp file", tmp);

    crypto::hash::Blake2b state;
    std::vector<char> buffer(std::max<size_t>(chunkSize, 1));
    bytes = 0;

    while (in) {
        if (interrupt && interrupt->load())
            throw error::Interrupted("Copy interrupted: " + source.relative_path, src);

        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = in.gcount();
        if (n <= 0) break;

        out.write(buffer.data(), n);
        if (!out) throw error::IOError("Write error on " + tmp.string(), tmp);
        state.update(buffer.data(), static_cast<size_t>(n));
        bytes += static_cast<uintmax_t>(n);
    }
    if (in.bad()) throw error::IOError("Read error on " + src.string(), src);

    out.close();
    if (!out) throw error::IOError("Failed to finish writing " + tmp.string(), tmp);
    in.close();

    const auto after = fs::model::FileRecord::fromPath(source.absolute_path.parent_path(), src);
    if (!after.sameMetadata(before) || bytes != before.size_bytes)
        throw error::IOError("Source changed during copy: " + src.string(), src);

    stdfs::permissions(tmp, srcPerms, stdfs::perm_options::replace, ec);
    if (ec) error::throwFromErrorCode(ec, "Failed to set permissions on", tmp);
    stdfs::last_write_time(tmp, srcTime, ec);
    if (ec) error::throwFromErrorCode(ec, "Failed to set mtime on", tmp);

    digest = state.finish();
    source.size_bytes = before.size_bytes;
    source.modified_time = before.modified_time;
    source.digest = digest;
}

void Copy::cancel() {
    if (outcome == Outcome::Pending) outcome = Outcome::Cancelled;
    PromisedTask::cancel();
}

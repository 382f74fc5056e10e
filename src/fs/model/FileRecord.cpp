#include "fs/model/FileRecord.hpp"
#include "error/Error.hpp"
#include "util/files.hpp"

#include <cstdlib>

using namespace fm::fs::model;

FileRecord FileRecord::fromPath(const std::filesystem::path& root, const std::filesystem::path& absPath) {
    namespace stdfs = std::filesystem;
    std::error_code ec;

    const auto st = stdfs::symlink_status(absPath, ec);
    if (st.type() == stdfs::file_type::not_found)
        throw error::NotFoundError("File not found: " + absPath.string(), absPath);
    if (ec) error::throwFromErrorCode(ec, "Failed to stat", absPath);
    if (!stdfs::is_regular_file(st)) throw error::IOError("Not a regular file: " + absPath.string(), absPath);

    const auto size = stdfs::file_size(absPath, ec);
    if (ec) error::throwFromErrorCode(ec, "Failed to read size of", absPath);

    const auto mtime = stdfs::last_write_time(absPath, ec);
    if (ec) error::throwFromErrorCode(ec, "Failed to read mtime of", absPath);

    return {absPath, util::relativeKey(root, absPath), size, util::toEpochNanos(mtime)};
}

bool FileRecord::sameMetadata(const FileRecord& other, const util::EpochNanos tolerance) const {
    return size_bytes == other.size_bytes && std::llabs(modified_time - other.modified_time) <= tolerance;
}

#include "fs/model/ScanSession.hpp"

#include <algorithm>
#include <numeric>

using namespace fm::fs::model;

uintmax_t ScanSession::totalBytes() const {
    return std::accumulate(records.begin(), records.end(), uintmax_t{0},
                           [](const uintmax_t acc, const FileRecord& r) { return acc + r.size_bytes; });
}

const FileRecord* ScanSession::find(const std::string& rel) const {
    const auto it = std::ranges::lower_bound(records, rel, {}, &FileRecord::relative_path);
    if (it == records.end() || it->relative_path != rel) return nullptr;
    return &*it;
}

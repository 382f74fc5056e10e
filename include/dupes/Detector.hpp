#pragma once

#include "dupes/model/Group.hpp"
#include "fs/Fingerprinter.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace fm::fs::model {
struct ScanSession;
}

namespace fm::concurrency {
class ThreadPool;
}

namespace fm::dupes {

struct DetectorOptions {
    size_t chunk_size;
    uintmax_t min_size_bytes = 0;
    std::shared_ptr<std::atomic<bool>> interrupt{};
};

struct Detection {
    std::vector<model::DuplicateGroup> groups;
    uint64_t candidates{};             // files that shared their size with another file
    fs::FingerprintOutcome hashing{};
    bool interrupted = false;
};

struct Detector {
    // Size prefilter, hash on hashPool, regroup by (size, digest). Members are ordered
    // by (modified_time, relative_path) and groups by (size desc, digest asc), so the
    // same tree always yields the same groups in the same order.
    static Detection detect(fs::model::ScanSession& session, concurrency::ThreadPool& hashPool,
                            const DetectorOptions& opts);

    static void orderMembers(model::DuplicateGroup& group);
    static void orderGroups(std::vector<model::DuplicateGroup>& groups);
};

}

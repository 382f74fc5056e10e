#pragma once

#include "fs/model/FileRecord.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fm::concurrency {
class ThreadPool;
}

namespace fm::fs {

struct HashFailure {
    std::filesystem::path path;
    std::string reason;
};

struct FingerprintOutcome {
    uint64_t hashed{};
    uint64_t bytes{};
    std::vector<HashFailure> failures;
    bool interrupted = false;
};

// Fingerprint engine: fans digests out over the hash pool, then merges them back
// into the records once the pool has drained.
class Fingerprinter {
public:
    Fingerprinter(concurrency::ThreadPool& pool, size_t chunkSize,
                  std::shared_ptr<std::atomic<bool>> interrupt = nullptr);

    // Records that fail to hash keep an empty digest and are listed in the outcome
    FingerprintOutcome fingerprint(const std::vector<model::FileRecord*>& records) const;

private:
    concurrency::ThreadPool& pool_;
    size_t chunkSize_;
    std::shared_ptr<std::atomic<bool>> interrupt_;
};

}

#pragma once

#include "concurrency/Task.hpp"
#include "crypto/Digest.hpp"
#include "fs/model/FileRecord.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace fm::cache {
class FingerprintCache;
}

namespace fm::sync::tasks {

// Streams source into a hidden temp sibling of target while digesting it, carries over
// mtime and permissions, renames into place and commits the copied state to the cache.
// A failed or interrupted copy leaves target untouched and removes its temp file.
struct Copy final : concurrency::PromisedTask {
    enum class Outcome { Pending, Copied, Failed, Interrupted, Cancelled };

    fs::model::FileRecord source;
    std::filesystem::path target;
    std::shared_ptr<cache::FingerprintCache> cache;
    size_t chunkSize;
    std::shared_ptr<std::atomic<bool>> interrupt;

    Outcome outcome{Outcome::Pending};
    std::optional<crypto::Digest256> digest{};
    uintmax_t bytes{};
    std::string error{};
    bool cacheFailed = false;

    Copy(fs::model::FileRecord src, std::filesystem::path tgt, std::shared_ptr<cache::FingerprintCache> cache,
         size_t chunkSize, std::shared_ptr<std::atomic<bool>> interrupt = nullptr);

    void operator()() override;
    void cancel() override;

private:
    void copyInto(const std::filesystem::path& tmp);
};

}

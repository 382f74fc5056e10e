#pragma once

#include "concurrency/Task.hpp"
#include "crypto/Digest.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace fm::fs::tasks {

// Digests one file. The task only writes its own result fields; callers read them
// after the hash pool barrier.
struct Hash final : concurrency::PromisedTask {
    std::filesystem::path path;
    size_t chunkSize;
    std::shared_ptr<std::atomic<bool>> interrupt;

    std::optional<crypto::Digest256> digest{};
    std::string error{};

    Hash(std::filesystem::path p, size_t chunk, std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr)
        : path(std::move(p)), chunkSize(chunk), interrupt(std::move(interruptFlag)) {}

    void operator()() override;
    void cancel() override;
};

}

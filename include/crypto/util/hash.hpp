#pragma once

#include "crypto/Digest.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <sodium.h>

namespace fm::crypto::hash {

// Incremental BLAKE2b-256; feeding the same bytes in any split yields the same digest
class Blake2b {
public:
    Blake2b();

    void update(const void* data, size_t len);
    Digest256 finish();

private:
    crypto_generichash_state state_{};
    bool finished_ = false;
};

// Streams the file in chunkSize reads. Throws error::NotFoundError, error::PermissionError
// or error::IOError; error::Interrupted if interrupt becomes true between chunks.
Digest256 blake2b(const std::filesystem::path& filepath, size_t chunkSize,
                  const std::atomic<bool>* interrupt = nullptr);

}

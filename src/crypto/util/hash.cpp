#include "crypto/util/hash.hpp"
#include "error/Error.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace fm::crypto::hash {

namespace {

void ensureSodium() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
    });
}

}

Blake2b::Blake2b() {
    ensureSodium();
    crypto_generichash_init(&state_, nullptr, 0, Digest256::SIZE);
}

void Blake2b::update(const void* data, const size_t len) {
    if (finished_) throw std::logic_error("Blake2b::update after finish");
    crypto_generichash_update(&state_, static_cast<const unsigned char*>(data), len);
}

Digest256 Blake2b::finish() {
    if (finished_) throw std::logic_error("Blake2b::finish called twice");
    Digest256 out;
    crypto_generichash_final(&state_, out.bytes.data(), out.bytes.size());
    finished_ = true;
    return out;
}

Digest256 blake2b(const std::filesystem::path& filepath, const size_t chunkSize,
                  const std::atomic<bool>* interrupt) {
    std::error_code ec;
    const auto st = std::filesystem::status(filepath, ec);
    if (st.type() == std::filesystem::file_type::not_found)
        throw error::NotFoundError("File not found: " + filepath.string(), filepath);
    if (ec) error::throwFromErrorCode(ec, "Failed to stat file for hashing", filepath);
    if (!std::filesystem::is_regular_file(st))
        throw error::IOError("Not a regular file: " + filepath.string(), filepath);

    errno = 0;
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        const int err = errno ? errno : EIO;
        error::throwFromErrorCode(std::error_code(err, std::generic_category()),
                                  "Failed to open file for hashing", filepath);
    }

    Blake2b state;
    std::vector<char> buffer(std::max<size_t>(chunkSize, 1));

    while (file) {
        if (interrupt && interrupt->load())
            throw error::Interrupted("Hashing interrupted: " + filepath.string(), filepath);

        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (const auto n = file.gcount(); n > 0) state.update(buffer.data(), static_cast<size_t>(n));
    }

    if (file.bad()) throw error::IOError("Read error while hashing: " + filepath.string(), filepath);

    return state.finish();
}

}

#include "crypto/Digest.hpp"

namespace fm::crypto {

std::string Digest256::hex() const {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(SIZE * 2);
    for (const auto b : bytes) {
        out += digits[(b >> 4) & 0xF];
        out += digits[b & 0xF];
    }
    return out;
}

std::optional<Digest256> Digest256::fromHex(const std::string_view s) {
    if (s.size() != SIZE * 2) return std::nullopt;

    auto nibble = [](const char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    Digest256 d;
    for (size_t i = 0; i < SIZE; ++i) {
        const int hi = nibble(s[2 * i]), lo = nibble(s[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        d.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return d;
}

}

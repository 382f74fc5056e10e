#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace fm::crypto {

// 256-bit content fingerprint
struct Digest256 {
    static constexpr size_t SIZE = 32;

    std::array<uint8_t, SIZE> bytes{};

    [[nodiscard]] std::string hex() const;

    // Returns nullopt unless s is exactly 64 hex characters
    static std::optional<Digest256> fromHex(std::string_view s);

    friend auto operator<=>(const Digest256&, const Digest256&) = default;
};

}

template<>
struct std::hash<fm::crypto::Digest256> {
    size_t operator()(const fm::crypto::Digest256& d) const noexcept {
        // already uniformly distributed; the first word is enough
        size_t h = 0;
        for (size_t i = 0; i < sizeof(size_t); ++i) h = (h << 8) | d.bytes[i];
        return h;
    }
};

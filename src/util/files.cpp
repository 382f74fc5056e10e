#include "util/files.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <fmt/format.h>
#include <random>

using namespace fm::util;

std::string fm::util::generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

std::string fm::util::bytesToSize(uintmax_t bytes) {
    static constexpr std::array<const char*, 6> suffix = {"B", "KB", "MB", "GB", "TB", "PB"};

    if (bytes < 1024) return std::to_string(bytes) + "B";

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;

    while (value >= 1024.0 && unit + 1 < suffix.size()) {
        value /= 1024.0;
        ++unit;
    }

    if (value >= 100.0 || std::fabs(value - std::round(value)) < 0.05)
        return fmt::format("{:.0f}{}", value, suffix[unit]);
    return fmt::format("{:.1f}{}", value, suffix[unit]);
}

std::string fm::util::relativeKey(const std::filesystem::path& root, const std::filesystem::path& absPath) {
    const auto rel = absPath.lexically_relative(root).lexically_normal();
    auto key = rel.generic_string();
    while (!key.empty() && key.front() == '/') key.erase(key.begin());
    if (key == ".") key.clear();
    return key;
}

std::filesystem::path fm::util::tempSiblingFor(const std::filesystem::path& target) {
    const auto name = "." + target.filename().string() + TEMP_MARKER + generate_random_suffix(TEMP_SUFFIX_LENGTH);
    return target.parent_path() / name;
}

bool fm::util::isTempSibling(const std::filesystem::path& p) {
    const auto name = p.filename().string();
    const std::string_view marker(TEMP_MARKER);
    if (name.size() < 2 + marker.size() + TEMP_SUFFIX_LENGTH || name.front() != '.') return false;

    const auto markerPos = name.size() - TEMP_SUFFIX_LENGTH - marker.size();
    if (std::string_view(name).substr(markerPos, marker.size()) != marker) return false;

    return std::all_of(name.end() - static_cast<std::ptrdiff_t>(TEMP_SUFFIX_LENGTH), name.end(), [](const char c) {
        return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    });
}

bool fm::util::isValidUtf8(const std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) { ++i; continue; }

        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace fm::util {

std::string generate_random_suffix(size_t length = 8);

// Human readable size, e.g. "512B", "1.5KB", "20MB"
std::string bytesToSize(uintmax_t bytes);

// Normalized relative key of absPath under root: '/'-separated, no leading slash
std::string relativeKey(const std::filesystem::path& root, const std::filesystem::path& absPath);

// Sibling temp path used for write-then-rename, e.g. dir/.name.fmtmp-Ab12Cd34
std::filesystem::path tempSiblingFor(const std::filesystem::path& target);

// True only for names tempSiblingFor produces: '.', a non-empty target name, the marker,
// then exactly TEMP_SUFFIX_LENGTH characters from [0-9A-Za-z] ending the name.
bool isTempSibling(const std::filesystem::path& p);

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF
bool isValidUtf8(std::string_view s);

inline constexpr const char* TEMP_MARKER = ".fmtmp-";
inline constexpr size_t TEMP_SUFFIX_LENGTH = 8;

}

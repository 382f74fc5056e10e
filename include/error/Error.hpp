#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fm::error {

struct Error : std::runtime_error {
    std::filesystem::path path;

    explicit Error(const std::string& what, std::filesystem::path p = {})
        : std::runtime_error(what), path(std::move(p)) {}

    [[nodiscard]] virtual const char* kind() const noexcept { return "Error"; }
};

struct IOError final : Error {
    using Error::Error;
    [[nodiscard]] const char* kind() const noexcept override { return "IOError"; }
};

struct PermissionError final : Error {
    using Error::Error;
    [[nodiscard]] const char* kind() const noexcept override { return "PermissionError"; }
};

// Path vanished between scan and action
struct NotFoundError final : Error {
    using Error::Error;
    [[nodiscard]] const char* kind() const noexcept override { return "NotFoundError"; }
};

struct CorruptCacheError final : Error {
    using Error::Error;
    [[nodiscard]] const char* kind() const noexcept override { return "CorruptCacheError"; }
};

// Invalid arguments or configuration, always fatal and raised before any pool starts
struct ConfigError final : Error {
    using Error::Error;
    [[nodiscard]] const char* kind() const noexcept override { return "ConfigError"; }
};

// Raised inside tasks that notice the interrupt flag mid-operation
struct Interrupted final : Error {
    using Error::Error;
    [[nodiscard]] const char* kind() const noexcept override { return "Interrupted"; }
};

// Maps an OS error code onto the taxonomy above and throws it.
[[noreturn]] void throwFromErrorCode(const std::error_code& ec, const std::string& action,
                                     const std::filesystem::path& path);

}

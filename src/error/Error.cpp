#include "error/Error.hpp"

#include <fmt/format.h>

namespace fm::error {

void throwFromErrorCode(const std::error_code& ec, const std::string& action,
                        const std::filesystem::path& path) {
    const auto msg = fmt::format("{} '{}': {}", action, path.string(), ec.message());

    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
        throw NotFoundError(msg, path);

    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system)
        throw PermissionError(msg, path);

    throw IOError(msg, path);
}

}

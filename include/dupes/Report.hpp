#pragma once

#include "dupes/model/Group.hpp"

#include <filesystem>
#include <vector>

namespace fm::dupes {

struct LoadedReport {
    std::vector<model::DuplicateGroup> groups;
    uint64_t files_missing{};
    uint64_t files_skipped{};
    uint64_t groups_skipped{};
};

struct Report {
    // Writes the JSON array of groups, creating parent directories. Throws error::IOError
    // or error::PermissionError.
    static void write(const std::filesystem::path& path, const std::vector<model::DuplicateGroup>& groups);

    // Reads a report written by write() and re-stats every listed file. Missing files and
    // files whose size changed are dropped with a warning; a group whose retained file is
    // gone is dropped entirely. Member order is kept as written. An unreadable or malformed
    // report is an error::ConfigError.
    static LoadedReport load(const std::filesystem::path& path);

    static std::filesystem::path defaultPath(const std::filesystem::path& reportDir, const std::string& stamp);
};

}

#pragma once

#include <cstdlib>
#include <filesystem>

namespace fm::paths {

inline constexpr const char* CONFIG_ENV_VAR = "FILESMANAGER_CONFIG";
inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/filesmanager/config.yaml";

inline std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv(CONFIG_ENV_VAR); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

}

#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "error/Error.hpp"

#include <yaml-cpp/yaml.h>

namespace fm::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (path.empty() || !std::filesystem::exists(path)) return cfg;

    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) return cfg;
        if (!root.IsMap()) throw error::ConfigError("Config root must be a mapping: " + path.string(), path);

        if (auto node = root["concurrency"]) YAML::convert<ConcurrencyConfig>::decode(node, cfg.concurrency);
        if (auto node = root["hashing"]) YAML::convert<HashingConfig>::decode(node, cfg.hashing);
        if (auto node = root["duplicates"]) YAML::convert<DuplicatesConfig>::decode(node, cfg.duplicates);
        if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    } catch (const YAML::Exception& e) {
        throw error::ConfigError("Failed to parse config " + path.string() + ": " + e.what(), path);
    }

    if (cfg.hashing.chunk_size_bytes == 0)
        throw error::ConfigError("hashing.chunk_size_kb must be greater than zero", path);

    return cfg;
}

}

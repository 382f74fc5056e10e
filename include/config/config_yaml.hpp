#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fm::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ConcurrencyConfig> {
    static Node encode(const ConcurrencyConfig& rhs) {
        Node node;
        node["scan_threads"] = rhs.scan_threads;
        node["hash_threads"] = rhs.hash_threads;
        node["io_threads"] = rhs.io_threads;
        return node;
    }

    static bool decode(const Node& node, ConcurrencyConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.scan_threads = node["scan_threads"].as<unsigned int>(0);
        rhs.hash_threads = node["hash_threads"].as<unsigned int>(0);
        rhs.io_threads = node["io_threads"].as<unsigned int>(0);
        return true;
    }
};

template<>
struct convert<HashingConfig> {
    static Node encode(const HashingConfig& rhs) {
        Node node;
        node["chunk_size_kb"] = rhs.chunk_size_bytes / 1024;
        return node;
    }

    static bool decode(const Node& node, HashingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.chunk_size_bytes = node["chunk_size_kb"].as<uintmax_t>(1024) * 1024; // Default 1MB
        return true;
    }
};

template<>
struct convert<DuplicatesConfig> {
    static Node encode(const DuplicatesConfig& rhs) {
        Node node;
        node["report_dir"] = rhs.report_dir.string();
        node["min_size_bytes"] = rhs.min_size_bytes;
        return node;
    }

    static bool decode(const Node& node, DuplicatesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.report_dir = node["report_dir"].as<std::string>("reports");
        rhs.min_size_bytes = node["min_size_bytes"].as<uintmax_t>(0);
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["cache_dir"] = rhs.cache_dir.string();
        node["mtime_tolerance_ms"] = rhs.mtime_tolerance_ms;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cache_dir = node["cache_dir"].as<std::string>(".filesmanager/cache");
        rhs.mtime_tolerance_ms = node["mtime_tolerance_ms"].as<unsigned int>(0);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["filesmanager"] = to_std_string(spdlog::level::to_string_view(rhs.filesmanager));
        node["scan"]         = to_std_string(spdlog::level::to_string_view(rhs.scan));
        node["hash"]         = to_std_string(spdlog::level::to_string_view(rhs.hash));
        node["cache"]        = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["dupes"]        = to_std_string(spdlog::level::to_string_view(rhs.dupes));
        node["sync"]         = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["cli"]          = to_std_string(spdlog::level::to_string_view(rhs.cli));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.filesmanager = spdlog::level::from_str(node["filesmanager"].as<std::string>("info"));
        rhs.scan = spdlog::level::from_str(node["scan"].as<std::string>("info"));
        rhs.hash = spdlog::level::from_str(node["hash"].as<std::string>("info"));
        rhs.cache = spdlog::level::from_str(node["cache"].as<std::string>("info"));
        rhs.dupes = spdlog::level::from_str(node["dupes"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.cli = spdlog::level::from_str(node["cli"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("logs");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}

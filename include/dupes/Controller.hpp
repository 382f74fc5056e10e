#pragma once

#include "dupes/model/Summary.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace fm::config {
struct Config;
}

namespace fm::concurrency {
class ThreadPoolManager;
}

namespace fm::dupes {

struct Options {
    std::optional<std::filesystem::path> path{};
    std::optional<std::filesystem::path> input_json{};  // wins over path
    std::optional<std::filesystem::path> output_json{};
    bool remove = false;
    bool dry_run = false;
    std::string stamp{};  // run timestamp used for the default report name
};

struct Controller {
    // Scan (or reload), report, and optionally delete. Throws error::ConfigError for
    // unusable arguments before any pool is started.
    static model::Summary run(const Options& opts, concurrency::ThreadPoolManager& pools, const config::Config& cnf);
};

}

#pragma once

#include "sync/Context.hpp"
#include "sync/model/Summary.hpp"

#include <filesystem>

namespace fm::config {
struct Config;
}

namespace fm::concurrency {
class ThreadPoolManager;
}

namespace fm::sync {

struct Controller {
    // Validate, scan both trees, plan, execute, write back the cache. Throws
    // error::ConfigError for unusable arguments before any pool is started.
    static model::Summary run(const Options& opts, concurrency::ThreadPoolManager& pools, const config::Config& cnf);

    // <cacheDir>/sync_<first 16 hex digits of BLAKE2b(source \0 destination)>.json
    static std::filesystem::path defaultCachePath(const std::filesystem::path& cacheDir,
                                                  const std::filesystem::path& source,
                                                  const std::filesystem::path& destination);

private:
    static void validate(const Options& opts);
    static void prepareDestination(const Options& opts);
};

}

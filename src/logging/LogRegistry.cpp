#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace fm::logging {

void LogRegistry::init(const std::filesystem::path& logDir, const std::string& runStamp) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;
    if (!fs::exists(logDir)) fs::create_directories(logDir);
    log_file_path_ = logDir / ("files_manager_" + runStamp + ".log");

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // one artifact per invocation, never rotated
    file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path_.string(), /*truncate=*/false);
    file_sink_->set_level(cnf.levels.file_log_level);
    file_sink_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("filesmanager", sub_levels.filesmanager);
    makeLogger("scan",         sub_levels.scan);
    makeLogger("hash",         sub_levels.hash);
    makeLogger("cache",        sub_levels.cache);
    makeLogger("dupes",        sub_levels.dupes);
    makeLogger("sync",         sub_levels.sync);
    makeLogger("cli",          sub_levels.cli);

    initialized_ = true;
    filesmanager()->debug("[LogRegistry] Initialized, writing to {}", log_file_path_.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

const std::filesystem::path& LogRegistry::logFilePath() { return log_file_path_; }

void LogRegistry::flushAll() {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
}

} // namespace fm::logging

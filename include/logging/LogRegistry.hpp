#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace fm::logging {

class LogRegistry {
public:
    // Initialize all loggers; every invocation gets its own files_manager_<stamp>.log under logDir.
    static void init(const std::filesystem::path& logDir, const std::string& runStamp);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> filesmanager() { return get("filesmanager"); }
    static std::shared_ptr<spdlog::logger> scan()         { return get("scan"); }
    static std::shared_ptr<spdlog::logger> hash()         { return get("hash"); }
    static std::shared_ptr<spdlog::logger> cache()        { return get("cache"); }
    static std::shared_ptr<spdlog::logger> dupes()        { return get("dupes"); }
    static std::shared_ptr<spdlog::logger> sync()         { return get("sync"); }
    static std::shared_ptr<spdlog::logger> cli()          { return get("cli"); }

    [[nodiscard]] static bool isInitialized();
    [[nodiscard]] static const std::filesystem::path& logFilePath();

    static void flushAll();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;
    static inline std::filesystem::path log_file_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink_;
};

} // namespace fm::logging

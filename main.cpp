#include "cli/Router.hpp"
#include "cli/commands.hpp"
#include "concurrency/Interrupt.hpp"
#include "config/ConfigRegistry.hpp"
#include "error/Error.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <chrono>
#include <iostream>

using namespace fm;
using namespace fm::cli;
using namespace fm::config;
using namespace fm::logging;

namespace {

int runCommand(const Router& router, const CommandCall& call) {
    const auto start = std::chrono::system_clock::now();
    LogRegistry::filesmanager()->info("[filesmanager] Started at: {}", util::timestampToString(start));
    LogRegistry::filesmanager()->debug("[filesmanager] Log file: {}", LogRegistry::logFilePath().string());

    int code = EXIT_OK;
    try {
        const auto result = router.execute(call);
        if (!result.stdout_text.empty()) std::cout << result.stdout_text;
        if (!result.stderr_text.empty()) std::cerr << result.stderr_text;
        code = result.exit_code;
    } catch (const error::ConfigError& e) {
        LogRegistry::filesmanager()->error("[filesmanager] {}", e.what());
        code = EXIT_USAGE;
    } catch (const error::Error& e) {
        LogRegistry::filesmanager()->error("[filesmanager] {}: {}", e.kind(), e.what());
        code = EXIT_ERROR;
    } catch (const std::exception& e) {
        LogRegistry::filesmanager()->critical("[filesmanager] Unexpected failure: {}", e.what());
        code = EXIT_ERROR;
    }

    if (concurrency::processInterruptFlag()->load()) code = EXIT_INTERRUPTED;

    const auto end = std::chrono::system_clock::now();
    LogRegistry::filesmanager()->info("[filesmanager] Started at: {}", util::timestampToString(start));
    LogRegistry::filesmanager()->info("[filesmanager] Ended at: {}", util::timestampToString(end));
    LogRegistry::filesmanager()->info("[filesmanager] Total run time: {}", util::durationToString(end - start));
    LogRegistry::flushAll();
    return code;
}

}

int main(const int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    Router router;
    registerAllCommands(router);

    CommandCall call;
    try {
        call = router.parse(args);
    } catch (const error::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\nRun 'fm help' for usage.\n";
        return EXIT_USAGE;
    }

    if (Router::isHelp(call)) {
        std::cout << router.execute(call).stdout_text;
        return EXIT_OK;
    }

    const auto stamp = util::getCurrentTimestamp();

    try {
        if (const auto cfg = call.value("config")) {
            // an explicitly named file has to exist; only the default location may be absent
            if (!std::filesystem::exists(*cfg)) throw error::ConfigError("Config file not found: " + *cfg, *cfg);
            ConfigRegistry::init(std::filesystem::path(*cfg));
        } else {
            ConfigRegistry::init();
        }
        LogRegistry::init(ConfigRegistry::get().logging.log_dir, stamp);
    } catch (const error::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cerr << "Error: failed to initialize: " << e.what() << "\n";
        return EXIT_ERROR;
    }

    concurrency::installSignalHandlers();
    return runCommand(router, call);
}

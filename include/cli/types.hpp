#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace fm::cli {

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_ERROR = 1;
inline constexpr int EXIT_USAGE = 2;
inline constexpr int EXIT_INTERRUPTED = 130;

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;

    [[nodiscard]] bool has(const std::string& key) const {
        for (const auto& [k, _] : options) if (k == key) return true;
        return false;
    }

    [[nodiscard]] std::optional<std::string> value(const std::string& key) const {
        for (const auto& [k, v] : options) if (k == key) return v;
        return std::nullopt;
    }
};

struct CommandResult {
    int exit_code = EXIT_OK;
    std::string stdout_text;
    std::string stderr_text;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string description;
    CommandHandler handler;
    std::unordered_set<std::string> aliases;
};

}

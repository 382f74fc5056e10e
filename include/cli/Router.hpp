#pragma once

#include "cli/CommandUsage.hpp"
#include "cli/types.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fm::cli {

class Router {
public:
    Router();

    void registerCommand(const std::shared_ptr<CommandUsage>& usage, CommandHandler handler);

    // Tokenizes argv (without the program name), resolves the command and canonicalizes
    // every option to its primary long name. Usage problems throw error::ConfigError.
    [[nodiscard]] CommandCall parse(const std::vector<std::string>& args) const;

    // True for "help [cmd]", "--help" and an empty command line
    [[nodiscard]] static bool isHelp(const CommandCall& call);

    [[nodiscard]] std::string help(const std::string& command = {}) const;

    CommandResult execute(const CommandCall& call) const;

private:
    std::shared_ptr<CommandUsage> globals_;
    std::unordered_map<std::string, std::shared_ptr<CommandUsage>> usages_;
    std::unordered_map<std::string, CommandInfo> commands_;
    std::vector<std::string> order_;

    [[nodiscard]] std::unordered_set<std::string> booleanFlags() const;
    [[nodiscard]] const CommandUsage* usageFor(const std::string& name) const;

    static std::string normalize(const std::string& s);
};

}

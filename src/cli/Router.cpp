#include "cli/Router.hpp"
#include "cli/Parser.hpp"
#include "cli/Token.hpp"
#include "error/Error.hpp"

#include <cctype>

using namespace fm::cli;

Router::Router() : globals_(std::make_shared<CommandUsage>()) {
    globals_->command = "fm";
    globals_->description = "Find duplicate files and keep directories in sync";
    globals_->synopsis = "fm [--config FILE] <command> [options]";
    globals_->options = {
        {"--config", "YAML configuration file (default: $FILESMANAGER_CONFIG, then /etc/filesmanager/config.yaml)", {}, "FILE"},
        {"--help", "Show help for a command", {"-h"}}
    };
}

void Router::registerCommand(const std::shared_ptr<CommandUsage>& usage, CommandHandler handler) {
    const auto key = normalize(usage->primary());
    commands_[key] = CommandInfo{usage->description, std::move(handler), {}};
    usages_[key] = usage;
    order_.push_back(key);
}

std::unordered_set<std::string> Router::booleanFlags() const {
    std::unordered_set<std::string> out;
    auto add = [&](const CommandUsage& u) {
        for (const auto& o : u.options) {
            if (o.takesValue()) continue;
            out.insert(normalize_flag(o.label));
            for (const auto& a : o.aliases) out.insert(normalize_flag(a));
        }
    };
    add(*globals_);
    for (const auto& [_, u] : usages_) add(*u);
    return out;
}

const CommandUsage* Router::usageFor(const std::string& name) const {
    if (const auto it = usages_.find(normalize(name)); it != usages_.end()) return it->second.get();
    return nullptr;
}

CommandCall Router::parse(const std::vector<std::string>& args) const {
    auto raw = parseTokens(tokenize(args), booleanFlags());
    raw.name = normalize(raw.name);

    if (isHelp(raw)) return raw;

    const auto* usage = usageFor(raw.name);
    if (!usage) throw error::ConfigError("Unknown command: " + raw.name);

    CommandCall call;
    call.name = raw.name;
    call.positionals = std::move(raw.positionals);

    for (const auto& [key, value] : raw.options) {
        const Entry* e = usage->findOption(key);
        if (!e) e = globals_->findOption(key);
        if (!e) throw error::ConfigError("Unknown option '" + key + "' for command '" + call.name + "'");

        const auto canonical = normalize_flag(e->label);
        if (e->takesValue() && !value)
            throw error::ConfigError("Option --" + canonical + " requires a value (" + e->metavar + ")");
        setOpt(call, canonical, value);
    }

    if (call.has("help")) return call;

    if (call.positionals.size() != usage->positionals.size()) {
        std::string expected;
        for (const auto& p : usage->positionals) expected += " <" + p.label + ">";
        throw error::ConfigError("Command '" + call.name + "' expects " + std::to_string(usage->positionals.size()) +
                                 " argument(s):" + (expected.empty() ? " none" : expected) + ", got " +
                                 std::to_string(call.positionals.size()));
    }

    return call;
}

bool Router::isHelp(const CommandCall& call) {
    return call.name.empty() || call.name == "help" || call.has("help") || call.has("h");
}

std::string Router::help(const std::string& command) const {
    if (!command.empty()) {
        if (const auto* u = usageFor(command)) return u->str();
        return "Unknown command: " + command + "\n\n" + help();
    }

    std::vector<const CommandUsage*> list;
    for (const auto& k : order_) list.push_back(usages_.at(k).get());
    return globals_->str() + formatCommandList(list, globals_->theme) +
           "Run 'fm help <command>' for the options of a command.\n";
}

CommandResult Router::execute(const CommandCall& call) const {
    if (isHelp(call)) {
        const auto topic = call.name == "help" ? (call.positionals.empty() ? std::string{} : call.positionals.front())
                                               : call.name;
        return {EXIT_OK, help(topic), {}};
    }

    const auto it = commands_.find(call.name);
    if (it == commands_.end()) return {EXIT_USAGE, {}, "Unknown command: " + call.name + "\n"};
    return it->second.handler(call);
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fm::cli {

// A labeled option or positional, with optional aliases
struct Entry {
    std::string label;                  // primary, e.g. "--path"
    std::string desc;
    std::vector<std::string> aliases;   // e.g. {"-p"}
    std::string metavar{};              // value placeholder; empty for boolean flags

    [[nodiscard]] bool takesValue() const { return !metavar.empty(); }
};

struct Example {
    std::string cmd;
    std::string note;
};

// ANSI color theme. Set enabled=false to disable.
struct ColorTheme {
    bool enabled = true;

    std::string header = "\033[1;36m";  // section titles (bold cyan)
    std::string command = "\033[1;32m"; // command name (bold green)
    std::string key = "\033[33m";       // left column keys (yellow)
    std::string reset = "\033[0m";

    [[nodiscard]] std::string maybe(const std::string& code) const { return enabled ? code : ""; }
    [[nodiscard]] std::string H() const { return maybe(header); }
    [[nodiscard]] std::string C() const { return maybe(command); }
    [[nodiscard]] std::string K() const { return maybe(key); }
    [[nodiscard]] std::string R() const { return maybe(reset); }
};

class CommandUsage {
public:
    std::string command;                 // e.g. "sync"
    std::string description;
    std::optional<std::string> synopsis; // if empty, synthesized

    std::vector<Entry> positionals;      // all required, in order
    std::vector<Entry> options;

    std::vector<Example> examples;

    int term_width = 100;
    std::size_t max_key_col = 30;
    ColorTheme theme{};

    [[nodiscard]] const std::string& primary() const { return command; }

    // Option whose label or alias names key (dashes and underscores ignored)
    [[nodiscard]] const Entry* findOption(const std::string& key) const;

    [[nodiscard]] std::string str() const;
    [[nodiscard]] std::string basicStr() const;

private:
    [[nodiscard]] std::string buildSynopsis_() const;
};

// Two-column listing used by the top-level help
std::string formatCommandList(const std::vector<const CommandUsage*>& usages, const ColorTheme& theme);

}

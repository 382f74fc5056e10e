#include "cli/CommandUsage.hpp"
#include "cli/Token.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fm::cli {

namespace {

std::string trimRight(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::vector<std::string> wrap(const std::string& s, int width) {
    const int W = std::max(20, width);
    std::vector<std::string> out;
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        while (i < n && s[i] == ' ') ++i;
        if (i >= n) break;

        const std::size_t end = std::min<std::size_t>(i + W, n);
        std::size_t break_pos = end;

        // prefer last space before end
        if (end < n && s[end] != ' ') {
            const auto sp = s.rfind(' ', end);
            if (sp != std::string::npos && sp > i) break_pos = sp;
        }

        out.push_back(trimRight(s.substr(i, break_pos - i)));
        i = break_pos < n && s[break_pos] == ' ' ? break_pos + 1 : break_pos;
    }
    if (out.empty()) out.emplace_back("");
    return out;
}

void emitWrapped(std::ostringstream& out, const std::string& text, std::size_t indent, int width) {
    for (const auto& ln : wrap(text, width - static_cast<int>(indent)))
        out << std::string(indent, ' ') << ln << "\n";
}

std::string keyText(const Entry& e) {
    auto k = e.aliases.empty() ? e.label : fmt::format("{} | {}", e.label, fmt::join(e.aliases, " | "));
    if (e.takesValue()) k += " " + e.metavar;
    return k;
}

std::string padRight(const std::string& s, std::size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

void emitTwoColSection(std::ostringstream& out, const std::string& title, const std::vector<Entry>& items,
                       int width, std::size_t maxKeyCol, const ColorTheme& theme) {
    if (items.empty()) return;
    constexpr std::size_t indent = 2, gap = 2;

    std::size_t keyw = 0;
    for (const auto& it : items) keyw = std::max(keyw, keyText(it).size());
    keyw = std::min(keyw, maxKeyCol);

    out << theme.H() << title << theme.R() << "\n";
    const int rightw = width - static_cast<int>(indent + keyw + gap);
    for (const auto& it : items) {
        const auto key = keyText(it);
        const auto lines = wrap(it.desc, rightw);

        out << std::string(indent, ' ') << theme.K() << padRight(key, keyw) << theme.R();
        // keys wider than the column push the description to its own line
        if (key.size() > keyw) out << "\n" << std::string(indent + keyw + gap, ' ');
        else out << std::string(gap, ' ');

        out << lines[0] << "\n";
        for (std::size_t i = 1; i < lines.size(); ++i)
            out << std::string(indent + keyw + gap, ' ') << lines[i] << "\n";
    }
    out << "\n";
}

}

const Entry* CommandUsage::findOption(const std::string& key) const {
    const auto k = normalize_flag(key);
    for (const auto& o : options) {
        if (normalize_flag(o.label) == k) return &o;
        for (const auto& a : o.aliases)
            if (normalize_flag(a) == k) return &o;
    }
    return nullptr;
}

std::string CommandUsage::buildSynopsis_() const {
    if (synopsis) return *synopsis;

    std::ostringstream syn;
    syn << "fm " << command;
    for (const auto& p : positionals) syn << " <" << p.label << ">";
    for (const auto& o : options) {
        syn << " [" << o.label;
        if (o.takesValue()) syn << " " << o.metavar;
        syn << "]";
    }
    return syn.str();
}

std::string CommandUsage::basicStr() const {
    const int tw = term_width > 40 ? term_width : 100;
    std::ostringstream out;

    out << theme.C() << command << theme.R();
    if (!description.empty()) out << " - " << description;
    out << "\n\n" << theme.H() << "Usage:" << theme.R() << "\n";
    emitWrapped(out, buildSynopsis_(), 2, tw);
    out << "\n";
    return out.str();
}

std::string CommandUsage::str() const {
    const int tw = term_width > 40 ? term_width : 100;
    std::ostringstream out;

    emitTwoColSection(out, "Arguments:", positionals, tw, max_key_col, theme);
    emitTwoColSection(out, "Options:", options, tw, max_key_col, theme);

    if (!examples.empty()) {
        out << theme.H() << "Examples:" << theme.R() << "\n";
        for (const auto& ex : examples) {
            emitWrapped(out, fmt::format("$ {}", ex.cmd), 2, tw);
            if (!ex.note.empty()) emitWrapped(out, ex.note, 4, tw);
        }
        out << "\n";
    }

    return basicStr() + out.str();
}

std::string formatCommandList(const std::vector<const CommandUsage*>& usages, const ColorTheme& theme) {
    std::vector<Entry> items;
    items.reserve(usages.size());
    for (const auto* u : usages) items.push_back({u->command, u->description, {}});

    std::ostringstream out;
    emitTwoColSection(out, "Commands:", items, 100, 30, theme);
    return out.str();
}

}

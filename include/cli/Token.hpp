#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace fm::cli {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

inline bool looks_negative_number(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

// Long flag names are compared with '_' and '-' treated alike: --enable_deep_scan == --enable-deep-scan
inline std::string normalize_flag(std::string k) {
    while (!k.empty() && k.front() == '-') k.erase(k.begin());
    std::ranges::replace(k, '_', '-');
    return k;
}

inline void pushFlag(std::vector<Token>& out, std::string k) {
    out.push_back({TokenType::Flag, normalize_flag(std::move(k))});
}

inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// argv is already split by the shell, so each element is one atom:
//   "--"          sentinel, everything after is a Word
//   "--key=value" Flag(key) Word(value)
//   "--key"       Flag(key)
//   "-k"          Flag(k)
//   "-kVALUE"     Flag(k) Word(VALUE)
//   "-1.5"        Word
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);

    bool stop_flags = false;
    for (const auto& a : args) {
        if (stop_flags || a.size() < 2 || a[0] != '-' || looks_negative_number(a)) {
            pushWord(out, a);
            continue;
        }

        if (a == "--") {
            pushWord(out, a);
            stop_flags = true;
            continue;
        }

        if (a.rfind("--", 0) == 0) {
            if (const auto eq = a.find('='); eq != std::string::npos) {
                pushFlag(out, a.substr(2, eq - 2));
                pushWord(out, a.substr(eq + 1));
            } else {
                pushFlag(out, a.substr(2));
            }
            continue;
        }

        pushFlag(out, std::string(1, a[1]));
        if (a.size() > 2) {
            std::string value = a.substr(2);
            if (value[0] == '=') value.erase(value.begin());
            pushWord(out, std::move(value));
        }
    }

    return out;
}

inline std::string to_string(const Token& t) {
    switch (t.type) {
    case TokenType::Word: return "Word(" + t.text + ")";
    case TokenType::Flag: return "Flag(" + t.text + ")";
    }
    return "UnknownToken";
}

inline std::string to_string(const std::vector<Token>& tokens) {
    std::string out;
    out.reserve(64 + tokens.size() * 16);
    for (const auto& t : tokens) {
        if (!out.empty()) out += " ";
        out += to_string(t);
    }
    return out;
}

}

#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace ci::cli {

// Value: the "=value" half of a glued "--key=value", always bound to the flag before it
enum class TokenType { Word, Flag, Value };

struct Token {
    TokenType type;
    std::string text;

    bool operator==(const Token&) const = default;
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

inline void pushFlag(std::vector<Token>& out, std::string k) {
    out.push_back({TokenType::Flag, std::move(k)});
}
inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}
inline void pushValue(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Value, std::move(v)});
}

// Heuristic: decide if "-XYZ" is a bundle or "-X<value>".
// If tail contains obvious value chars (/, ., :, =) or digits, treat as glued value.
inline bool looks_glued_value(std::string_view tail) {
    return std::ranges::any_of(tail, [](char c) {
        return c == '/' || c == '.' || c == ':' || c == '=' || (c >= '0' && c <= '9');
    });
}

// Expand short bundle "-abc" -> flags a,b,c
inline void expand_bundle(std::string_view bundle, std::vector<Token>& out) {
    for (const char c : bundle) pushFlag(out, std::string(1, c));
}

// argv is already split by the shell; each element is classified on its own.
// Once "--" is seen every later argument is a Word.
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);

    bool literal = false;
    for (const auto& arg : args) {
        if (literal || arg.size() < 2 || arg[0] != '-' || looks_negative_number(arg)) {
            pushWord(out, arg);
            continue;
        }

        if (arg == "--") {
            pushWord(out, arg);
            literal = true;
            continue;
        }

        // --key or --key=value
        if (arg.starts_with("--")) {
            const auto eq = arg.find('=');
            if (eq == std::string::npos) {
                pushFlag(out, arg.substr(2));
            } else {
                pushFlag(out, arg.substr(2, eq - 2));
                pushValue(out, arg.substr(eq + 1));
            }
            continue;
        }

        // -k, -abc bundle or glued -kVALUE
        if (arg.size() == 2) {
            pushFlag(out, arg.substr(1));
            continue;
        }

        const std::string_view tail = std::string_view(arg).substr(2);
        if (looks_glued_value(tail)) {
            pushFlag(out, std::string(1, arg[1]));
            std::string value(tail);
            if (!value.empty() && value[0] == '=') value.erase(value.begin());
            pushValue(out, std::move(value));
        } else {
            expand_bundle(std::string_view(arg).substr(1), out);
        }
    }

    return out;
}

}

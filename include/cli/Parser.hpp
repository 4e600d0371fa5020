#pragma once

#include "cli/Token.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ci::cli {

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;

    [[nodiscard]] bool has(const std::string& key) const {
        for (const auto& [k, v] : options) if (k == key) return true;
        return false;
    }

    // Last occurrence
    [[nodiscard]] std::optional<std::string> value(const std::string& key) const {
        std::optional<std::string> out;
        for (const auto& [k, v] : options) if (k == key) out = v;
        return out;
    }

    // Every occurrence, in order
    [[nodiscard]] std::vector<std::string> values(const std::string& key) const {
        std::vector<std::string> out;
        for (const auto& [k, v] : options) if (k == key && v) out.push_back(*v);
        return out;
    }
};

// How the parser treats each option name
struct OptionSpec {
    std::unordered_set<std::string> switches;    // never take a value
    std::unordered_set<std::string> valued;      // always take a value (last wins)
    std::unordered_set<std::string> repeatable;  // take a value, every occurrence kept
    std::unordered_map<std::string, std::string> aliases;  // short -> long

    [[nodiscard]] std::string canonical(const std::string& key) const {
        const auto it = aliases.find(key);
        return it == aliases.end() ? key : it->second;
    }
};

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

inline void addOpt(CommandCall& c, const std::string& key, const std::string& val) {
    c.options.push_back(FlagKV{key, val});
}

// Throws UsageError for unknown options, missing values and values given to switches.
inline CommandCall parseTokens(const std::vector<Token>& toks, const OptionSpec& spec) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(2);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        // Sentinel: "--" arrives as a Word from the tokenizer
        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (t.type == TokenType::Value)
            throw UsageError("unexpected value '" + t.text + "'");

        if (stop_flags || t.type == TokenType::Word) {
            call.positionals.push_back(t.text);
            continue;
        }

        const auto key = spec.canonical(t.text);
        const bool glued = i + 1 < toks.size() && toks[i + 1].type == TokenType::Value;

        if (spec.switches.contains(key)) {
            if (glued) throw UsageError("option --" + key + " does not take a value");
            setOpt(call, key, std::nullopt);
            continue;
        }

        if (!spec.valued.contains(key) && !spec.repeatable.contains(key))
            throw UsageError("unknown option '" + std::string(t.text.size() == 1 ? "-" : "--") + t.text + "'");

        if (!glued && (i + 1 >= toks.size() || toks[i + 1].type != TokenType::Word || toks[i + 1].text == "--"))
            throw UsageError("option --" + key + " requires a value");

        const auto& val = toks[++i].text;
        if (spec.repeatable.contains(key)) addOpt(call, key, val);
        else setOpt(call, key, val);
    }

    return call;
}

}

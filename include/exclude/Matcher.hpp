#pragma once

#include "exclude/Excluder.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ci::exclude {

class Matcher final : public Excluder {
public:
    enum class Form { AbsolutePrefix, Glob };

    struct Pattern {
        std::string text;                       // normalized, as displayed
        Form form;
        std::string folded;                     // AbsolutePrefix: lower-cased text
        std::vector<std::string> alternatives;  // Glob: brace-expanded text
    };

    Matcher() = default;

    // Normalizes every pattern once; empty and malformed globs are dropped.
    explicit Matcher(const std::vector<std::string>& patterns);

    [[nodiscard]] bool excludes(std::string_view path) const override;

    [[nodiscard]] std::vector<std::string> patterns() const;
    [[nodiscard]] const std::vector<Pattern>& compiled() const { return patterns_; }
    [[nodiscard]] bool empty() const { return patterns_.empty(); }

    // Pattern rewriting applied at construction. Idempotent.
    static std::string normalize(std::string_view pattern);
    static bool isAbsolutePattern(std::string_view pattern);

    // Forward slashes, lexically clean, no trailing separator
    static std::string normalizePath(std::string_view path);

private:
    std::vector<Pattern> patterns_;

    [[nodiscard]] static bool matches(const Pattern& pattern, const std::string& path);
};

}

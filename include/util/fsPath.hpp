#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ci::util {

namespace fs = std::filesystem;

// Absolute, lexically normal, no trailing separator
inline fs::path normalizeDir(const fs::path& path) {
    auto norm = fs::absolute(path).lexically_normal();
    if (!norm.has_filename() && norm.has_parent_path() && norm != norm.root_path())
        norm = norm.parent_path();
    return norm;
}

inline std::string toSlash(std::string s) {
    std::ranges::replace(s, '\\', '/');
    return s;
}

inline std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// True when `path` equals `dir` or lies below it (component-wise, lexical)
inline bool isUnder(const fs::path& path, const fs::path& dir) {
    auto pit = path.begin();
    for (auto dit = dir.begin(); dit != dir.end(); ++dit, ++pit) {
        if (dit->empty() && std::next(dit) == dir.end()) break; // trailing separator
        if (pit == path.end() || *pit != *dit) return false;
    }
    return true;
}

inline bool hasDotDot(const fs::path& rel) {
    for (const auto& part : rel)
        if (part == "..") return true;
    return false;
}

// `path` relative to `base`, or nullopt when it escapes or is empty
inline std::optional<fs::path> relativeUnder(const fs::path& base, const fs::path& path) {
    const auto rel = path.lexically_normal().lexically_relative(base.lexically_normal());
    if (rel.empty() || rel == "." || hasDotDot(rel)) return std::nullopt;
    return rel;
}

}

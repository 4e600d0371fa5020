#include "exclude/Matcher.hpp"
#include "exclude/glob.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

#include <filesystem>

using namespace ci::exclude;
using namespace ci::log;

namespace {

bool hasWildcard(const std::string_view s) {
    return s.find_first_of("*?[") != std::string_view::npos;
}

// "*/name/*" or "*/name" with a literal name, or empty when the shape does not fit
std::string_view simpleDirName(const std::string_view pattern) {
    if (!pattern.starts_with("*/")) return {};
    auto rest = pattern.substr(2);
    if (rest.ends_with("/*")) rest.remove_suffix(2);
    if (rest.empty() || hasWildcard(rest) || rest.find('/') != std::string_view::npos) return {};
    return rest;
}

}

Matcher::Matcher(const std::vector<std::string>& patterns) {
    patterns_.reserve(patterns.size());

    for (const auto& raw : patterns) {
        if (raw.empty()) continue;

        Pattern p;
        p.text = normalize(raw);

        if (isAbsolutePattern(p.text)) {
            p.form = Form::AbsolutePrefix;
            p.folded = util::toLower(p.text);
        } else {
            p.form = Form::Glob;
            try {
                validateGlob(p.text);
                p.alternatives = expandBraces(p.text);
            } catch (const GlobError& e) {
                Registry::exclude()->warn("[Matcher] Dropping invalid pattern '{}': {}", raw, e.what());
                continue;
            }
        }

        Registry::exclude()->debug("[Matcher] Pattern '{}' -> '{}'", raw, p.text);
        patterns_.push_back(std::move(p));
    }
}

bool Matcher::isAbsolutePattern(const std::string_view pattern) {
    // C:/ or C:\ drive form
    if (pattern.size() >= 3 && pattern[1] == ':' && (pattern[2] == '/' || pattern[2] == '\\')) return true;
    // UNC
    if (pattern.starts_with("//") || pattern.starts_with("\\\\")) return true;
    return pattern.starts_with('/');
}

std::string Matcher::normalize(const std::string_view pattern) {
    std::string norm = util::toSlash(std::string(pattern));
    if (norm.empty() || isAbsolutePattern(norm)) return norm;

    if (!hasWildcard(norm)) return "**/" + norm + "/**";

    if (const auto dir = simpleDirName(norm); !dir.empty())
        return "**/" + std::string(dir) + "/**";

    if (norm.find('/') == std::string::npos) return "**/" + norm;

    // explicit directory shape, matched literally
    return norm;
}

std::string Matcher::normalizePath(const std::string_view path) {
    const auto slashed = util::toSlash(std::string(path));
    if (slashed.empty()) return slashed;

    auto clean = std::filesystem::path(slashed).lexically_normal().generic_string();
    while (clean.size() > 1 && clean.back() == '/') clean.pop_back();

    // POSIX normalization folds a leading "//" into "/"; UNC patterns keep both slashes
    if (slashed.starts_with("//") && !slashed.starts_with("///") && !clean.starts_with("//"))
        clean.insert(0, 1, '/');
    return clean;
}

bool Matcher::excludes(const std::string_view path) const {
    if (patterns_.empty()) return false;

    const auto candidate = normalizePath(path);
    for (const auto& pattern : patterns_) {
        if (matches(pattern, candidate)) {
            Registry::exclude()->debug("[Matcher] '{}' excluded by '{}'", candidate, pattern.text);
            return true;
        }
    }
    return false;
}

bool Matcher::matches(const Pattern& pattern, const std::string& path) {
    if (pattern.form == Form::AbsolutePrefix)
        return util::toLower(path).starts_with(pattern.folded);

    for (const auto& alt : pattern.alternatives) {
        try {
            if (globMatch(alt, path)) return true;
        } catch (const GlobError& e) {
            Registry::exclude()->debug("[Matcher] Pattern '{}' failed on '{}': {}", alt, path, e.what());
        }
    }
    return false;
}

std::vector<std::string> Matcher::patterns() const {
    std::vector<std::string> out;
    out.reserve(patterns_.size());
    for (const auto& p : patterns_) out.push_back(p.text);
    return out;
}

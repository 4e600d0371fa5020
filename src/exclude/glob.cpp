#include "exclude/glob.hpp"

#include <fmt/core.h>

namespace ci::exclude {

namespace {

std::vector<std::string_view> splitSegments(const std::string_view s) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (true) {
        const auto pos = s.find('/', start);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

// Parses a [...] class starting at pattern[i] == '['. Returns index one past ']'.
size_t matchClass(const std::string_view pat, size_t i, const char c, bool& matched) {
    const size_t open = i++;
    bool negate = false;
    if (i < pat.size() && (pat[i] == '!' || pat[i] == '^')) {
        negate = true;
        ++i;
    }

    bool hit = false;
    bool first = true;
    while (i < pat.size() && (first || pat[i] != ']')) {
        first = false;
        char lo = pat[i];
        if (lo == '\\') {
            if (++i >= pat.size()) break;
            lo = pat[i];
        }
        ++i;

        char hi = lo;
        if (i + 1 < pat.size() && pat[i] == '-' && pat[i + 1] != ']') {
            hi = pat[i + 1];
            i += 2;
            if (hi == '\\') {
                if (i >= pat.size()) break;
                hi = pat[i++];
            }
            if (hi < lo) throw GlobError(fmt::format("invalid range in character class at offset {}", open));
        }

        if (c >= lo && c <= hi) hit = true;
    }

    if (i >= pat.size()) throw GlobError(fmt::format("unterminated character class at offset {}", open));
    matched = hit != negate;
    return i + 1;
}

// Single path segment, no '/' on either side
bool matchSegment(const std::string_view pat, const std::string_view name) {
    size_t p = 0, n = 0;
    size_t starP = std::string_view::npos, starN = 0;

    while (n < name.size()) {
        if (p < pat.size()) {
            const char pc = pat[p];
            if (pc == '*') {
                while (p < pat.size() && pat[p] == '*') ++p;
                starP = p;
                starN = n;
                continue;
            }
            if (pc == '?') {
                ++p;
                ++n;
                continue;
            }
            if (pc == '[') {
                bool hit = false;
                const auto next = matchClass(pat, p, name[n], hit);
                if (hit) {
                    p = next;
                    ++n;
                    continue;
                }
            } else {
                char lit = pc;
                size_t next = p + 1;
                if (pc == '\\') {
                    if (p + 1 >= pat.size()) throw GlobError("trailing escape");
                    lit = pat[p + 1];
                    next = p + 2;
                }
                if (lit == name[n]) {
                    p = next;
                    ++n;
                    continue;
                }
            }
        }

        if (starP == std::string_view::npos) return false;
        p = starP;
        n = ++starN;
    }

    while (p < pat.size() && pat[p] == '*') ++p;
    return p == pat.size();
}

bool matchSegments(const std::vector<std::string_view>& pat, const size_t pi,
                   const std::vector<std::string_view>& path, const size_t si) {
    if (pi == pat.size()) return si == path.size();

    if (pat[pi] == "**") {
        // collapse runs of **
        size_t next = pi;
        while (next < pat.size() && pat[next] == "**") ++next;
        if (next == pat.size()) return true;
        for (size_t k = si; k <= path.size(); ++k)
            if (matchSegments(pat, next, path, k)) return true;
        return false;
    }

    if (si == path.size()) return false;
    if (!matchSegment(pat[pi], path[si])) return false;
    return matchSegments(pat, pi + 1, path, si + 1);
}

}

void validateGlob(const std::string_view pattern) {
    int depth = 0;
    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '\\') {
            if (++i >= pattern.size()) throw GlobError("trailing escape");
        } else if (c == '[') {
            bool ignored = false;
            i = matchClass(pattern, i, '\0', ignored) - 1;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth < 0) throw GlobError(fmt::format("unbalanced '}}' at offset {}", i));
        }
    }
    if (depth != 0) throw GlobError("unbalanced '{'");
}

std::vector<std::string> expandBraces(const std::string_view pattern) {
    size_t open = std::string_view::npos;
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\') { ++i; continue; }
        if (pattern[i] == '{') { open = i; break; }
    }
    if (open == std::string_view::npos) return {std::string(pattern)};

    int depth = 0;
    size_t close = std::string_view::npos;
    std::vector<std::string_view> options;
    size_t optStart = open + 1;
    for (size_t i = open; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '\\') { ++i; continue; }
        if (c == '{') ++depth;
        else if (c == '}') {
            if (--depth == 0) {
                options.push_back(pattern.substr(optStart, i - optStart));
                close = i;
                break;
            }
        } else if (c == ',' && depth == 1) {
            options.push_back(pattern.substr(optStart, i - optStart));
            optStart = i + 1;
        }
    }
    if (close == std::string_view::npos) throw GlobError("unbalanced '{'");

    const auto head = pattern.substr(0, open);
    const auto tail = pattern.substr(close + 1);

    std::vector<std::string> out;
    for (const auto& opt : options) {
        std::string joined;
        joined.reserve(head.size() + opt.size() + tail.size());
        joined.append(head).append(opt).append(tail);
        for (auto& expanded : expandBraces(joined)) out.push_back(std::move(expanded));
    }
    return out;
}

bool globMatch(const std::string_view pattern, const std::string_view path) {
    if (pattern.find('{') != std::string_view::npos) {
        for (const auto& alt : expandBraces(pattern))
            if (globMatch(alt, path)) return true;
        return false;
    }
    return matchSegments(splitSegments(pattern), 0, splitSegments(path), 0);
}

}

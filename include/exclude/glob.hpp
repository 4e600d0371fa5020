#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ci::exclude {

struct GlobError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Match a glob pattern against a forward-slash path.
// Supports: * (any run without /), ? (one char except /),
//           ** as a whole segment (zero or more segments),
//           [abc], [a-z], [!0-9] / [^0-9], \ escapes, {a,b} alternation.
// Throws GlobError for malformed patterns.
bool globMatch(std::string_view pattern, std::string_view path);

// Throws GlobError when the pattern could never be evaluated
void validateGlob(std::string_view pattern);

// {a,b}/x -> a/x, b/x. Nested groups are expanded left to right.
std::vector<std::string> expandBraces(std::string_view pattern);

}

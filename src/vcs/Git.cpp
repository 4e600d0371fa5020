#include "vcs/Git.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"
#include "util/process.hpp"

#include <fmt/core.h>
#include <fstream>
#include <system_error>

using namespace ci::vcs;
using namespace ci::log;
namespace fs = std::filesystem;

namespace {

std::string trimmed(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t start = 0;
    while (start < s.size() && (s[start] == ' ' || s[start] == '\t')) ++start;
    return s.substr(start);
}

}

Git::Git(std::string executable) : executable_(std::move(executable)) {}

std::optional<fs::path> Git::readGitdirFile(const fs::path& dir) {
    std::ifstream in(dir / ".git");
    if (!in) return std::nullopt;

    std::string line;
    if (!std::getline(in, line)) return std::nullopt;

    static constexpr std::string_view prefix = "gitdir:";
    if (!line.starts_with(prefix)) return std::nullopt;

    const auto target = trimmed(line.substr(prefix.size()));
    if (target.empty()) return std::nullopt;

    fs::path resolved(target);
    if (resolved.is_relative()) resolved = dir / resolved;
    return resolved.lexically_normal();
}

bool Git::isRepositoryRoot(const fs::path& dir) const {
    std::error_code ec;
    const auto marker = dir / ".git";
    const auto st = fs::status(marker, ec);
    if (ec) return false;

    if (fs::is_directory(st)) return true;
    if (!fs::is_regular_file(st)) return false;

    const auto gitdir = readGitdirFile(dir);
    if (!gitdir) {
        Registry::vcs()->debug("[Git] {} has a .git file without a gitdir line", dir.string());
        return false;
    }
    return fs::exists(*gitdir, ec);
}

std::vector<fs::path> Git::parseNulList(const std::string& output) {
    std::vector<fs::path> files;
    size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\0', start);
        if (end == std::string::npos) end = output.size();
        if (end > start) {
            auto rel = fs::path(output.substr(start, end - start)).lexically_normal();
            // "dir/" normalizes to "dir/" with an empty filename
            if (!rel.has_filename() && rel.has_parent_path()) rel = rel.parent_path();
            if (!rel.empty() && rel != "." && rel != ".." && !util::hasDotDot(rel) && rel.is_relative())
                files.push_back(std::move(rel));
        }
        start = end + 1;
    }
    return files;
}

std::vector<fs::path> Git::listIgnored(const fs::path& repoRoot) const {
    util::ExecResult res;
    try {
        res = util::execCapture({executable_, "-C", repoRoot.string(), "ls-files", "-i", "--exclude-standard", "-o", "-z"});
    } catch (const std::exception& e) {
        throw VcsError(fmt::format("failed to run git ls-files in {}: {}", repoRoot.string(), e.what()));
    }

    if (!res.ok())
        throw VcsError(fmt::format("git ls-files failed in {} (exit {}): {}",
                                   repoRoot.string(), res.exit_code, trimmed(res.stderr_text)));

    auto files = parseNulList(res.stdout_text);
    Registry::vcs()->debug("[Git] {} ignored paths in {}", files.size(), repoRoot.string());
    return files;
}

bool Git::isIgnored(const fs::path& repoRoot, const fs::path& path) const {
    util::ExecResult res;
    try {
        res = util::execCapture({executable_, "-C", repoRoot.string(), "check-ignore", "-q", "--", path.string()});
    } catch (const std::exception& e) {
        throw VcsError(fmt::format("failed to run git check-ignore in {}: {}", repoRoot.string(), e.what()));
    }

    if (res.exit_code == 0) return true;
    if (res.exit_code == 1) return false;

    throw VcsError(fmt::format("git check-ignore failed for {} (exit {}): {}",
                               path.string(), res.exit_code, trimmed(res.stderr_text)));
}

#pragma once

#include "vcs/Provider.hpp"

#include <optional>
#include <string>

namespace ci::vcs {

class Git final : public Provider {
public:
    explicit Git(std::string executable = "git");

    [[nodiscard]] bool isRepositoryRoot(const std::filesystem::path& dir) const override;
    [[nodiscard]] std::vector<std::filesystem::path> listIgnored(const std::filesystem::path& repoRoot) const override;
    [[nodiscard]] bool isIgnored(const std::filesystem::path& repoRoot,
                                 const std::filesystem::path& path) const override;

    // "gitdir: <path>" target of a linked worktree's .git file, resolved against `dir`
    static std::optional<std::filesystem::path> readGitdirFile(const std::filesystem::path& dir);

    // NUL-separated ls-files output to clean relative paths
    static std::vector<std::filesystem::path> parseNulList(const std::string& output);

private:
    std::string executable_;
};

}

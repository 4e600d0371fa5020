#pragma once

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace ci::vcs {

struct VcsError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Version control backend. Every call may spawn a process and must be
// treated as slow; implementations are shared across scan workers.
class Provider {
public:
    virtual ~Provider() = default;

    // `dir` directly holds a control directory or a linked-worktree marker file
    [[nodiscard]] virtual bool isRepositoryRoot(const std::filesystem::path& dir) const = 0;

    // Ignored paths relative to `repoRoot`. Throws VcsError.
    [[nodiscard]] virtual std::vector<std::filesystem::path> listIgnored(const std::filesystem::path& repoRoot) const = 0;

    // Throws VcsError when the answer cannot be determined
    [[nodiscard]] virtual bool isIgnored(const std::filesystem::path& repoRoot,
                                         const std::filesystem::path& path) const = 0;
};

}

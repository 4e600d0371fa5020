#pragma once

#include "scan/model/Entry.hpp"

#include <filesystem>
#include <functional>
#include <vector>

namespace ci::vcs { class Provider; }
namespace ci::exclude { class Excluder; }

namespace ci::scan {

// Turns one repository's ignored paths into discovered entries:
//   1. top-level directories the VCS ignores as a whole become one entry each
//   2. remaining ignored files are filtered by the excluder
//   3. files sharing a containing directory (two or more) collapse into that directory,
//      the repository root included unless it is the search root itself
class Collector {
public:
    // Returns false to stop emitting
    using Sink = std::function<bool(model::Entry)>;

    Collector(const vcs::Provider& provider, const exclude::Excluder& excluder, std::filesystem::path searchRoot);

    // Throws vcs::VcsError / std::filesystem::filesystem_error when the repository cannot be enumerated.
    // Top-level directory entries are emitted before the file listing is requested.
    size_t collect(const std::filesystem::path& repoRoot, const Sink& sink) const;

    std::vector<model::Entry> collect(const std::filesystem::path& repoRoot) const;

    // Step 3 on repository-relative file paths; returns repository-relative entries, sorted.
    // An empty path in the result stands for the repository root.
    static std::vector<std::filesystem::path> collapse(std::vector<std::filesystem::path> files,
                                                       bool collapseRoot = false);

private:
    const vcs::Provider& provider_;
    const exclude::Excluder& excluder_;
    std::filesystem::path searchRoot_;

    [[nodiscard]] model::Entry makeEntry(const std::filesystem::path& repoRoot, const std::filesystem::path& relToRepo) const;
};

}

#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>

namespace ci::vcs { class Provider; }
namespace ci::exclude { class Excluder; }

namespace ci::scan {

struct TraversalError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Breadth-first search for repository roots. Descent stops at the first
// repository boundary on every path, so nested repositories are not reported.
class Locator {
public:
    using ProgressFn = std::function<void(const std::filesystem::path&)>;
    using RepoFn = std::function<void(const std::filesystem::path&)>;

    explicit Locator(const vcs::Provider& provider, const exclude::Excluder* excluder = nullptr);

    // Called once for every dequeued directory
    void setProgress(ProgressFn fn) { progress_ = std::move(fn); }

    // Directories never entered (the backup tree when it lives inside the search root)
    void skip(const std::filesystem::path& dir);

    void setInterruptFlag(std::shared_ptr<std::atomic<bool>> flag) { interrupt_ = std::move(flag); }

    // Throws TraversalError on any listing failure other than permission denied.
    std::vector<std::filesystem::path> locate(const std::filesystem::path& root, const RepoFn& onRepo = {}) const;

private:
    const vcs::Provider& provider_;
    const exclude::Excluder* excluder_;
    ProgressFn progress_;
    std::vector<std::filesystem::path> skip_;
    std::shared_ptr<std::atomic<bool>> interrupt_;

    [[nodiscard]] bool skipped(const std::filesystem::path& dir) const;
};

}

#pragma once

#include "copy/Engine.hpp"
#include "scan/Locator.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ci::config { struct Config; }
namespace ci::vcs { class Provider; }

namespace ci::runtime {

struct RunSummary {
    size_t repositories = 0;
    size_t failed_repositories = 0;
    size_t discovered = 0;
    copy::ResultSnapshot copy;
    size_t orphans_versioned = 0;
    bool dry_run = false;
    bool cleanup_skipped = false;
    bool interrupted = false;

    // dry run only: relative paths that would be copied
    std::vector<std::filesystem::path> planned;
};

// scan -> bounded queue -> copy -> orphan cleanup, for one configuration
class Runner {
public:
    // A null `interruptFlag` gets a fresh one
    Runner(const config::Config& cfg, const vcs::Provider& provider,
           std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    void setScanProgress(scan::Locator::ProgressFn fn) { scanProgress_ = std::move(fn); }
    void setCopyProgress(copy::Engine::ProgressFn fn) { copyProgress_ = std::move(fn); }

    // Raised from a signal handler or another thread to wind the run down
    [[nodiscard]] const std::shared_ptr<std::atomic<bool>>& interruptFlag() const { return interrupt_; }

    // Throws scan::TraversalError once the copy stage has been joined, or
    // std::runtime_error when the copy stage cannot be set up.
    RunSummary run();

    [[nodiscard]] nlohmann::json report(const RunSummary& summary) const;
    void writeReport(const RunSummary& summary, const std::filesystem::path& path) const;

private:
    const config::Config& cfg_;
    const vcs::Provider& provider_;
    std::shared_ptr<std::atomic<bool>> interrupt_;
    scan::Locator::ProgressFn scanProgress_;
    copy::Engine::ProgressFn copyProgress_;
};

void to_json(nlohmann::json& j, const RunSummary& s);

}

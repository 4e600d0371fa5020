#pragma once

#include "concurrency/BoundedQueue.hpp"
#include "scan/Locator.hpp"
#include "scan/model/Entry.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace ci::config { struct Config; }

namespace ci::scan {

struct ScanStats {
    size_t repositories = 0;
    size_t failed_repositories = 0;
    size_t entries = 0;
    std::vector<std::filesystem::path> failed;
};

// Locates repositories on the calling thread and collects each one on a
// scan worker, streaming entries into `out` while the traversal continues.
// The caller owns `out` and closes it after run() returns.
class Orchestrator {
public:
    Orchestrator(const config::Config& cfg,
                 const vcs::Provider& provider,
                 const exclude::Excluder& excluder,
                 concurrency::BoundedQueue<model::Entry>& out,
                 std::shared_ptr<std::atomic<bool>> interruptFlag);

    void setProgress(Locator::ProgressFn fn) { progress_ = std::move(fn); }

    // Throws TraversalError after raising the interrupt flag and closing `out`.
    ScanStats run();

private:
    const config::Config& cfg_;
    const vcs::Provider& provider_;
    const exclude::Excluder& excluder_;
    concurrency::BoundedQueue<model::Entry>& out_;
    std::shared_ptr<std::atomic<bool>> interrupt_;
    Locator::ProgressFn progress_;
};

}

#include "scan/Orchestrator.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "scan/Collector.hpp"
#include "util/fsPath.hpp"

#include <chrono>

using namespace ci::scan;
using namespace ci::log;
using namespace ci::concurrency;
namespace fs = std::filesystem;

namespace {

struct SharedCounters {
    std::atomic<size_t> entries{0};
    std::mutex failedMutex;
    std::vector<fs::path> failed;
};

struct RepoScanTask final : Task {
    const Collector& collector;
    fs::path repoRoot;
    BoundedQueue<model::Entry>& out;
    SharedCounters& counters;
    std::shared_ptr<std::atomic<bool>> interrupt;

    RepoScanTask(const Collector& c, fs::path repo, BoundedQueue<model::Entry>& q,
                 SharedCounters& counters, std::shared_ptr<std::atomic<bool>> flag)
        : collector(c), repoRoot(std::move(repo)), out(q), counters(counters), interrupt(std::move(flag)) {}

    void operator()() override {
        if (interrupt->load()) return;

        const auto start = std::chrono::steady_clock::now();
        try {
            const auto found = collector.collect(repoRoot, [this](model::Entry e) {
                if (interrupt->load()) return false;
                if (!out.push(std::move(e))) return false;
                counters.entries.fetch_add(1, std::memory_order_relaxed);
                return true;
            });

            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            Registry::scan()->info("[Orchestrator] {} -> {} entries in {} ms", repoRoot.string(), found, ms);
        } catch (const std::exception& e) {
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            Registry::scan()->warn("[Orchestrator] {} failed after {} ms: {}", repoRoot.string(), ms, e.what());
            std::scoped_lock lock(counters.failedMutex);
            counters.failed.push_back(repoRoot);
        }
    }
};

}

Orchestrator::Orchestrator(const config::Config& cfg,
                           const vcs::Provider& provider,
                           const exclude::Excluder& excluder,
                           BoundedQueue<model::Entry>& out,
                           std::shared_ptr<std::atomic<bool>> interruptFlag)
    : cfg_(cfg), provider_(provider), excluder_(excluder), out_(out),
      interrupt_(interruptFlag ? std::move(interruptFlag) : std::make_shared<std::atomic<bool>>(false)) {}

ScanStats Orchestrator::run() {
    const auto& root = cfg_.scan.search_root;
    const Collector collector(provider_, excluder_, root);
    SharedCounters counters;

    Locator locator(provider_, &excluder_);
    locator.setInterruptFlag(interrupt_);
    if (progress_) locator.setProgress(progress_);
    if (util::isUnder(cfg_.copy.backup_root, root)) locator.skip(cfg_.copy.backup_root);
    if (util::isUnder(cfg_.historyBase(), root)) locator.skip(cfg_.historyBase());

    ThreadPool pool("scan", interrupt_, cfg_.scanWorkers(), cfg_.scanWorkers() * 4);

    Registry::scan()->info("[Orchestrator] Scanning {} with {} workers", root.string(), pool.workerCount());

    std::vector<fs::path> repos;
    try {
        repos = locator.locate(root, [&](const fs::path& repo) {
            if (!pool.submit(std::make_shared<RepoScanTask>(collector, repo, out_, counters, interrupt_)))
                Registry::scan()->debug("[Orchestrator] Pool closed, not scanning {}", repo.string());
        });
    } catch (const TraversalError& e) {
        Registry::scan()->error("[Orchestrator] Traversal failed: {}", e.what());
        interrupt_->store(true);
        out_.close();
        pool.stop();
        throw;
    }

    pool.drain();

    ScanStats stats;
    stats.repositories = repos.size();
    stats.entries = counters.entries.load();
    stats.failed = std::move(counters.failed);
    stats.failed_repositories = stats.failed.size();

    Registry::scan()->info("[Orchestrator] {} repositories, {} entries, {} failed",
                           stats.repositories, stats.entries, stats.failed_repositories);
    return stats;
}

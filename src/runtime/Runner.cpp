#include "runtime/Runner.hpp"
#include "backup/Manager.hpp"
#include "concurrency/BoundedQueue.hpp"
#include "config/Config.hpp"
#include "exclude/Matcher.hpp"
#include "log/Registry.hpp"
#include "scan/Orchestrator.hpp"
#include "vcs/Provider.hpp"

#include <chrono>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace ci::runtime;
using namespace ci::log;
namespace fs = std::filesystem;

namespace ci::runtime {

void to_json(nlohmann::json& j, const RunSummary& s) {
    j = {
        {"repositories", s.repositories},
        {"failed_repositories", s.failed_repositories},
        {"discovered", s.discovered},
        {"copied", s.copy.copied},
        {"skipped", s.copy.skipped},
        {"errors", s.copy.errors},
        {"total", s.copy.total},
        {"orphans_versioned", s.orphans_versioned},
        {"dry_run", s.dry_run},
        {"cleanup_skipped", s.cleanup_skipped},
        {"interrupted", s.interrupted}
    };
}

}

Runner::Runner(const config::Config& cfg, const vcs::Provider& provider,
               std::shared_ptr<std::atomic<bool>> interruptFlag)
    : cfg_(cfg),
      provider_(provider),
      interrupt_(interruptFlag ? std::move(interruptFlag) : std::make_shared<std::atomic<bool>>(false)) {}

RunSummary Runner::run() {
    const auto started = std::chrono::steady_clock::now();
    Registry::app()->info("[Runner] {} -> {}{}", cfg_.scan.search_root.string(), cfg_.copy.backup_root.string(),
                          cfg_.copy.dry_run ? " (dry run)" : "");

    RunSummary summary;
    summary.dry_run = cfg_.copy.dry_run;

    const exclude::Matcher matcher(cfg_.scan.excludes);
    if (!matcher.empty()) Registry::app()->debug("[Runner] Exclude patterns: {}", fmt::join(matcher.patterns(), ", "));

    std::unique_ptr<backup::Manager> backups;
    if (!cfg_.copy.dry_run) backups = std::make_unique<backup::Manager>(cfg_);

    concurrency::BoundedQueue<scan::model::Entry> queue(cfg_.scan.queue_capacity);

    copy::Engine engine(cfg_, matcher, backups.get());
    if (copyProgress_) engine.setProgress(copyProgress_);
    engine.start(queue, interrupt_);

    scan::Orchestrator orchestrator(cfg_, provider_, matcher, queue, interrupt_);
    if (scanProgress_) orchestrator.setProgress(scanProgress_);

    scan::ScanStats stats;
    try {
        stats = orchestrator.run();
    } catch (const scan::TraversalError&) {
        queue.close();
        engine.wait();
        throw;
    }

    queue.close();
    summary.copy = engine.wait();
    summary.repositories = stats.repositories;
    summary.failed_repositories = stats.failed_repositories;
    summary.discovered = stats.entries;
    summary.interrupted = interrupt_->load();

    if (cfg_.copy.dry_run) {
        summary.planned = engine.seen();
    } else if (summary.interrupted) {
        Registry::app()->warn("[Runner] Interrupted, orphan cleanup skipped");
        summary.cleanup_skipped = true;
    } else if (!cfg_.backup.cleanup_orphans) {
        Registry::app()->debug("[Runner] Orphan cleanup disabled");
    } else if (stats.failed_repositories > 0) {
        Registry::app()->warn("[Runner] {} repositories failed to scan, orphan cleanup skipped",
                              stats.failed_repositories);
        summary.cleanup_skipped = true;
    } else {
        try {
            summary.orphans_versioned = backups->cleanupOrphans(engine.destinations());
        } catch (const backup::BackupError& e) {
            Registry::app()->error("[Runner] Orphan cleanup aborted: {}", e.what());
            summary.cleanup_skipped = true;
        }
    }

    const auto secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    Registry::app()->info("[Runner] {} repositories ({} failed), {} entries, {} copied, {} skipped, {} errors, "
                          "{} orphans versioned in {:.2f}s",
                          summary.repositories, summary.failed_repositories, summary.discovered,
                          summary.copy.copied, summary.copy.skipped, summary.copy.errors,
                          summary.orphans_versioned, secs);

    if (cfg_.report_path) writeReport(summary, *cfg_.report_path);
    return summary;
}

nlohmann::json Runner::report(const RunSummary& summary) const {
    nlohmann::json j = summary;
    j["timestamp"] = cfg_.timestamp;
    j["search_root"] = cfg_.scan.search_root.string();
    j["backup_root"] = cfg_.copy.backup_root.string();
    j["config"] = cfg_;
    if (summary.dry_run) {
        auto& planned = j["planned"] = nlohmann::json::array();
        for (const auto& p : summary.planned) planned.push_back(p.generic_string());
    }
    return j;
}

void Runner::writeReport(const RunSummary& summary, const fs::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        Registry::app()->error("[Runner] Cannot write report to {}", path.string());
        return;
    }
    out << report(summary).dump(2) << '\n';
    if (!out) Registry::app()->error("[Runner] Failed writing report {}", path.string());
    else Registry::app()->debug("[Runner] Report written to {}", path.string());
}

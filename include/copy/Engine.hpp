#pragma once

#include "concurrency/BoundedQueue.hpp"
#include "concurrency/KeyedMutex.hpp"
#include "copy/Result.hpp"
#include "scan/model/Entry.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace ci::config { struct Config; }
namespace ci::exclude { class Excluder; }
namespace ci::backup { class Manager; }
namespace ci::concurrency { class ThreadPool; }

namespace ci::copy {

struct CopyError : std::runtime_error {
    enum class Kind { SourceStat, DestinationStat, CopyIO, Rename, Backup };

    CopyError(Kind kind, std::filesystem::path path, const std::string& what)
        : std::runtime_error(what), kind(kind), path(std::move(path)) {}

    Kind kind;
    std::filesystem::path path;
};

std::string_view to_string(CopyError::Kind kind);

struct Progress {
    ResultSnapshot counts;
    std::filesystem::path source;
    std::filesystem::path destination;
};

// Incremental mirror of discovered entries into the backup root.
// A destination is rewritten only when it is strictly older than its source;
// the old content is handed to the backup manager first.
class Engine {
public:
    using ProgressFn = std::function<void(const Progress&)>;

    // `backups` may be null (dry run, or history disabled)
    Engine(const config::Config& cfg, const exclude::Excluder& excluder, backup::Manager* backups);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    void setProgress(ProgressFn fn) { progress_ = std::move(fn); }

    // Spawns the copy workers on `entries`; they exit once it is closed and drained
    // or the interrupt flag is raised.
    void start(concurrency::BoundedQueue<scan::model::Entry>& entries,
               std::shared_ptr<std::atomic<bool>> interruptFlag);

    // Joins the workers started by start()
    ResultSnapshot wait();

    // Single entry, on the calling thread. Records the outcome.
    Outcome copyOne(const scan::model::Entry& entry);

    [[nodiscard]] ResultSnapshot snapshot() const { return result_.snapshot(); }

    // Absolute destinations of every entry seen this run whose source still exists
    [[nodiscard]] std::unordered_set<std::string> destinations() const;

    // Relative paths of the same entries, in arrival order
    [[nodiscard]] std::vector<std::filesystem::path> seen() const;

private:
    const config::Config& cfg_;
    const exclude::Excluder& excluder_;
    backup::Manager* backups_;
    const std::filesystem::path backupRoot_;
    const std::filesystem::path historyBase_;
    const bool dryRun_;

    Result result_;
    ProgressFn progress_;
    std::mutex progressMutex_;

    concurrency::KeyedMutex destLocks_;

    mutable std::mutex seenMutex_;
    std::unordered_set<std::string> destinations_;
    std::vector<std::filesystem::path> seen_;

    std::unique_ptr<concurrency::ThreadPool> pool_;
    concurrency::BoundedQueue<scan::model::Entry>* entries_ = nullptr;

    Outcome copyPath(const std::filesystem::path& src, const std::filesystem::path& dest);
    Outcome copyDirectory(const std::filesystem::path& src, const std::filesystem::path& dest);
    Outcome copyFile(const std::filesystem::path& src, const std::filesystem::path& dest,
                     std::filesystem::file_time_type srcTime);
    void versionExisting(const std::filesystem::path& dest);
    void report(const scan::model::Entry& entry);
};

// Writes `src` to a hidden sibling of `dest`, fsyncs, renames it into place and
// stamps `dest` with `mtime`. Throws CopyError (CopyIO or Rename).
void writeAtomic(const std::filesystem::path& src, const std::filesystem::path& dest,
                 std::filesystem::file_time_type mtime);

// ".name.ci-tmp-XXXXXXXX" next to `dest`
std::filesystem::path tempSibling(const std::filesystem::path& dest);

}

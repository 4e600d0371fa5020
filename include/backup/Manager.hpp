#pragma once

#include "concurrency/KeyedMutex.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace ci::config { struct Config; }

namespace ci::backup {

struct BackupError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Owns the history tree: <historyBase>/<YYYYMMDD-HHMMSS>/<path relative to backup root>.
// Safe to call from several copy workers; work on one relative path is serialized.
class Manager {
public:
    explicit Manager(const config::Config& cfg);

    // Moves `destination` into this run's version directory, then prunes that path.
    // Throws BackupError, also when this run already holds a version of the path;
    // on failure the destination is left in place.
    std::filesystem::path versionBeforeOverwrite(const std::filesystem::path& destination);

    // Keeps the newest `keep` versions of `relPath`. Returns how many were removed.
    size_t prune(const std::filesystem::path& relPath);

    // Version directory names holding `relPath`, newest first
    [[nodiscard]] std::vector<std::string> listVersions(const std::filesystem::path& relPath) const;

    // Moves into history every live backup file whose path, or one of whose
    // ancestors, is not among `destinations` (absolute destination paths).
    // A file that cannot be versioned stays where it is.
    size_t cleanupOrphans(const std::unordered_set<std::string>& destinations);

    [[nodiscard]] const std::filesystem::path& backupRoot() const { return backupRoot_; }
    [[nodiscard]] const std::filesystem::path& historyBase() const { return historyBase_; }
    [[nodiscard]] std::filesystem::path historyRoot() const { return historyBase_ / timestamp_; }

private:
    std::filesystem::path backupRoot_;
    std::filesystem::path historyBase_;
    std::string timestamp_;
    unsigned int keep_;
    concurrency::KeyedMutex locks_;

    [[nodiscard]] std::filesystem::path relativeToBackupRoot(const std::filesystem::path& destination) const;
    std::filesystem::path moveIntoHistory(const std::filesystem::path& destination, const std::filesystem::path& rel);
    size_t pruneLocked(const std::filesystem::path& relPath);
    [[nodiscard]] bool inHistory(const std::filesystem::path& path) const;
};

// rename, falling back to copy + remove across filesystems
void movePath(const std::filesystem::path& from, const std::filesystem::path& to);

// Removes empty directories from `dir` upwards, stopping at (and keeping) `stop`
void removeEmptyParents(std::filesystem::path dir, const std::filesystem::path& stop);

}

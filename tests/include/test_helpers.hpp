#pragma once

#include "config/Config.hpp"
#include "vcs/Provider.hpp"
#include "util/timestamp.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace ci::test {

namespace fs = std::filesystem;

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& tag = "ci") {
        std::random_device rd;
        path_ = fs::temp_directory_path() / (tag + "-" + std::to_string(rd()) + "-" + std::to_string(rd()));
        fs::create_directories(path_);
        path_ = fs::canonical(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }
    [[nodiscard]] fs::path operator/(const fs::path& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

inline void writeFile(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline void setMtime(const fs::path& p, const fs::file_time_type t) {
    fs::last_write_time(p, t);
}

inline fs::file_time_type hoursAgo(const int h) {
    return fs::file_time_type::clock::now() - std::chrono::hours(h);
}

// Base config rooted in two temp directories, already validated
inline config::Config makeConfig(const fs::path& searchRoot, const fs::path& backupRoot) {
    config::Config cfg;
    cfg.scan.search_root = searchRoot;
    cfg.copy.backup_root = backupRoot;
    cfg.copy.concurrency = 4;
    cfg.scan.workers = 2;
    cfg.scan.queue_capacity = 16;
    cfg.timestamp = "20240101-120000";
    config::validate(cfg);
    return cfg;
}

// In-memory provider: repositories are registered by absolute root.
class FakeProvider final : public vcs::Provider {
public:
    struct Repo {
        std::vector<fs::path> ignoredFiles;     // relative to the repository root
        std::set<fs::path> ignoredDirs;         // relative, answered by isIgnored
        bool failListing = false;
    };

    Repo& add(const fs::path& root) {
        std::scoped_lock lock(mutex_);
        return repos_[root];
    }

    [[nodiscard]] bool isRepositoryRoot(const fs::path& dir) const override {
        std::scoped_lock lock(mutex_);
        return repos_.contains(dir);
    }

    [[nodiscard]] std::vector<fs::path> listIgnored(const fs::path& repoRoot) const override {
        std::scoped_lock lock(mutex_);
        listCalls.fetch_add(1);
        const auto it = repos_.find(repoRoot);
        if (it == repos_.end()) throw vcs::VcsError("not a repository: " + repoRoot.string());
        if (it->second.failListing) throw vcs::VcsError("listing failed for " + repoRoot.string());
        return it->second.ignoredFiles;
    }

    [[nodiscard]] bool isIgnored(const fs::path& repoRoot, const fs::path& path) const override {
        std::scoped_lock lock(mutex_);
        const auto it = repos_.find(repoRoot);
        if (it == repos_.end()) throw vcs::VcsError("not a repository: " + repoRoot.string());
        return it->second.ignoredDirs.contains(path.lexically_relative(repoRoot));
    }

    mutable std::atomic<size_t> listCalls{0};

private:
    mutable std::mutex mutex_;
    std::map<fs::path, Repo> repos_;
};

}

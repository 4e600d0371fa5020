#include "backup/Manager.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <system_error>

using namespace ci::backup;
using namespace ci::log;
namespace fs = std::filesystem;

namespace ci::backup {

void movePath(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;

    if (ec != std::errc::cross_device_link)
        throw BackupError(fmt::format("rename {} -> {} failed: {}", from.string(), to.string(), ec.message()));

    // different filesystem
    fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove_all(to, cleanup);
        throw BackupError(fmt::format("copy {} -> {} failed: {}", from.string(), to.string(), ec.message()));
    }

    fs::remove_all(from, ec);
    if (ec) throw BackupError(fmt::format("copied {} but could not remove it: {}", from.string(), ec.message()));
}

void removeEmptyParents(fs::path dir, const fs::path& stop) {
    std::error_code ec;
    while (!dir.empty() && dir != stop && util::isUnder(dir, stop)) {
        if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec) || ec) return;
        if (!fs::remove(dir, ec) || ec) return;
        dir = dir.parent_path();
    }
}

}

Manager::Manager(const config::Config& cfg)
    : backupRoot_(cfg.copy.backup_root),
      historyBase_(cfg.historyBase()),
      timestamp_(cfg.timestamp),
      keep_(cfg.backup.keep) {
    if (!util::isVersionStamp(timestamp_))
        throw BackupError(fmt::format("invalid run timestamp '{}'", timestamp_));
    if (keep_ == 0) throw BackupError("keep must be greater than 0");
}

bool Manager::inHistory(const fs::path& path) const {
    return util::isUnder(path, historyBase_);
}

fs::path Manager::relativeToBackupRoot(const fs::path& destination) const {
    auto rel = util::relativeUnder(backupRoot_, destination);
    if (!rel) throw BackupError(fmt::format("{} is not inside the backup root {}", destination.string(), backupRoot_.string()));
    if (inHistory(destination)) throw BackupError(fmt::format("{} is part of the history tree", destination.string()));
    return *rel;
}

fs::path Manager::moveIntoHistory(const fs::path& destination, const fs::path& rel) {
    const auto target = historyRoot() / rel;

    std::error_code ec;
    if (fs::exists(fs::symlink_status(target, ec)))
        throw BackupError(fmt::format("{} already holds a version of {}, keeping the live copy",
                                      historyRoot().string(), rel.string()));

    fs::create_directories(target.parent_path(), ec);
    if (ec) throw BackupError(fmt::format("cannot create {}: {}", target.parent_path().string(), ec.message()));

    movePath(destination, target);
    Registry::backup()->debug("[Manager] Versioned {} -> {}", destination.string(), target.string());
    return target;
}

fs::path Manager::versionBeforeOverwrite(const fs::path& destination) {
    const auto rel = relativeToBackupRoot(destination);
    const auto guard = locks_.lock(rel.generic_string());

    const auto target = moveIntoHistory(destination, rel);
    pruneLocked(rel);
    return target;
}

std::vector<std::string> Manager::listVersions(const fs::path& relPath) const {
    std::vector<std::string> versions;

    std::error_code ec;
    if (!fs::is_directory(historyBase_, ec)) return versions;

    fs::directory_iterator it(historyBase_, ec);
    for (const fs::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (!util::isVersionStamp(name)) continue;

        std::error_code st;
        if (!it->is_directory(st)) continue;
        if (fs::exists(fs::symlink_status(it->path() / relPath, st))) versions.push_back(name);
    }
    if (ec) Registry::backup()->warn("[Manager] Failed to list {}: {}", historyBase_.string(), ec.message());

    std::ranges::sort(versions, std::greater<>());
    return versions;
}

size_t Manager::prune(const fs::path& relPath) {
    const auto guard = locks_.lock(relPath.generic_string());
    return pruneLocked(relPath);
}

size_t Manager::pruneLocked(const fs::path& relPath) {
    const auto versions = listVersions(relPath);
    if (versions.size() <= keep_) return 0;

    size_t removed = 0;
    for (size_t i = keep_; i < versions.size(); ++i) {
        const auto versionDir = historyBase_ / versions[i];
        const auto victim = versionDir / relPath;

        std::error_code ec;
        fs::remove_all(victim, ec);
        if (ec) {
            Registry::backup()->warn("[Manager] Failed to prune {}: {}", victim.string(), ec.message());
            continue;
        }

        removeEmptyParents(victim.parent_path(), versionDir);
        if (fs::is_empty(versionDir, ec) && !ec) fs::remove(versionDir, ec);

        Registry::backup()->debug("[Manager] Pruned {} from {}", relPath.string(), versions[i]);
        ++removed;
    }
    return removed;
}

size_t Manager::cleanupOrphans(const std::unordered_set<std::string>& destinations) {
    const auto covered = [&](const fs::path& file) {
        for (fs::path p = file; util::isUnder(p, backupRoot_) && p != backupRoot_; p = p.parent_path())
            if (destinations.contains(p.string())) return true;
        return false;
    };

    std::vector<fs::path> orphans;
    std::error_code ec;
    fs::recursive_directory_iterator it(backupRoot_, fs::directory_options::skip_permission_denied, ec);
    for (const fs::recursive_directory_iterator end{}; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        std::error_code st;

        if (it->is_directory(st) && !it->is_symlink(st)) {
            if (inHistory(path)) it.disable_recursion_pending();
            continue;
        }
        if (inHistory(path)) continue;
        if (!covered(path)) orphans.push_back(path);
    }
    if (ec) throw BackupError(fmt::format("failed to walk backup root {}: {}", backupRoot_.string(), ec.message()));

    size_t versioned = 0;
    for (const auto& orphan : orphans) {
        try {
            const auto rel = relativeToBackupRoot(orphan);
            const auto guard = locks_.lock(rel.generic_string());
            moveIntoHistory(orphan, rel);
            pruneLocked(rel);
            removeEmptyParents(orphan.parent_path(), backupRoot_);
            Registry::backup()->info("[Manager] Source gone, versioned {}", rel.string());
            ++versioned;
        } catch (const BackupError& e) {
            Registry::backup()->error("[Manager] Orphan cleanup failed for {}: {}", orphan.string(), e.what());
        }
    }
    return versioned;
}

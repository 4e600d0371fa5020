#include "scan/Collector.hpp"
#include "exclude/Excluder.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"
#include "vcs/Provider.hpp"

#include <algorithm>
#include <map>
#include <system_error>

using namespace ci::scan;
using namespace ci::log;
namespace fs = std::filesystem;

Collector::Collector(const vcs::Provider& provider, const exclude::Excluder& excluder, fs::path searchRoot)
    : provider_(provider), excluder_(excluder), searchRoot_(util::normalizeDir(searchRoot)) {}

model::Entry Collector::makeEntry(const fs::path& repoRoot, const fs::path& relToRepo) const {
    model::Entry e;
    e.absolutePath = relToRepo.empty() ? repoRoot : (repoRoot / relToRepo).lexically_normal();
    e.repositoryRoot = repoRoot;
    if (auto rel = util::relativeUnder(searchRoot_, e.absolutePath)) e.relativePath = std::move(*rel);
    return e;
}

std::vector<fs::path> Collector::collapse(std::vector<fs::path> files, const bool collapseRoot) {
    std::map<fs::path, std::vector<fs::path>> byDir;
    for (auto& f : files) byDir[f.parent_path()].push_back(std::move(f));

    std::vector<fs::path> out;
    for (auto& [dir, group] : byDir) {
        if (group.size() >= 2 && (collapseRoot || !dir.empty())) out.push_back(dir);
        else for (auto& f : group) out.push_back(std::move(f));
    }

    // A collapsed directory swallows anything below it, including other collapsed directories
    std::ranges::sort(out);
    std::vector<fs::path> result;
    std::vector<fs::path> dirs;
    for (auto& p : out) {
        const bool covered = std::ranges::any_of(dirs, [&](const fs::path& d) { return p != d && util::isUnder(p, d); });
        if (covered) continue;
        if (byDir.contains(p)) dirs.push_back(p);
        result.push_back(std::move(p));
    }
    return result;
}

size_t Collector::collect(const fs::path& repoRoot, const Sink& sink) const {
    size_t emitted = 0;
    std::vector<fs::path> ignoredDirs;

    // Phase 1: whole top-level directories
    std::vector<fs::path> topDirs;
    for (const auto& child : fs::directory_iterator(repoRoot)) {
        std::error_code ec;
        if (!child.is_directory(ec) || child.is_symlink(ec)) continue;
        if (child.path().filename() == ".git") continue;
        topDirs.push_back(child.path());
    }
    std::ranges::sort(topDirs);

    for (const auto& dir : topDirs) {
        if (excluder_.excludes(dir.string())) continue;

        bool ignored = false;
        try {
            ignored = provider_.isIgnored(repoRoot, dir);
        } catch (const std::exception& e) {
            Registry::scan()->debug("[Collector] Ignore probe failed for {}: {}", dir.string(), e.what());
            continue;
        }
        if (!ignored) continue;

        const auto rel = dir.filename();
        ignoredDirs.push_back(rel);
        auto entry = makeEntry(repoRoot, rel);
        if (entry.relativePath.empty()) continue;
        Registry::scan()->debug("[Collector] Ignored directory {}", entry.relativePath.string());
        if (!sink(std::move(entry))) return emitted;
        ++emitted;
    }

    // Phase 2: individual files
    std::vector<fs::path> files;
    for (auto& rel : provider_.listIgnored(repoRoot)) {
        if (util::hasDotDot(rel) || rel.is_absolute()) continue;

        const bool underIgnoredDir = std::ranges::any_of(ignoredDirs, [&](const fs::path& d) {
            return util::isUnder(rel, d);
        });
        if (underIgnoredDir) continue;

        if (excluder_.excludes((repoRoot / rel).string())) continue;
        files.push_back(std::move(rel));
    }

    // Phase 3: redundancy collapse. A repository sitting at the search root has
    // no relative path of its own, so its top level stays per file.
    const bool collapseRoot = util::normalizeDir(repoRoot) != searchRoot_;
    for (const auto& rel : collapse(std::move(files), collapseRoot)) {
        auto entry = makeEntry(repoRoot, rel);
        if (entry.relativePath.empty()) continue;
        if (!sink(std::move(entry))) return emitted;
        ++emitted;
    }

    return emitted;
}

std::vector<model::Entry> Collector::collect(const fs::path& repoRoot) const {
    std::vector<model::Entry> out;
    collect(repoRoot, [&](model::Entry e) {
        out.push_back(std::move(e));
        return true;
    });
    return out;
}

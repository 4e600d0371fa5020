#include "scan/Locator.hpp"
#include "exclude/Excluder.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"
#include "vcs/Provider.hpp"

#include <algorithm>
#include <deque>
#include <fmt/core.h>
#include <string>
#include <system_error>
#include <unordered_set>

using namespace ci::scan;
using namespace ci::log;
namespace fs = std::filesystem;

namespace {

bool isSkippable(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

// Canonical key for the visited set; falls back to the lexical form for dangling paths
std::string visitKey(const fs::path& dir) {
    std::error_code ec;
    auto canon = fs::canonical(dir, ec);
    if (ec) return dir.lexically_normal().string();
    return canon.string();
}

}

Locator::Locator(const vcs::Provider& provider, const exclude::Excluder* excluder)
    : provider_(provider), excluder_(excluder) {}

void Locator::skip(const fs::path& dir) {
    skip_.push_back(util::normalizeDir(dir));
}

bool Locator::skipped(const fs::path& dir) const {
    return std::ranges::any_of(skip_, [&](const fs::path& s) { return util::isUnder(dir, s); });
}

std::vector<fs::path> Locator::locate(const fs::path& root, const RepoFn& onRepo) const {
    const auto start = util::normalizeDir(root);

    std::error_code ec;
    const auto canonRoot = fs::canonical(start, ec);
    if (ec) throw TraversalError(fmt::format("cannot resolve search root {}: {}", start.string(), ec.message()));

    std::vector<fs::path> repos;
    std::unordered_set<std::string> visited;
    std::deque<fs::path> queue{start};
    size_t dirs = 0;

    while (!queue.empty()) {
        if (interrupt_ && interrupt_->load()) {
            Registry::scan()->debug("[Locator] Interrupted after {} directories", dirs);
            break;
        }

        const fs::path dir = std::move(queue.front());
        queue.pop_front();

        if (!visited.insert(visitKey(dir)).second) continue;
        ++dirs;

        if (progress_) progress_(dir);

        if (provider_.isRepositoryRoot(dir)) {
            if (excluder_ && excluder_->excludes(dir.string())) {
                Registry::scan()->debug("[Locator] Repository excluded: {}", dir.string());
                continue;
            }
            Registry::scan()->debug("[Locator] Repository found: {}", dir.string());
            repos.push_back(dir);
            if (onRepo) onRepo(dir);
            continue;
        }

        std::vector<fs::path> children;
        fs::directory_iterator it(dir, ec);
        for (const fs::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
            std::error_code typeEc;
            const auto& child = it->path();
            if (!it->is_directory(typeEc)) continue;

            if (skipped(child)) {
                Registry::scan()->debug("[Locator] Skipping {}", child.string());
                continue;
            }

            if (it->is_symlink(typeEc)) {
                // symlinked directories are followed only while they stay inside the search root
                const auto target = fs::canonical(child, typeEc);
                if (typeEc || !util::isUnder(target, canonRoot)) {
                    Registry::scan()->debug("[Locator] Not following symlink {}", child.string());
                    continue;
                }
            }

            children.push_back(child);
        }

        if (ec) {
            if (isSkippable(ec)) {
                Registry::scan()->warn("[Locator] Permission denied, skipping {}", dir.string());
                continue;
            }
            if (ec == std::errc::no_such_file_or_directory && dir != start) {
                Registry::scan()->debug("[Locator] Directory vanished during scan: {}", dir.string());
                continue;
            }
            throw TraversalError(fmt::format("failed to list {}: {}", dir.string(), ec.message()));
        }

        std::ranges::sort(children);
        for (auto& c : children) queue.push_back(std::move(c));
    }

    Registry::scan()->debug("[Locator] Visited {} directories, found {} repositories", dirs, repos.size());
    return repos;
}

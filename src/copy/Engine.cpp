#include "copy/Engine.hpp"
#include "backup/Manager.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/Config.hpp"
#include "exclude/Excluder.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fmt/core.h>
#include <random>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace ci::copy;
using namespace ci::log;
using namespace ci::concurrency;
using ci::scan::model::Entry;
namespace fs = std::filesystem;

namespace {

bool isNotFound(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

std::string errnoText() { return std::strerror(errno); }

struct CopyWorkerTask final : Task {
    Engine& engine;
    BoundedQueue<Entry>& entries;
    std::shared_ptr<std::atomic<bool>> interrupt;

    CopyWorkerTask(Engine& e, BoundedQueue<Entry>& q, std::shared_ptr<std::atomic<bool>> flag)
        : engine(e), entries(q), interrupt(std::move(flag)) {}

    void operator()() override {
        while (!interrupt->load()) {
            auto entry = entries.pop();
            if (!entry) return;
            if (interrupt->load()) break;
            engine.copyOne(*entry);
        }
        // producers must not block on a queue nobody drains any more
        entries.close();
    }
};

// fd closed on scope exit
struct Fd {
    int fd = -1;
    explicit Fd(const int f) : fd(f) {}
    ~Fd() { if (fd >= 0) ::close(fd); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    int release() { const int f = fd; fd = -1; return f; }
};

}

namespace ci::copy {

std::string_view to_string(const CopyError::Kind kind) {
    switch (kind) {
        case CopyError::Kind::SourceStat:      return "source-stat";
        case CopyError::Kind::DestinationStat: return "destination-stat";
        case CopyError::Kind::CopyIO:          return "copy-io";
        case CopyError::Kind::Rename:          return "rename";
        case CopyError::Kind::Backup:          return "backup";
    }
    return "unknown";
}

fs::path tempSibling(const fs::path& dest) {
    thread_local std::mt19937 rng{std::random_device{}()};
    return dest.parent_path() / fmt::format(".{}.ci-tmp-{:08x}", dest.filename().string(), rng());
}

void writeAtomic(const fs::path& src, const fs::path& dest, const fs::file_time_type mtime) {
    using Kind = CopyError::Kind;

    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) throw CopyError(Kind::CopyIO, dest, fmt::format("cannot create {}: {}", dest.parent_path().string(), ec.message()));

    Fd in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.fd < 0) throw CopyError(Kind::CopyIO, src, fmt::format("open {}: {}", src.string(), errnoText()));

    struct stat st{};
    if (::fstat(in.fd, &st) != 0) throw CopyError(Kind::CopyIO, src, fmt::format("fstat {}: {}", src.string(), errnoText()));

    const auto tmp = tempSibling(dest);
    Fd out(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, st.st_mode & 07777));
    if (out.fd < 0) throw CopyError(Kind::CopyIO, tmp, fmt::format("create {}: {}", tmp.string(), errnoText()));

    const auto fail = [&](const Kind kind, const std::string& what) {
        if (out.fd >= 0) ::close(out.release());
        ::unlink(tmp.c_str());
        throw CopyError(kind, dest, what);
    };

    char buf[1 << 16];
    while (true) {
        const ssize_t n = ::read(in.fd, buf, sizeof(buf));
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            fail(Kind::CopyIO, fmt::format("read {}: {}", src.string(), errnoText()));
        }
        ssize_t written = 0;
        while (written < n) {
            const ssize_t w = ::write(out.fd, buf + written, static_cast<size_t>(n - written));
            if (w < 0) {
                if (errno == EINTR) continue;
                fail(Kind::CopyIO, fmt::format("write {}: {}", tmp.string(), errnoText()));
            }
            written += w;
        }
    }

    if (::fsync(out.fd) != 0) fail(Kind::CopyIO, fmt::format("fsync {}: {}", tmp.string(), errnoText()));
    if (::close(out.release()) != 0) fail(Kind::CopyIO, fmt::format("close {}: {}", tmp.string(), errnoText()));

    fs::rename(tmp, dest, ec);
    if (ec) fail(Kind::Rename, fmt::format("rename {} -> {}: {}", tmp.string(), dest.string(), ec.message()));

    fs::last_write_time(dest, mtime, ec);
    if (ec) Registry::copy()->warn("[Engine] Could not set modification time on {}: {}", dest.string(), ec.message());
}

}

Engine::Engine(const config::Config& cfg, const exclude::Excluder& excluder, backup::Manager* backups)
    : cfg_(cfg),
      excluder_(excluder),
      backups_(backups),
      backupRoot_(cfg.copy.backup_root),
      historyBase_(cfg.historyBase()),
      dryRun_(cfg.copy.dry_run) {}

Engine::~Engine() {
    if (!pool_) return;
    // never left running on an open queue
    pool_->interrupt();
    if (entries_) entries_->close();
    pool_->stop();
}

void Engine::start(BoundedQueue<Entry>& entries, std::shared_ptr<std::atomic<bool>> interruptFlag) {
    if (pool_) throw std::logic_error("[Engine] Copy workers already started");

    std::error_code ec;
    if (!dryRun_) {
        fs::create_directories(backupRoot_, ec);
        if (ec) throw std::runtime_error(fmt::format("[Engine] Cannot create backup root {}: {}", backupRoot_.string(), ec.message()));
    }

    entries_ = &entries;
    const auto workers = cfg_.copy.concurrency;
    pool_ = std::make_unique<ThreadPool>("copy", interruptFlag, workers, workers);
    for (unsigned int i = 0; i < workers; ++i)
        if (!pool_->submit(std::make_shared<CopyWorkerTask>(*this, entries, pool_->interruptFlag())))
            throw std::runtime_error("[Engine] Copy pool refused a worker");

    Registry::copy()->debug("[Engine] Started {} copy workers into {}", workers, backupRoot_.string());
}

ResultSnapshot Engine::wait() {
    if (pool_) {
        pool_->drain();
        pool_.reset();
        entries_ = nullptr;
    }
    return result_.snapshot();
}

std::unordered_set<std::string> Engine::destinations() const {
    std::scoped_lock lock(seenMutex_);
    return destinations_;
}

std::vector<fs::path> Engine::seen() const {
    std::scoped_lock lock(seenMutex_);
    return seen_;
}

Outcome Engine::copyOne(const Entry& entry) {
    const auto& rel = entry.relativePath;
    if (rel.empty() || rel.is_absolute() || util::hasDotDot(rel)) {
        Registry::copy()->error("[Engine] Refusing entry with unsafe relative path '{}' ({})",
                                rel.string(), entry.absolutePath.string());
        result_.record(Outcome::Error);
        report(entry);
        return Outcome::Error;
    }

    const auto dest = (backupRoot_ / rel).lexically_normal();

    Outcome outcome;
    if (dryRun_) {
        Registry::copy()->debug("[Engine] Would copy {}", rel.string());
        outcome = Outcome::Planned;
    } else {
        const auto guard = destLocks_.lock(dest.string());
        try {
            outcome = copyPath(entry.absolutePath, dest);
        } catch (const CopyError& e) {
            Registry::copy()->error("[Engine] {} failed ({}): {}", rel.string(), to_string(e.kind), e.what());
            outcome = Outcome::Error;
        } catch (const fs::filesystem_error& e) {
            Registry::copy()->error("[Engine] {} failed: {}", rel.string(), e.what());
            outcome = Outcome::Error;
        }
    }

    switch (outcome) {
        case Outcome::Copied:   Registry::copy()->debug("[Engine] Copied {}", rel.string()); break;
        case Outcome::Skipped:  Registry::copy()->debug("[Engine] Skipped {} (backup not older)", rel.string()); break;
        case Outcome::Vanished: Registry::copy()->debug("[Engine] Source vanished: {}", entry.absolutePath.string()); break;
        default: break;
    }

    // a vanished source leaves its backup to orphan cleanup
    if (outcome != Outcome::Vanished) {
        std::scoped_lock lock(seenMutex_);
        destinations_.insert(dest.string());
        seen_.push_back(rel);
    }

    result_.record(outcome);
    report(entry);
    return outcome;
}

void Engine::report(const Entry& entry) {
    if (!progress_) return;
    std::scoped_lock lock(progressMutex_);
    progress_(Progress{result_.snapshot(), entry.absolutePath, backupRoot_ / entry.relativePath});
}

Outcome Engine::copyPath(const fs::path& src, const fs::path& dest) {
    std::error_code ec;
    const auto st = fs::status(src, ec);
    if (ec && !isNotFound(ec))
        throw CopyError(CopyError::Kind::SourceStat, src, fmt::format("stat {}: {}", src.string(), ec.message()));
    if (ec || !fs::exists(st)) return Outcome::Vanished;

    if (fs::is_directory(st)) return copyDirectory(src, dest);

    if (!fs::is_regular_file(st)) {
        Registry::copy()->debug("[Engine] Not a regular file, skipping {}", src.string());
        return Outcome::Skipped;
    }

    const auto srcTime = fs::last_write_time(src, ec);
    if (ec) {
        if (isNotFound(ec)) return Outcome::Vanished;
        throw CopyError(CopyError::Kind::SourceStat, src, fmt::format("mtime {}: {}", src.string(), ec.message()));
    }

    return copyFile(src, dest, srcTime);
}

Outcome Engine::copyFile(const fs::path& src, const fs::path& dest, const fs::file_time_type srcTime) {
    std::error_code ec;
    const auto dst = fs::symlink_status(dest, ec);
    if (ec && !isNotFound(ec))
        throw CopyError(CopyError::Kind::DestinationStat, dest, fmt::format("stat {}: {}", dest.string(), ec.message()));

    if (!ec && fs::exists(dst)) {
        if (fs::is_regular_file(dst)) {
            const auto destTime = fs::last_write_time(dest, ec);
            if (ec) throw CopyError(CopyError::Kind::DestinationStat, dest,
                                    fmt::format("mtime {}: {}", dest.string(), ec.message()));
            if (destTime >= srcTime) return Outcome::Skipped;
        }
        versionExisting(dest);
    }

    writeAtomic(src, dest, srcTime);
    return Outcome::Copied;
}

Outcome Engine::copyDirectory(const fs::path& src, const fs::path& dest) {
    std::error_code ec;
    const auto dst = fs::symlink_status(dest, ec);
    if (ec && !isNotFound(ec))
        throw CopyError(CopyError::Kind::DestinationStat, dest, fmt::format("stat {}: {}", dest.string(), ec.message()));
    if (!ec && fs::exists(dst) && !fs::is_directory(dst)) versionExisting(dest);

    fs::create_directories(dest, ec);
    if (ec) throw CopyError(CopyError::Kind::CopyIO, dest, fmt::format("mkdir {}: {}", dest.string(), ec.message()));

    std::vector<fs::directory_entry> children;
    fs::directory_iterator it(src, ec);
    for (const fs::directory_iterator end{}; !ec && it != end; it.increment(ec)) children.push_back(*it);
    if (ec) {
        if (isNotFound(ec)) return Outcome::Vanished;
        throw CopyError(CopyError::Kind::SourceStat, src, fmt::format("list {}: {}", src.string(), ec.message()));
    }
    std::ranges::sort(children, {}, [](const fs::directory_entry& e) { return e.path(); });

    bool anyCopied = false, anyError = false;
    for (const auto& child : children) {
        const auto& path = child.path();
        if (util::isUnder(path, backupRoot_) || util::isUnder(path, historyBase_)) continue;
        if (path.filename() == ".git") continue;

        if (excluder_.excludes(path.string())) {
            Registry::copy()->debug("[Engine] Excluded {}", path.string());
            continue;
        }

        std::error_code typeEc;
        if (child.is_symlink(typeEc) && child.is_directory(typeEc)) {
            Registry::copy()->debug("[Engine] Not following directory symlink {}", path.string());
            continue;
        }

        try {
            switch (copyPath(path, dest / path.filename())) {
                case Outcome::Copied: anyCopied = true; break;
                case Outcome::Error:  anyError = true; break;
                default: break;
            }
        } catch (const CopyError& e) {
            Registry::copy()->error("[Engine] {} failed ({}): {}", path.string(), to_string(e.kind), e.what());
            anyError = true;
        } catch (const fs::filesystem_error& e) {
            Registry::copy()->error("[Engine] {} failed: {}", path.string(), e.what());
            anyError = true;
        }
    }

    if (anyError) return Outcome::Error;
    return anyCopied ? Outcome::Copied : Outcome::Skipped;
}

void Engine::versionExisting(const fs::path& dest) {
    if (!backups_) {
        std::error_code ec;
        if (fs::is_directory(fs::symlink_status(dest, ec))) fs::remove_all(dest, ec);
        if (ec) throw CopyError(CopyError::Kind::CopyIO, dest, fmt::format("remove {}: {}", dest.string(), ec.message()));
        return;
    }

    try {
        const auto target = backups_->versionBeforeOverwrite(dest);
        Registry::backup()->debug("[Engine] Previous {} kept at {}", dest.string(), target.string());
    } catch (const backup::BackupError& e) {
        throw CopyError(CopyError::Kind::Backup, dest, fmt::format("versioning failed, keeping old copy: {}", e.what()));
    }
}

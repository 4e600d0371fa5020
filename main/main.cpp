#include "cli/CommandLine.hpp"
#include "config/Config.hpp"
#include "copy/ProgressReporter.hpp"
#include "log/Registry.hpp"
#include "runtime/Runner.hpp"
#include "scan/Locator.hpp"
#include "util/cmdLineHelpers.hpp"
#include "vcs/Git.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>
#include <fmt/core.h>

using namespace ci;

namespace {

constexpr int EXIT_CONFIG_INVALID = 1;
constexpr int EXIT_RUN_FAILED = 2;

std::atomic<bool> interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free);

void signalHandler(const int) {
    interrupted.store(true);
}

}

int main(const int argc, char** argv) {
    const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "copy-ignore";

    cli::Invocation inv;
    try {
        std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);
        inv = cli::parseCommandLine(args);
        if (inv.help) {
            std::cout << cli::usage(program);
            return EXIT_SUCCESS;
        }
        config::validate(inv.config);
    } catch (const cli::UsageError& e) {
        std::cerr << fmt::format("{}: {}\n\n{}", program, e.what(), cli::usage(program));
        return EXIT_CONFIG_INVALID;
    } catch (const config::ConfigError& e) {
        std::cerr << fmt::format("{}: {}\n", program, e.what());
        return EXIT_CONFIG_INVALID;
    }

    const auto& cfg = inv.config;

    try {
        log::Registry::init(cfg.logging);
    } catch (const std::exception& e) {
        std::cerr << fmt::format("{}: cannot initialize logging: {}\n", program, e.what());
        return EXIT_CONFIG_INVALID;
    }

    int rc = EXIT_SUCCESS;
    try {
        const vcs::Git git;
        // non-owning: the flag has static storage so the handler can write it directly
        runtime::Runner runner(cfg, git, std::shared_ptr<std::atomic<bool>>(std::shared_ptr<void>(), &interrupted));

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        const bool tty = util::is_tty();
        std::mutex outMutex;
        bool scanLineOpen = false;

        std::cout << fmt::format("scanning {}\n", cfg.scan.search_root.string());
        if (tty) {
            runner.setScanProgress([&](const std::filesystem::path& dir) {
                std::scoped_lock lock(outMutex);
                std::cout << util::status_line("scanning: ", dir.string(), static_cast<size_t>(util::term_width()))
                          << std::flush;
                scanLineOpen = true;
            });
        }

        copy::ProgressReporter reporter(std::cout, std::chrono::milliseconds(500), tty);
        if (!cfg.copy.dry_run) {
            std::cout << fmt::format("copying to {}\n", cfg.copy.backup_root.string());
            runner.setCopyProgress([&](const copy::Progress& p) {
                std::scoped_lock lock(outMutex);
                if (scanLineOpen) {
                    std::cout << '\n';
                    scanLineOpen = false;
                }
                reporter.report(p);
            });
        }

        const auto summary = runner.run();

        std::scoped_lock lock(outMutex);
        if (scanLineOpen) std::cout << '\n';

        if (summary.dry_run) {
            std::cout << fmt::format("found {} ignored entries to back up\n", summary.planned.size());
            if (cfg.verbose)
                for (const auto& rel : summary.planned) std::cout << "  " << rel.string() << '\n';
        } else {
            reporter.finish(summary.copy);
            if (summary.orphans_versioned > 0)
                std::cout << fmt::format("{} backups without a source were moved to history\n", summary.orphans_versioned);
        }

        if (summary.interrupted) {
            log::Registry::app()->warn("[main] Run interrupted");
            rc = EXIT_RUN_FAILED;
        }
    } catch (const scan::TraversalError& e) {
        log::Registry::app()->error("[main] Scan aborted: {}", e.what());
        rc = EXIT_RUN_FAILED;
    } catch (const std::exception& e) {
        log::Registry::app()->error("[main] Fatal error: {}", e.what());
        rc = EXIT_RUN_FAILED;
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    log::Registry::shutdown();
    return rc;
}

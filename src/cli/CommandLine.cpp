#include "cli/CommandLine.hpp"

#include <charconv>
#include <fmt/core.h>

namespace ci::cli {

namespace {

unsigned int parseCount(const std::string& key, const std::string& text) {
    unsigned int value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last)
        throw UsageError(fmt::format("option --{} expects a non-negative integer, got '{}'", key, text));
    return value;
}

}

const OptionSpec& optionSpec() {
    static const OptionSpec spec{
        .switches = {"dry-run", "verbose", "no-cleanup", "help"},
        .valued = {"concurrency", "scan-workers", "backup-keep", "history-subdir", "history-dir",
                   "config", "log-dir", "report"},
        .repeatable = {"exclude"},
        .aliases = {{"v", "verbose"}, {"h", "help"}, {"n", "dry-run"}, {"e", "exclude"}, {"j", "concurrency"}},
    };
    return spec;
}

std::string usage(const std::string_view program) {
    return fmt::format(
        "Usage: {} [options] <search-root> <backup-root>\n"
        "\n"
        "Copies files ignored by git in every repository under <search-root> into\n"
        "<backup-root>, keeping their relative layout and versioning what gets replaced.\n"
        "\n"
        "Options:\n"
        "  -e, --exclude PATTERN     skip matching paths (repeatable; absolute prefix or glob)\n"
        "  -n, --dry-run             list what would be copied, write nothing\n"
        "  -j, --concurrency N       copy workers (default 8)\n"
        "      --scan-workers N      repository scan workers (default: CPU count)\n"
        "      --backup-keep N       versions kept per path (default 3)\n"
        "      --history-subdir NAME history directory inside <backup-root> (default copy-ignore-history)\n"
        "      --history-dir PATH    history directory anywhere else\n"
        "      --no-cleanup          keep backups whose source is gone\n"
        "      --config FILE         YAML configuration, overridden by the command line\n"
        "      --log-dir DIR         also log to DIR/copy-ignore.log\n"
        "      --report FILE         write a JSON run report\n"
        "  -v, --verbose             log every copy, skip and exclude decision\n"
        "  -h, --help                show this help\n"
        "\n"
        "Examples:\n"
        "  {} --exclude '*.log' --exclude /home/me/src/huge ~/src /mnt/backup\n"
        "  {} --backup-keep 5 --history-subdir old ~/src /mnt/backup\n",
        program, program, program);
}

Invocation parseCommandLine(const std::vector<std::string>& args) {
    const auto call = parseTokens(tokenize(args), optionSpec());

    Invocation inv;
    if (call.has("help")) {
        inv.help = true;
        return inv;
    }

    auto& cfg = inv.config;
    if (const auto file = call.value("config")) cfg = config::loadConfig(*file);

    if (call.positionals.size() == 2) {
        cfg.scan.search_root = call.positionals[0];
        cfg.copy.backup_root = call.positionals[1];
    } else if (!call.positionals.empty() || cfg.scan.search_root.empty() || cfg.copy.backup_root.empty()) {
        throw UsageError(fmt::format("expected <search-root> <backup-root>, got {} positional argument(s)",
                                     call.positionals.size()));
    }

    for (auto& pattern : call.values("exclude")) cfg.scan.excludes.push_back(std::move(pattern));

    if (call.has("dry-run")) cfg.copy.dry_run = true;
    if (call.has("verbose")) cfg.verbose = true;
    if (call.has("no-cleanup")) cfg.backup.cleanup_orphans = false;

    if (const auto v = call.value("concurrency")) cfg.copy.concurrency = parseCount("concurrency", *v);
    if (const auto v = call.value("scan-workers")) cfg.scan.workers = parseCount("scan-workers", *v);
    if (const auto v = call.value("backup-keep")) cfg.backup.keep = parseCount("backup-keep", *v);
    if (const auto v = call.value("history-subdir")) cfg.backup.history_subdir = *v;
    if (const auto v = call.value("history-dir"); v && !v->empty()) cfg.backup.history_dir = *v;
    if (const auto v = call.value("log-dir")) cfg.logging.log_dir = *v;
    if (const auto v = call.value("report")) cfg.report_path = *v;

    return inv;
}

}

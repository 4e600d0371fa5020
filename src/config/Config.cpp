#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/fsPath.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <thread>
#include <system_error>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace ci::config {

void LoggingConfig::makeVerbose() {
    levels.console_log_level = spdlog::level::debug;
    auto& sub = levels.subsystem_levels;
    sub.app = sub.scan = sub.vcs = sub.copy = sub.backup = sub.exclude = spdlog::level::debug;
}

unsigned int Config::scanWorkers() const {
    if (scan.workers > 0) return scan.workers;
    return std::max(std::thread::hardware_concurrency(), 1u);
}

fs::path Config::historyBase() const {
    if (backup.history_dir) return *backup.history_dir;
    return copy.backup_root / backup.history_subdir;
}

fs::path Config::historyRoot() const {
    return historyBase() / timestamp;
}

Config loadConfig(const fs::path& path) {
    Config cfg;

    try {
        const YAML::Node root = YAML::LoadFile(path.string());

        const auto section = [&]<typename T>(const char* key, T& out) {
            const auto node = root[key];
            if (node && !YAML::convert<T>::decode(node, out))
                throw ConfigError(fmt::format("failed to load config '{}': '{}' must be a mapping", path.string(), key));
        };

        section("scan", cfg.scan);
        section("copy", cfg.copy);
        section("backup", cfg.backup);
        section("logging", cfg.logging);
        if (auto node = root["verbose"]) cfg.verbose = node.as<bool>();
        if (auto node = root["report"]) cfg.report_path = node.as<fs::path>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("failed to load config '{}': {}", path.string(), e.what()));
    }

    return cfg;
}

void validate(Config& cfg) {
    if (cfg.scan.search_root.empty()) throw ConfigError("search root is required");
    if (cfg.copy.backup_root.empty()) throw ConfigError("backup root is required");

    std::error_code ec;
    if (!fs::exists(cfg.scan.search_root, ec))
        throw ConfigError(fmt::format("search root does not exist: {}", cfg.scan.search_root.string()));
    if (!fs::is_directory(cfg.scan.search_root, ec))
        throw ConfigError(fmt::format("search root is not a directory: {}", cfg.scan.search_root.string()));

    if (!fs::exists(cfg.copy.backup_root, ec)) {
        if (!fs::create_directories(cfg.copy.backup_root, ec) && ec)
            throw ConfigError(fmt::format("failed to create backup root {}: {}",
                                          cfg.copy.backup_root.string(), ec.message()));
    } else if (!fs::is_directory(cfg.copy.backup_root, ec)) {
        throw ConfigError(fmt::format("backup root is not a directory: {}", cfg.copy.backup_root.string()));
    }

    if (cfg.copy.concurrency == 0) throw ConfigError("concurrency must be greater than 0");
    if (cfg.backup.keep == 0) throw ConfigError("backup keep count must be greater than 0");
    if (cfg.scan.queue_capacity == 0) throw ConfigError("queue capacity must be greater than 0");
    if (cfg.backup.history_subdir.empty() && !cfg.backup.history_dir)
        throw ConfigError("history subdirectory name cannot be empty");

    cfg.scan.search_root = util::normalizeDir(cfg.scan.search_root);
    cfg.copy.backup_root = util::normalizeDir(cfg.copy.backup_root);
    if (cfg.backup.history_dir) cfg.backup.history_dir = util::normalizeDir(*cfg.backup.history_dir);

    if (cfg.scan.search_root == cfg.copy.backup_root)
        throw ConfigError("backup root must differ from the search root");

    if (cfg.timestamp.empty()) cfg.timestamp = util::runTimestamp();
    if (cfg.verbose) cfg.logging.makeVerbose();
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"search_root", c.scan.search_root.string()},
        {"backup_root", c.copy.backup_root.string()},
        {"history_root", c.historyRoot().string()},
        {"excludes", c.scan.excludes},
        {"concurrency", c.copy.concurrency},
        {"scan_workers", c.scanWorkers()},
        {"keep", c.backup.keep},
        {"dry_run", c.copy.dry_run},
        {"timestamp", c.timestamp}
    };
}

}

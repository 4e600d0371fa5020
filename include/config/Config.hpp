#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ci::config {

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ScanConfig {
    std::filesystem::path search_root;
    std::vector<std::string> excludes;
    unsigned int workers = 0;                // 0 = std::thread::hardware_concurrency()
    unsigned int queue_capacity = 10000;     // discovered entries buffered between scan and copy
};

struct CopyConfig {
    std::filesystem::path backup_root;
    unsigned int concurrency = 8;
    bool dry_run = false;
};

struct BackupConfig {
    unsigned int keep = 3;
    std::string history_subdir = "copy-ignore-history";
    std::optional<std::filesystem::path> history_dir;
    bool cleanup_orphans = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum app     = spdlog::level::info;   // Run start/finish, summaries
    spdlog::level::level_enum scan    = spdlog::level::info;   // Per-repository timing, traversal failures
    spdlog::level::level_enum vcs     = spdlog::level::warn;   // git invocation failures
    spdlog::level::level_enum copy    = spdlog::level::warn;   // Per-entry copy failures
    spdlog::level::level_enum backup  = spdlog::level::info;   // Versioning and pruning
    spdlog::level::level_enum exclude = spdlog::level::warn;   // Dropped patterns
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
    std::optional<std::filesystem::path> log_dir;

    // Every decision goes to the console when set
    void makeVerbose();
};

struct Config {
    ScanConfig scan;
    CopyConfig copy;
    BackupConfig backup;
    LoggingConfig logging;

    bool verbose = false;
    std::optional<std::filesystem::path> report_path;

    // Generated once per run, shared by every version directory of the run
    std::string timestamp;

    [[nodiscard]] unsigned int scanWorkers() const;

    // <history root>/<timestamp> for this run
    [[nodiscard]] std::filesystem::path historyRoot() const;
    [[nodiscard]] std::filesystem::path historyBase() const;
};

Config loadConfig(const std::filesystem::path& path);

// Normalizes roots, creates the backup root and rejects unusable settings.
void validate(Config& cfg);

void to_json(nlohmann::json& j, const Config& c);

}

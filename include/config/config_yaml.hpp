#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ci::config;

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = std::filesystem::path(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<ScanConfig> {
    static Node encode(const ScanConfig& rhs) {
        Node node;
        node["search_root"] = rhs.search_root;
        node["excludes"] = rhs.excludes;
        node["workers"] = rhs.workers;
        node["queue_capacity"] = rhs.queue_capacity;
        return node;
    }

    static bool decode(const Node& node, ScanConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["search_root"]) rhs.search_root = node["search_root"].as<std::filesystem::path>();
        if (node["excludes"]) rhs.excludes = node["excludes"].as<std::vector<std::string>>();
        rhs.workers = node["workers"].as<unsigned int>(0);
        rhs.queue_capacity = node["queue_capacity"].as<unsigned int>(10000);
        return true;
    }
};

template<>
struct convert<CopyConfig> {
    static Node encode(const CopyConfig& rhs) {
        Node node;
        node["backup_root"] = rhs.backup_root;
        node["concurrency"] = rhs.concurrency;
        node["dry_run"] = rhs.dry_run;
        return node;
    }

    static bool decode(const Node& node, CopyConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["backup_root"]) rhs.backup_root = node["backup_root"].as<std::filesystem::path>();
        rhs.concurrency = node["concurrency"].as<unsigned int>(8);
        rhs.dry_run = node["dry_run"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<BackupConfig> {
    static Node encode(const BackupConfig& rhs) {
        Node node;
        node["keep"] = rhs.keep;
        node["history_subdir"] = rhs.history_subdir;
        if (rhs.history_dir) node["history_dir"] = *rhs.history_dir;
        node["cleanup_orphans"] = rhs.cleanup_orphans;
        return node;
    }

    static bool decode(const Node& node, BackupConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.keep = node["keep"].as<unsigned int>(3);
        rhs.history_subdir = node["history_subdir"].as<std::string>("copy-ignore-history");
        if (node["history_dir"]) rhs.history_dir = node["history_dir"].as<std::filesystem::path>();
        rhs.cleanup_orphans = node["cleanup_orphans"].as<bool>(true);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["app"]     = to_std_string(spdlog::level::to_string_view(rhs.app));
        node["scan"]    = to_std_string(spdlog::level::to_string_view(rhs.scan));
        node["vcs"]     = to_std_string(spdlog::level::to_string_view(rhs.vcs));
        node["copy"]    = to_std_string(spdlog::level::to_string_view(rhs.copy));
        node["backup"]  = to_std_string(spdlog::level::to_string_view(rhs.backup));
        node["exclude"] = to_std_string(spdlog::level::to_string_view(rhs.exclude));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.app = spdlog::level::from_str(node["app"].as<std::string>("info"));
        rhs.scan = spdlog::level::from_str(node["scan"].as<std::string>("info"));
        rhs.vcs = spdlog::level::from_str(node["vcs"].as<std::string>("warn"));
        rhs.copy = spdlog::level::from_str(node["copy"].as<std::string>("warn"));
        rhs.backup = spdlog::level::from_str(node["backup"].as<std::string>("info"));
        rhs.exclude = spdlog::level::from_str(node["exclude"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_levels"] = rhs.levels;
        if (rhs.log_dir) node["log_dir"] = *rhs.log_dir;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        if (node["log_dir"]) rhs.log_dir = node["log_dir"].as<std::filesystem::path>();
        return true;
    }
};

} // namespace YAML

#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace ci::config {
struct LoggingConfig;
}

namespace ci::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> app()     { return get("copy-ignore"); }
    static std::shared_ptr<spdlog::logger> scan()    { return get("scan"); }
    static std::shared_ptr<spdlog::logger> vcs()     { return get("vcs"); }
    static std::shared_ptr<spdlog::logger> copy()    { return get("copy"); }
    static std::shared_ptr<spdlog::logger> backup()  { return get("backup"); }
    static std::shared_ptr<spdlog::logger> exclude() { return get("exclude"); }

    [[nodiscard]] static bool isInitialized();

    // Flush and drop every registered logger; init() may be called again afterwards.
    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}

#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace osync::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const std::filesystem::path& logDir, const config::LoggingConfig& cnf = {});

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> orcasync() { return get("orcasync"); }
    static std::shared_ptr<spdlog::logger> config()   { return get("config"); }
    static std::shared_ptr<spdlog::logger> snapshot() { return get("snapshot"); }
    static std::shared_ptr<spdlog::logger> baseline() { return get("baseline"); }
    static std::shared_ptr<spdlog::logger> sync()     { return get("sync"); }
    static std::shared_ptr<spdlog::logger> vcs()      { return get("vcs"); }
    static std::shared_ptr<spdlog::logger> shell()    { return get("shell"); }

    [[nodiscard]] static bool isInitialized();

    // Lowers (or raises) what reaches the terminal, e.g. for --verbose.
    static void setConsoleLevel(spdlog::level::level_enum level);

    // Drops every registered logger so init() can run again (tests).
    static void shutdown();

    [[nodiscard]] static const std::filesystem::path& mainLogPath() { return main_log_path_; }

private:
    static constexpr const char* SUBSYSTEMS[] = {"orcasync", "config", "snapshot", "baseline", "sync", "vcs", "shell"};
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 5 * 1024 * 1024; // 5 MiB
    static inline size_t main_max_files_ = 3;
};

}

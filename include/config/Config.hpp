#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace osync::config {

struct GitConfig {
    std::string executable = "git";
    std::string remote;   // empty = git's configured upstream
    std::string branch;
    std::string default_commit_message = "Sync OrcaSlicer profiles";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum orcasync = spdlog::level::info;   // Startup, command dispatch
    spdlog::level::level_enum config   = spdlog::level::info;   // Config creation and resolution
    spdlog::level::level_enum snapshot = spdlog::level::info;   // Tree scans
    spdlog::level::level_enum baseline = spdlog::level::info;   // State file load/save
    spdlog::level::level_enum sync     = spdlog::level::info;   // Copies, deletions, conflicts
    spdlog::level::level_enum vcs      = spdlog::level::info;   // git invocations
    spdlog::level::level_enum shell    = spdlog::level::info;   // Argument parsing and routing
};

struct LoggingConfig {
    std::string log_dir;  // empty = <repo>/.orcasync/logs
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    std::string local_orca_dir;
    std::string local_scope_subdir = "user/default";
    std::vector<std::string> sync_folders = {"filament", "machine", "process"};
    std::string repo_mirror_dir = "./profiles";
    std::vector<std::string> exclude_substrings = {
        "/cache/", "/Cache/", "/logs/", "/Logs/", ".DS_Store", "Thumbs.db", ".lock"
    };
    bool use_mtime_cache = true;

    GitConfig git;
    LoggingConfig logging;

    // Throws sync::ConfigError describing the first invalid field.
    void validate() const;

    void save(const std::filesystem::path& path) const;
};

// Defaults with the platform's OrcaSlicer directory filled in.
Config defaultConfig();

// Parses an existing file. Throws sync::ConfigError on unreadable or invalid YAML.
Config loadConfig(const std::filesystem::path& path);

// Loads the config, first writing the defaults if the file does not exist yet.
// Sets `created` when a new file was written.
Config loadOrCreateConfig(const std::filesystem::path& path, bool* created = nullptr);

spdlog::level::level_enum parseLogLevel(const std::string& name);

}

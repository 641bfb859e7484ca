#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace osync::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static std::string levelName(const spdlog::level::level_enum lvl) {
    return to_std_string(spdlog::level::to_string_view(lvl));
}

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return parseLogLevel(node.as<std::string>());
}

template<>
struct convert<GitConfig> {
    static Node encode(const GitConfig& rhs) {
        Node node;
        node["executable"] = rhs.executable;
        node["remote"] = rhs.remote;
        node["branch"] = rhs.branch;
        node["default_commit_message"] = rhs.default_commit_message;
        return node;
    }

    static bool decode(const Node& node, GitConfig& rhs) {
        if (!node.IsMap()) return false;
        const GitConfig def;
        rhs.executable = node["executable"].as<std::string>(def.executable);
        rhs.remote = node["remote"].as<std::string>(def.remote);
        rhs.branch = node["branch"].as<std::string>(def.branch);
        rhs.default_commit_message = node["default_commit_message"].as<std::string>(def.default_commit_message);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["orcasync"] = levelName(rhs.orcasync);
        node["config"]   = levelName(rhs.config);
        node["snapshot"] = levelName(rhs.snapshot);
        node["baseline"] = levelName(rhs.baseline);
        node["sync"]     = levelName(rhs.sync);
        node["vcs"]      = levelName(rhs.vcs);
        node["shell"]    = levelName(rhs.shell);
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.orcasync = levelOr(node["orcasync"], def.orcasync);
        rhs.config   = levelOr(node["config"], def.config);
        rhs.snapshot = levelOr(node["snapshot"], def.snapshot);
        rhs.baseline = levelOr(node["baseline"], def.baseline);
        rhs.sync     = levelOr(node["sync"], def.sync);
        rhs.vcs      = levelOr(node["vcs"], def.vcs);
        rhs.shell    = levelOr(node["shell"], def.shell);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir;
        node["console_log_level"] = levelName(rhs.console_log_level);
        node["file_log_level"] = levelName(rhs.file_log_level);
        node["subsystem_levels"] = convert<SubsystemLogLevelsConfig>::encode(rhs.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        const LoggingConfig def;
        rhs.log_dir = node["log_dir"].as<std::string>(def.log_dir);
        rhs.console_log_level = levelOr(node["console_log_level"], def.console_log_level);
        rhs.file_log_level = levelOr(node["file_log_level"], def.file_log_level);
        if (const auto sub = node["subsystem_levels"])
            if (!convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels)) return false;
        return true;
    }
};

template<>
struct convert<Config> {
    static Node encode(const Config& rhs) {
        Node node;
        node["local_orca_dir"] = rhs.local_orca_dir;
        node["local_scope_subdir"] = rhs.local_scope_subdir;
        node["sync_folders"] = rhs.sync_folders;
        node["repo_mirror_dir"] = rhs.repo_mirror_dir;
        node["exclude_substrings"] = rhs.exclude_substrings;
        node["use_mtime_cache"] = rhs.use_mtime_cache;
        node["git"] = convert<GitConfig>::encode(rhs.git);
        node["logging"] = convert<LoggingConfig>::encode(rhs.logging);
        return node;
    }

    static bool decode(const Node& node, Config& rhs) {
        if (!node.IsMap()) return false;
        const auto def = defaultConfig();
        rhs.local_orca_dir = node["local_orca_dir"].as<std::string>(def.local_orca_dir);
        rhs.local_scope_subdir = node["local_scope_subdir"].as<std::string>(def.local_scope_subdir);
        rhs.sync_folders = node["sync_folders"].as<std::vector<std::string>>(def.sync_folders);
        rhs.repo_mirror_dir = node["repo_mirror_dir"].as<std::string>(def.repo_mirror_dir);
        rhs.exclude_substrings = node["exclude_substrings"].as<std::vector<std::string>>(def.exclude_substrings);
        rhs.use_mtime_cache = node["use_mtime_cache"].as<bool>(def.use_mtime_cache);
        if (const auto git = node["git"])
            if (!convert<GitConfig>::decode(git, rhs.git)) return false;
        if (const auto logging = node["logging"])
            if (!convert<LoggingConfig>::decode(logging, rhs.logging)) return false;
        return true;
    }
};

}

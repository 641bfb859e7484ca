#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/paths.hpp"
#include "sync/errors.hpp"

#include <yaml-cpp/yaml.h>
#include <fmt/core.h>
#include <array>
#include <fstream>

namespace osync::config {

using sync::ConfigError;

namespace {

constexpr const auto* CONFIG_HEADER =
    "# orcasync configuration\n"
    "#\n"
    "# local_orca_dir      OrcaSlicer data directory on this machine (~, $VAR and %VAR% are expanded)\n"
    "# local_scope_subdir  subdirectory of local_orca_dir that is synced\n"
    "# sync_folders        folders under the scope that are synced, nothing else is touched\n"
    "# repo_mirror_dir     git-tracked mirror, relative to the repository root or absolute\n"
    "# exclude_substrings  relative paths containing any of these are ignored\n\n";

void requireSingleComponent(const std::string& folder) {
    if (folder.empty() || folder == "." || folder == ".." ||
        folder.find('/') != std::string::npos || folder.find('\\') != std::string::npos)
        throw ConfigError(fmt::format("sync_folders entry '{}' must be a single folder name", folder));
}

}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    static constexpr std::array names = {"trace", "debug", "info", "warning", "warn", "error", "err", "critical", "off"};
    for (const auto* n : names)
        if (name == n) return spdlog::level::from_str(name);
    throw ConfigError(fmt::format("Unknown log level '{}'", name));
}

void Config::validate() const {
    if (local_orca_dir.empty()) throw ConfigError("local_orca_dir must not be empty");
    if (repo_mirror_dir.empty()) throw ConfigError("repo_mirror_dir must not be empty");
    if (sync_folders.empty()) throw ConfigError("sync_folders must list at least one folder");
    for (const auto& folder : sync_folders) requireSingleComponent(folder);

    const std::filesystem::path scope(local_scope_subdir);
    if (scope.is_absolute())
        throw ConfigError(fmt::format("local_scope_subdir '{}' must be relative to local_orca_dir", local_scope_subdir));
    for (const auto& part : scope)
        if (part == "..")
            throw ConfigError(fmt::format("local_scope_subdir '{}' must not contain '..'", local_scope_subdir));

    if (git.executable.empty()) throw ConfigError("git.executable must not be empty");
    if (!git.branch.empty() && git.remote.empty())
        throw ConfigError("git.branch requires git.remote to be set");
}

void Config::save(const std::filesystem::path& path) const {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) throw ConfigError(fmt::format("Failed to create config directory {}: {}",
                                          path.parent_path().string(), ec.message()));

    YAML::Emitter out;
    out << YAML::convert<Config>::encode(*this);

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) throw ConfigError("Failed to write config file: " + path.string());
    file << CONFIG_HEADER << out.c_str() << '\n';
    if (!file) throw ConfigError("Failed to write config file: " + path.string());
}

Config defaultConfig() {
    Config cfg;
    cfg.local_orca_dir = paths::defaultOrcaDir();
    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Failed to parse config {}: {}", path.string(), e.what()));
    }

    auto cfg = defaultConfig();
    if (!root.IsNull()) {
        try {
            if (!YAML::convert<Config>::decode(root, cfg))
                throw ConfigError(fmt::format("Config {} must be a YAML mapping", path.string()));
        } catch (const YAML::Exception& e) {
            throw ConfigError(fmt::format("Invalid value in config {}: {}", path.string(), e.what()));
        }
    }

    cfg.validate();
    return cfg;
}

Config loadOrCreateConfig(const std::filesystem::path& path, bool* created) {
    if (created) *created = false;

    if (!std::filesystem::exists(path)) {
        defaultConfig().save(path);
        if (created) *created = true;
    }

    return loadConfig(path);
}

}

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace osync::paths {

namespace fs = std::filesystem;

inline constexpr const auto* APP_DIR_NAME = ".orcasync";
inline constexpr const auto* CONFIG_FILE_NAME = "config.yaml";
inline constexpr const auto* STATE_FILE_NAME = "state.json";
inline constexpr const auto* LOG_DIR_NAME = "logs";
inline constexpr const auto* REPO_ENV_VAR = "ORCASYNC_REPO";

// --repo override, then $ORCASYNC_REPO, then the working directory.
fs::path resolveRepoRoot(const std::optional<std::string>& override = std::nullopt);

inline fs::path appDir(const fs::path& repoRoot) { return repoRoot / APP_DIR_NAME; }
inline fs::path configPath(const fs::path& repoRoot) { return appDir(repoRoot) / CONFIG_FILE_NAME; }
inline fs::path statePath(const fs::path& repoRoot) { return appDir(repoRoot) / STATE_FILE_NAME; }
inline fs::path defaultLogDir(const fs::path& repoRoot) { return appDir(repoRoot) / LOG_DIR_NAME; }

// Best-effort OrcaSlicer data directory for the build platform, unexpanded.
std::string defaultOrcaDir();

// Expands %VAR%, ~ and $VAR / ${VAR}, then anchors relative results at `base`
// and normalizes. Unknown variables are left as written.
fs::path expandPath(const std::string& raw, const fs::path& base);

}

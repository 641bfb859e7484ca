#pragma once

#include "config/Config.hpp"

#include <filesystem>

namespace osync::sync {

class Scanner;
class BaselineStore;

// Everything one invocation needs, resolved once up front and passed to each
// operation explicitly.
struct Context {
    config::Config config;

    std::filesystem::path repo_root;
    std::filesystem::path config_path;
    std::filesystem::path state_path;

    std::filesystem::path local_base_dir;  // expanded local_orca_dir
    std::filesystem::path scope_dir;       // local_base_dir / local_scope_subdir
    std::filesystem::path mirror_dir;

    // Resolves and validates paths. Throws ConfigError when the mirror overlaps
    // the local scope or the .orcasync directory, or would cover the repository itself.
    static Context resolve(const std::filesystem::path& repoRoot,
                           config::Config cfg,
                           const std::filesystem::path& configPath);

    [[nodiscard]] Scanner scanner() const;
    [[nodiscard]] BaselineStore baselineStore() const;
};

// True when `inner` equals `outer` or lies below it (lexically).
bool isWithin(const std::filesystem::path& outer, const std::filesystem::path& inner);

}

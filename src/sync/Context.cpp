#include "sync/Context.hpp"
#include "sync/Scanner.hpp"
#include "sync/BaselineStore.hpp"
#include "sync/errors.hpp"
#include "config/paths.hpp"

#include <fmt/core.h>

using namespace osync::sync;

namespace fs = std::filesystem;

bool osync::sync::isWithin(const fs::path& outer, const fs::path& inner) {
    const auto o = outer.lexically_normal();
    const auto i = inner.lexically_normal();

    auto oit = o.begin();
    auto iit = i.begin();
    for (; oit != o.end(); ++oit, ++iit) {
        if (oit->empty()) continue;  // trailing separator
        if (iit == i.end() || *oit != *iit) return false;
    }
    return true;
}

Context Context::resolve(const fs::path& repoRoot, config::Config cfg, const fs::path& configPath) {
    cfg.validate();

    Context ctx;
    ctx.repo_root = repoRoot;
    ctx.config_path = configPath;
    ctx.state_path = paths::statePath(repoRoot);
    ctx.local_base_dir = paths::expandPath(cfg.local_orca_dir, repoRoot);
    ctx.scope_dir = fs::weakly_canonical(ctx.local_base_dir / cfg.local_scope_subdir);
    ctx.mirror_dir = paths::expandPath(cfg.repo_mirror_dir, repoRoot);
    ctx.config = std::move(cfg);

    if (isWithin(ctx.mirror_dir, ctx.scope_dir) || isWithin(ctx.scope_dir, ctx.mirror_dir))
        throw ConfigError(fmt::format("Mirror directory {} and local scope {} overlap",
                                      ctx.mirror_dir.string(), ctx.scope_dir.string()),
                          "point repo_mirror_dir at a directory outside the OrcaSlicer folder");

    if (isWithin(ctx.mirror_dir, ctx.repo_root))
        throw ConfigError(fmt::format("Mirror directory {} would contain the repository root {}",
                                      ctx.mirror_dir.string(), ctx.repo_root.string()),
                          "use a subdirectory such as ./profiles for repo_mirror_dir");

    const auto appDir = fs::weakly_canonical(paths::appDir(ctx.repo_root));
    if (isWithin(ctx.mirror_dir, appDir) || isWithin(appDir, ctx.mirror_dir))
        throw ConfigError(fmt::format("Mirror directory {} overlaps the tool directory {}",
                                      ctx.mirror_dir.string(), appDir.string()),
                          "use a subdirectory such as ./profiles for repo_mirror_dir");

    return ctx;
}

Scanner Context::scanner() const {
    return Scanner(config.sync_folders, config.exclude_substrings, config.use_mtime_cache);
}

BaselineStore Context::baselineStore() const {
    return BaselineStore(state_path);
}

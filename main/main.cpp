#include "config/Config.hpp"
#include "config/paths.hpp"
#include "crypto/util/hash.hpp"
#include "logging/LogRegistry.hpp"
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/commands.hpp"
#include "shell/util/argsHelpers.hpp"
#include "sync/Context.hpp"
#include "sync/Orchestrator.hpp"
#include "sync/errors.hpp"
#include "vcs/GitClient.hpp"

#include <fmt/core.h>
#include <cstdio>
#include <string>
#include <vector>

using namespace osync;
using namespace osync::shell;
using namespace osync::logging;

namespace {

const ParserSpec ARGS_SPEC{
    .valueFlags = {"repo", "config", "message"},
    .shortFlags = {{"m", "message"}, {"v", "verbose"}, {"h", "help"}},
    .globalFlags = {"repo", "config", "verbose", "help"},
};

int emit(const CommandResult& res) {
    if (!res.stdout_text.empty()) fmt::print(stdout, "{}", res.stdout_text);
    if (!res.stderr_text.empty()) fmt::print(stderr, "{}", res.stderr_text);
    return res.exit_code;
}

int run(const CommandCall& call) {
    const auto repoRoot = paths::resolveRepoRoot(globalVal(call, "repo"));
    const std::filesystem::path configPath = globalVal(call, "config")
        ? paths::expandPath(*globalVal(call, "config"), repoRoot)
        : paths::configPath(repoRoot);

    bool created = false;
    auto cfg = config::loadOrCreateConfig(configPath, &created);

    crypto::hash::init();

    const auto logDir = cfg.logging.log_dir.empty()
        ? paths::defaultLogDir(repoRoot)
        : paths::expandPath(cfg.logging.log_dir, repoRoot);
    LogRegistry::init(logDir, cfg.logging);
    if (hasGlobal(call, "verbose")) LogRegistry::setConsoleLevel(spdlog::level::debug);

    if (created) {
        LogRegistry::config()->info("[main] Wrote default config to {}", configPath.string());
        fmt::print(stderr, "Created default config at {}; review local_orca_dir before pushing.\n", configPath.string());
    }

    const auto ctx = sync::Context::resolve(repoRoot, std::move(cfg), configPath);
    vcs::GitClient git(ctx.repo_root, ctx.mirror_dir, ctx.config.git);
    sync::Orchestrator orch(ctx, git);

    Router router;
    registerAllCommands(router, orch, ctx);

    fmt::print("{}\n", renderLocations(ctx));

    LogRegistry::orcasync()->info("[main] Running '{}' in {}", call.name, ctx.repo_root.string());
    const auto res = router.execute(call);
    LogRegistry::orcasync()->info("[main] '{}' finished with exit code {}", call.name, res.exit_code);
    return emit(res);
}

}

int main(const int argc, char** argv) {
    CommandCall call;
    try {
        call = parseArgs(std::vector<std::string>(argv + 1, argv + argc), ARGS_SPEC);
    } catch (const std::invalid_argument& e) {
        return emit(invalid(fmt::format("{}\n\n{}", e.what(), Router::renderUsage(commandUsages()))));
    }

    if (call.name.empty() || call.name == "help" || hasGlobal(call, "help"))
        return emit({call.name.empty() && !hasGlobal(call, "help") ? EXIT_CONFIG : EXIT_OK,
                     Router::renderUsage(commandUsages()), ""});

    int code = EXIT_OK;
    try {
        code = run(call);
    } catch (const sync::SyncError& e) {
        if (LogRegistry::isInitialized()) LogRegistry::orcasync()->error("[main] {}", e.what());
        code = emit(failure(e));
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::orcasync()->critical("[main] Unexpected error: {}", e.what());
        fmt::print(stderr, "internal error: {}\n", e.what());
        if (LogRegistry::isInitialized()) fmt::print(stderr, "details in {}\n", LogRegistry::mainLogPath().string());
        code = EXIT_INTERNAL;
    }

    if (LogRegistry::isInitialized()) LogRegistry::shutdown();
    return code;
}

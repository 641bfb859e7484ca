#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/Parser.hpp"
#include "shell/util/argsHelpers.hpp"
#include "sync/Orchestrator.hpp"
#include "sync/Context.hpp"

#include <fmt/core.h>
#include <stdexcept>

using namespace osync::sync;
using namespace osync::sync::model;

namespace osync::shell {

namespace {

CommandUsage usageFor(const std::string& name) {
    for (const auto& u : commandUsages()) if (u.name == name) return u;
    throw std::logic_error("No usage registered for '" + name + "'");
}

std::string renderStatus(const StatusReport& r) {
    const auto& c = r.changes;
    std::string out = fmt::format("files: {} local, {} mirror, {} in baseline\n",
                                  r.local_files, r.mirror_files, r.baseline_files);

    for (const auto type : {ChangeType::LocalOnlyChanged, ChangeType::MirrorOnlyChanged, ChangeType::Added,
                            ChangeType::Deleted, ChangeType::Conflict, ChangeType::Unchanged})
        out += fmt::format("  {:<15} {}\n", toString(type), c.count(type));

    if (c.pending() == 0) return out + "Everything is in sync.\n";

    for (const auto type : {ChangeType::LocalOnlyChanged, ChangeType::MirrorOnlyChanged, ChangeType::Added}) {
        const auto paths = c.paths(type);
        if (paths.empty()) continue;
        out += fmt::format("{}:\n{}", toString(type), listPaths(paths));
    }

    if (c.hasConflicts()) {
        const auto conflicts = c.conflicts();
        out += fmt::format("conflicts ({}):\n{}", conflicts.size(), listPaths(conflicts));
        out += "push is blocked until the conflicts are resolved\n";
    }
    return out;
}

}

const std::vector<CommandUsage>& commandUsages() {
    static const std::vector<CommandUsage> usages = {
        {"status", {"st"}, "status", "Show differences between local, mirror and baseline", {}},
        {"push", {}, "push [-m|--message <msg>]", "Copy local changes into the mirror, commit and push", {"message"}},
        {"pull", {}, "pull", "Fetch and rebase the mirror from the remote", {}},
        {"apply", {}, "apply [--prune]", "Overwrite local profiles with the mirror (destructive)", {"prune"}},
        {"wipe-profiles", {"wipe"}, "wipe-profiles --yes [--reset-baseline]",
         "Delete every file in the mirror directory", {"yes", "reset-baseline"}},
        {"help", {}, "help", "Show this help", {}},
    };
    return usages;
}

void registerStatusCommand(Router& r, Orchestrator& orch) {
    r.registerCommand(usageFor("status"),
                      [&orch](const CommandCall&) { return ok(renderStatus(orch.status())); });
}

void registerPushCommand(Router& r, Orchestrator& orch, const Context& ctx) {
    r.registerCommand(usageFor("push"),
                      [&orch, &ctx](const CommandCall& call) {
                          auto message = optVal(call, "message").value_or("");
                          if (message.empty()) message = ctx.config.git.default_commit_message;

                          const auto report = orch.push(message);
                          auto out = fmt::format("push: {} copied, {} removed in the mirror\n",
                                                 report.copied.size(), report.removed.size());
                          out += listPaths(report.copied);
                          if (report.left_for_apply)
                              out += fmt::format("{} mirror-side change(s) left for apply\n", report.left_for_apply);
                          return ok(std::move(out));
                      });
}

void registerPullCommand(Router& r, Orchestrator& orch) {
    r.registerCommand(usageFor("pull"),
                      [&orch](const CommandCall&) {
                          orch.pull();
                          return ok("pull: mirror updated; run apply to copy it into OrcaSlicer\n");
                      });
}

void registerApplyCommand(Router& r, Orchestrator& orch) {
    r.registerCommand(usageFor("apply"),
                      [&orch](const CommandCall& call) {
                          const bool prune = hasFlag(call, "prune");
                          const auto report = orch.apply(prune);

                          CommandResult res = ok(fmt::format("apply: {} copied, {} removed locally\n",
                                                             report.copied.size(), report.removed.size()));
                          res.stderr_text = prune
                              ? "warning: local profiles were overwritten and files missing from the mirror were deleted\n"
                              : "warning: local profiles were overwritten by the mirror\n";
                          return res;
                      });
}

void registerWipeCommand(Router& r, Orchestrator& orch) {
    r.registerCommand(usageFor("wipe-profiles"),
                      [&orch](const CommandCall& call) {
                          const auto report = orch.wipeProfiles(hasFlag(call, "yes"), hasFlag(call, "reset-baseline"));
                          auto out = fmt::format("wipe-profiles: removed {} entries from the mirror\n", report.removed);
                          if (report.baseline_reset) out += "baseline cleared; the next push republishes every local file\n";
                          else out += "baseline kept; use --reset-baseline to republish local files on the next push\n";
                          return ok(std::move(out));
                      });
}

void registerHelpCommand(Router& r) {
    r.registerCommand(usageFor("help"),
                      [&r](const CommandCall&) { return ok(r.usageText()); });
}

std::string renderLocations(const Context& ctx) {
    return fmt::format("Local OrcaSlicer dir: {}\n"
                       "Local scope:          {}\n"
                       "Mirror:               {}\n"
                       "Baseline state:       {}\n"
                       "Config:               {}\n",
                       ctx.local_base_dir.string(), ctx.scope_dir.string(), ctx.mirror_dir.string(),
                       ctx.state_path.string(), ctx.config_path.string());
}

}

#pragma once

#include "shell/types.hpp"

#include <string>
#include <vector>

namespace osync::sync {
class Orchestrator;
struct Context;
}

namespace osync::shell {

class Router;

void registerStatusCommand(Router& r, sync::Orchestrator& orch);
void registerPushCommand(Router& r, sync::Orchestrator& orch, const sync::Context& ctx);
void registerPullCommand(Router& r, sync::Orchestrator& orch);
void registerApplyCommand(Router& r, sync::Orchestrator& orch);
void registerWipeCommand(Router& r, sync::Orchestrator& orch);
void registerHelpCommand(Router& r);

inline void registerAllCommands(Router& r, sync::Orchestrator& orch, const sync::Context& ctx) {
    registerStatusCommand(r, orch);
    registerPushCommand(r, orch, ctx);
    registerPullCommand(r, orch);
    registerApplyCommand(r, orch);
    registerWipeCommand(r, orch);
    registerHelpCommand(r);
}

// Every command the CLI knows, in help order.
const std::vector<CommandUsage>& commandUsages();

// Absolute storage locations, printed before any command runs.
std::string renderLocations(const sync::Context& ctx);

}

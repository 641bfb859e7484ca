#pragma once

#include "shell/types.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace osync::shell {

class Router {
public:
    void registerCommand(CommandUsage usage, CommandHandler handler);

    // Dispatches to the handler registered for the call's name or alias.
    // SyncErrors raised by the handler come back as a failed CommandResult.
    CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] std::string usageText() const;

    static std::string renderUsage(const std::vector<CommandUsage>& usages);

private:
    struct CommandInfo {
        CommandUsage usage;
        CommandHandler handler;
    };

    std::map<std::string, CommandInfo> commands_;              // ordered for help output
    std::unordered_map<std::string, std::string> aliasMap_;    // alias -> canonical

    std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

}

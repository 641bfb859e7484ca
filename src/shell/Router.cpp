#include "shell/Router.hpp"
#include "shell/util/argsHelpers.hpp"
#include "sync/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <cctype>

using namespace osync::shell;
using namespace osync::logging;

void Router::registerCommand(CommandUsage usage, CommandHandler handler) {
    const auto key = normalize(usage.name);

    for (const auto& alias : usage.aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            LogRegistry::shell()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                       a, aliasMap_.at(a), key);
            continue;
        }
        aliasMap_[a] = key;
        LogRegistry::shell()->debug("[Router] Alias '{}' mapped to '{}'", a, key);
    }

    commands_[key] = CommandInfo{std::move(usage), std::move(handler)};
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    auto n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n;
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty()) return invalid("No command provided.\n\n" + usageText());

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical)) {
        LogRegistry::shell()->warn("[Router] Unknown command or alias: {}", call.name);
        return invalid(fmt::format("Unknown command: {}\n\n{}", call.name, usageText()));
    }

    const auto& info = commands_.at(canonical);

    for (const auto& [key, value] : call.options) {
        if (std::ranges::find(info.usage.flags, key) != info.usage.flags.end()) continue;
        return invalid(fmt::format("Unknown option '{}' for {}\nusage: orcasync {}\n", key, canonical, info.usage.synopsis));
    }
    if (!call.positionals.empty())
        return invalid(fmt::format("Unexpected argument '{}' for {}\nusage: orcasync {}\n",
                                   call.positionals.front(), canonical, info.usage.synopsis));

    LogRegistry::shell()->debug("[Router] Executing command: '{}'", canonical);

    try {
        return info.handler(call);
    } catch (const sync::SyncError& e) {
        LogRegistry::shell()->error("[Router] {} failed: {}", canonical, e.what());
        return failure(e);
    }
}

std::string Router::usageText() const {
    std::vector<CommandUsage> usages;
    usages.reserve(commands_.size());
    for (const auto& [name, info] : commands_) usages.push_back(info.usage);
    return renderUsage(usages);
}

std::string Router::renderUsage(const std::vector<CommandUsage>& usages) {
    std::size_t width = 0;
    for (const auto& u : usages) width = std::max(width, u.synopsis.size());

    std::string out = "usage: orcasync [--repo <dir>] [--config <file>] [-v|--verbose] <command> [options]\n\ncommands:\n";
    for (const auto& u : usages) {
        out += fmt::format("  {:<{}}  {}", u.synopsis, width, u.description);
        if (!u.aliases.empty()) {
            std::string aliases;
            for (const auto& a : u.aliases) aliases += (aliases.empty() ? "" : ", ") + a;
            out += fmt::format(" (aliases: {})", aliases);
        }
        out += '\n';
    }
    out += "\nexit codes: 0 ok, 1 conflict, 2 config or usage, 3 filesystem, 4 git\n";
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

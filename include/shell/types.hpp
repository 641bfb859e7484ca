#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace osync::shell {

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_CONFLICT = 1,
    EXIT_CONFIG = 2,        // also usage errors
    EXIT_FILESYSTEM = 3,
    EXIT_VCS = 4,
    EXIT_INTERNAL = 70,
};

struct FlagKV {
    std::string key;                    // canonical, no leading dashes
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;        // command options, in order given
    std::vector<FlagKV> globals;        // options given before the command name
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = EXIT_OK;
    std::string stdout_text;
    std::string stderr_text;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandUsage {
    std::string name;
    std::vector<std::string> aliases;
    std::string synopsis;               // e.g. "push [-m|--message <msg>]"
    std::string description;
    std::vector<std::string> flags;     // accepted option keys
};

}

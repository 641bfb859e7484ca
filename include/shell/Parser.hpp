#pragma once

#include "shell/types.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace osync::shell {

struct ParserSpec {
    std::set<std::string> valueFlags;               // keys that consume the next argument
    std::map<std::string, std::string> shortFlags;  // "m" -> "message"
    std::set<std::string> globalFlags;              // kept as globals wherever they appear
};

// Upsert a flag (last wins)
void setOpt(std::vector<FlagKV>& opts, const std::string& key, const std::optional<std::string>& val);

// Splits argv (without the program name) into global options, the command name,
// command options and positionals. Keys in globalFlags are globals even after
// the command name. Supports --key value, --key=value, -k value
// and "--" to end option parsing. Throws std::invalid_argument when a value flag
// has no value.
CommandCall parseArgs(const std::vector<std::string>& args, const ParserSpec& spec);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasGlobal(const CommandCall& c, const std::string& key);
std::optional<std::string> globalVal(const CommandCall& c, const std::string& key);

}

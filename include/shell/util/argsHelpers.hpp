#pragma once

#include "shell/types.hpp"

#include <string>
#include <vector>

namespace osync::sync {
class SyncError;
}

namespace osync::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);

// Error text, affected paths and the next action, with the mapped exit code.
CommandResult failure(const sync::SyncError& e);

int exitCodeFor(const sync::SyncError& e);

// One path per line, capped at `limit` followed by "... and N more".
std::string listPaths(const std::vector<std::string>& paths, std::size_t limit = 25, const std::string& indent = "  ");

}

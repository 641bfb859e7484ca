#include "sync/errors.hpp"

#include <fmt/core.h>

using namespace osync::sync;

ConflictError::ConflictError(std::vector<std::string> paths)
    : SyncError(fmt::format("{} conflicting file(s) changed on both sides since the last sync", paths.size())),
      paths_(std::move(paths)) {}

FilesystemError::FilesystemError(const std::string& what, std::string path, std::vector<std::string> succeeded)
    : SyncError(what), path_(std::move(path)), succeeded_(std::move(succeeded)) {}

VersionControlError::VersionControlError(std::string command, const int exitCode, std::string output)
    : SyncError(fmt::format("'{}' failed with exit code {}", command, exitCode)),
      command_(std::move(command)),
      exitCode_(exitCode),
      output_(std::move(output)) {}

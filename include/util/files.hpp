#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace osync::util {

std::string readFileToString(const std::filesystem::path& path);

void writeFile(const std::filesystem::path& path, const std::string& content);

// Copies src over dst (creating parent directories) and carries the
// modification time across so the hash cache stays warm on both sides.
// A symlink at dst is replaced by the file, its target is never written.
void copyFilePreservingMtime(const std::filesystem::path& src, const std::filesystem::path& dst);

// Throws if a directory between root and root/rel is a symlink.
void requireNoSymlinkParents(const std::filesystem::path& root, const std::string& rel);

// Removes root/rel if present, then removes parent directories that became
// empty, stopping at root.
void removeFileAndPruneParents(const std::filesystem::path& root, const std::string& rel);

// Deletes every entry inside dir except those named in `keep`, leaving dir
// itself in place. Returns the number of top-level entries removed.
std::size_t clearDirectory(const std::filesystem::path& dir, const std::vector<std::string>& keep = {});

}

#pragma once

#include "sync/model/Snapshot.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace osync::sync {

namespace fs = std::filesystem;

// Builds content fingerprints for the allow-listed folders of a tree.
class Scanner {
public:
    struct Stats {
        std::size_t hashed = 0;
        std::size_t cached = 0;
        std::size_t skipped = 0;   // symlinks, sockets, excluded paths
    };

    explicit Scanner(std::vector<std::string> allowedFolders,
                     std::vector<std::string> excludes = {},
                     bool useMtimeCache = true);

    // A missing root or folder contributes nothing. When `hint` holds the same
    // path with equal size and mtime its hash is reused instead of re-reading.
    // Throws FilesystemError if a directory cannot be listed or a file cannot be read.
    [[nodiscard]] model::Snapshot scan(const fs::path& root, const model::Snapshot* hint = nullptr) const;

    [[nodiscard]] bool isExcluded(const std::string& rel) const;

    [[nodiscard]] const std::vector<std::string>& allowedFolders() const { return allowedFolders_; }
    [[nodiscard]] const Stats& lastStats() const { return stats_; }

    // POSIX-style key of `file` relative to `root`.
    [[nodiscard]] static std::string relativeKey(const fs::path& root, const fs::path& file);

    [[nodiscard]] static std::int64_t mtimeOf(const fs::path& file);

private:
    std::vector<std::string> allowedFolders_;
    std::vector<std::string> excludes_;
    bool useMtimeCache_;
    mutable Stats stats_;

    void scanFolder(const fs::path& root, const fs::path& folder,
                    const model::Snapshot* hint, model::Snapshot& out) const;
};

}

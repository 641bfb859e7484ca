#pragma once

#include "sync/model/Snapshot.hpp"

#include <filesystem>

namespace osync::sync {

// Persists the last-synced snapshot as JSON. Saves go through a temp file and a
// rename, so the previous baseline survives any failed or interrupted save.
class BaselineStore {
public:
    static constexpr int FORMAT_VERSION = 1;

    explicit BaselineStore(std::filesystem::path statePath);

    // Empty snapshot when no state file exists yet. Throws ConfigError if the
    // file exists but cannot be parsed.
    [[nodiscard]] model::Snapshot load() const;

    // Throws FilesystemError; the old file is left untouched on failure.
    void save(const model::Snapshot& baseline) const;

    [[nodiscard]] bool exists() const;
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;

    [[nodiscard]] std::filesystem::path tempPath() const;
};

}

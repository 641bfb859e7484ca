#pragma once

#include "sync/model/ChangeSet.hpp"
#include "sync/model/Snapshot.hpp"

#include <optional>
#include <string>

namespace osync::sync {

// Three-way classification of local and mirror against the last-synced baseline.
// Pure: the result depends only on the three snapshots.
struct ConflictDetector {
    [[nodiscard]] static model::ChangeSet classify(const model::Snapshot& local,
                                                   const model::Snapshot& mirror,
                                                   const model::Snapshot& baseline);

    // Classification of a single path from its three (optional) hashes.
    [[nodiscard]] static model::ChangeType classify(const std::optional<std::string>& local,
                                                    const std::optional<std::string>& mirror,
                                                    const std::optional<std::string>& baseline);
};

}

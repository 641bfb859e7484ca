#include "sync/ConflictDetector.hpp"

#include <set>

using namespace osync::sync;
using namespace osync::sync::model;

ChangeType ConflictDetector::classify(const std::optional<std::string>& local,
                                      const std::optional<std::string>& mirror,
                                      const std::optional<std::string>& baseline) {
    // nullopt is a value of its own here: a deletion is a change
    const bool localChanged = local != baseline;
    const bool mirrorChanged = mirror != baseline;

    if (!local && !mirror) return ChangeType::Deleted;
    if (localChanged && mirrorChanged && local != mirror) return ChangeType::Conflict;
    if (local == mirror) return ChangeType::Unchanged;
    if (!baseline) return ChangeType::Added;
    if (localChanged) return ChangeType::LocalOnlyChanged;
    return ChangeType::MirrorOnlyChanged;
}

ChangeSet ConflictDetector::classify(const Snapshot& local, const Snapshot& mirror, const Snapshot& baseline) {
    std::set<std::string> all;
    for (const auto& [path, _] : local) all.insert(path);
    for (const auto& [path, _] : mirror) all.insert(path);
    for (const auto& [path, _] : baseline) all.insert(path);

    ChangeSet changes;
    for (const auto& path : all) {
        Change c;
        c.path = path;
        c.local = local.hashOf(path);
        c.mirror = mirror.hashOf(path);
        c.baseline = baseline.hashOf(path);
        c.type = classify(c.local, c.mirror, c.baseline);
        changes.add(std::move(c));
    }

    return changes;
}

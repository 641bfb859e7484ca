#include "sync/model/ChangeSet.hpp"

#include <algorithm>

using namespace osync::sync::model;

std::string osync::sync::model::toString(const ChangeType type) {
    switch (type) {
        case ChangeType::Unchanged: return "unchanged";
        case ChangeType::LocalOnlyChanged: return "local-changed";
        case ChangeType::MirrorOnlyChanged: return "mirror-changed";
        case ChangeType::Conflict: return "conflict";
        case ChangeType::Added: return "added";
        case ChangeType::Deleted: return "deleted";
    }

    return "unknown";
}

bool Change::flowsToMirror() const {
    return type == ChangeType::LocalOnlyChanged || (type == ChangeType::Added && inLocal());
}

bool Change::flowsToLocal() const {
    return type == ChangeType::MirrorOnlyChanged || (type == ChangeType::Added && inMirror());
}

void ChangeSet::add(Change change) {
    auto key = change.path;
    changes_.insert_or_assign(std::move(key), std::move(change));
}

const Change* ChangeSet::find(const std::string& path) const {
    const auto it = changes_.find(path);
    return it == changes_.end() ? nullptr : &it->second;
}

std::size_t ChangeSet::count(const ChangeType type) const {
    return static_cast<std::size_t>(std::count_if(changes_.begin(), changes_.end(),
        [type](const auto& kv) { return kv.second.type == type; }));
}

std::vector<std::string> ChangeSet::paths(const ChangeType type) const {
    std::vector<std::string> out;
    for (const auto& [path, change] : changes_)
        if (change.type == type) out.push_back(path);
    return out;
}

std::size_t ChangeSet::pending() const {
    return changes_.size() - count(ChangeType::Unchanged);
}

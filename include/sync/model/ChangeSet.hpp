#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace osync::sync::model {

enum class ChangeType {
    Unchanged,
    LocalOnlyChanged,
    MirrorOnlyChanged,
    Conflict,
    Added,
    Deleted,
};

std::string toString(ChangeType type);

struct Change {
    std::string path;
    ChangeType type{ChangeType::Unchanged};

    // Hash on each side; nullopt when the file is absent there.
    std::optional<std::string> local, mirror, baseline;

    [[nodiscard]] bool inLocal() const { return local.has_value(); }
    [[nodiscard]] bool inMirror() const { return mirror.has_value(); }
    [[nodiscard]] bool inBaseline() const { return baseline.has_value(); }

    // True for changes whose local side must be written to the mirror.
    [[nodiscard]] bool flowsToMirror() const;

    // True for changes that originate on the mirror side only.
    [[nodiscard]] bool flowsToLocal() const;

    friend bool operator==(const Change&, const Change&) = default;
};

class ChangeSet {
public:
    using Map = std::map<std::string, Change>;

    void add(Change change);

    [[nodiscard]] const Change* find(const std::string& path) const;
    [[nodiscard]] std::size_t count(ChangeType type) const;
    [[nodiscard]] std::vector<std::string> paths(ChangeType type) const;

    [[nodiscard]] std::vector<std::string> conflicts() const { return paths(ChangeType::Conflict); }
    [[nodiscard]] bool hasConflicts() const { return count(ChangeType::Conflict) > 0; }

    // Everything except Unchanged.
    [[nodiscard]] std::size_t pending() const;

    [[nodiscard]] std::size_t size() const { return changes_.size(); }
    [[nodiscard]] bool empty() const { return changes_.empty(); }

    [[nodiscard]] Map::const_iterator begin() const { return changes_.begin(); }
    [[nodiscard]] Map::const_iterator end() const { return changes_.end(); }

    friend bool operator==(const ChangeSet&, const ChangeSet&) = default;

private:
    Map changes_;
};

}

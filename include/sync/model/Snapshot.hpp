#pragma once

#include "sync/model/Fingerprint.hpp"

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace osync::sync::model {

// relative path -> fingerprint. Ordered so iteration and serialization are deterministic.
class Snapshot {
public:
    using Map = std::map<std::string, Fingerprint>;

    void insert(Fingerprint fp);
    void erase(const std::string& path) { files_.erase(path); }
    void clear() { files_.clear(); }

    [[nodiscard]] const Fingerprint* find(const std::string& path) const;
    [[nodiscard]] std::optional<std::string> hashOf(const std::string& path) const;
    [[nodiscard]] bool contains(const std::string& path) const { return files_.contains(path); }

    [[nodiscard]] std::size_t size() const { return files_.size(); }
    [[nodiscard]] bool empty() const { return files_.empty(); }

    [[nodiscard]] Map::const_iterator begin() const { return files_.begin(); }
    [[nodiscard]] Map::const_iterator end() const { return files_.end(); }

    friend bool operator==(const Snapshot&, const Snapshot&) = default;

private:
    Map files_;
};

void to_json(nlohmann::json& j, const Snapshot& snapshot);
void from_json(const nlohmann::json& j, Snapshot& snapshot);

}

#include "sync/model/Snapshot.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace osync::sync::model;

void Snapshot::insert(Fingerprint fp) {
    auto key = fp.path;
    files_.insert_or_assign(std::move(key), std::move(fp));
}

const Fingerprint* Snapshot::find(const std::string& path) const {
    const auto it = files_.find(path);
    return it == files_.end() ? nullptr : &it->second;
}

std::optional<std::string> Snapshot::hashOf(const std::string& path) const {
    if (const auto* fp = find(path)) return fp->hash;
    return std::nullopt;
}

void osync::sync::model::to_json(nlohmann::json& j, const Snapshot& snapshot) {
    j = nlohmann::json::object();
    for (const auto& [path, fp] : snapshot) j[path] = fp;
}

void osync::sync::model::from_json(const nlohmann::json& j, Snapshot& snapshot) {
    if (!j.is_object()) throw std::invalid_argument("Snapshot must be a JSON object keyed by relative path");

    snapshot.clear();
    for (const auto& [path, value] : j.items()) {
        auto fp = value.get<Fingerprint>();
        fp.path = path;
        snapshot.insert(std::move(fp));
    }
}

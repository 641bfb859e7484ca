#include "sync/model/Fingerprint.hpp"

#include <nlohmann/json.hpp>

using namespace osync::sync::model;

void osync::sync::model::to_json(nlohmann::json& j, const Fingerprint& fp) {
    j = {
        {"hash", fp.hash},
        {"size", fp.size},
        {"mtime", fp.mtime}
    };
}

void osync::sync::model::from_json(const nlohmann::json& j, Fingerprint& fp) {
    // Legacy state files stored the bare hash string.
    if (j.is_string()) {
        fp.hash = j.get<std::string>();
        fp.size = 0;
        fp.mtime = 0;
        return;
    }

    j.at("hash").get_to(fp.hash);
    fp.size = j.value("size", static_cast<std::uintmax_t>(0));
    fp.mtime = j.value("mtime", static_cast<std::int64_t>(0));
}

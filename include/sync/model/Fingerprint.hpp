#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace osync::sync::model {

struct Fingerprint {
    std::string path;   // POSIX-style, relative to the scanned root; first component is a sync folder
    std::string hash;   // lowercase hex SHA-256
    std::uintmax_t size{};
    std::int64_t mtime{};  // file clock ticks (ns); only used by the hash cache

    friend bool operator==(const Fingerprint&, const Fingerprint&) = default;
};

// The path is the owning map key and is not serialized.
void to_json(nlohmann::json& j, const Fingerprint& fp);
void from_json(const nlohmann::json& j, Fingerprint& fp);

}

#include "sync/BaselineStore.hpp"
#include "sync/errors.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>

using namespace osync::sync;
using namespace osync::sync::model;
using namespace osync::logging;
using json = nlohmann::json;

namespace fs = std::filesystem;

BaselineStore::BaselineStore(fs::path statePath) : path_(std::move(statePath)) {}

bool BaselineStore::exists() const {
    std::error_code ec;
    return fs::is_regular_file(path_, ec);
}

fs::path BaselineStore::tempPath() const {
    auto tmp = path_;
    tmp += ".tmp";
    return tmp;
}

Snapshot BaselineStore::load() const {
    if (!exists()) {
        LogRegistry::baseline()->debug("[BaselineStore] No baseline at {}, starting empty", path_.string());
        return {};
    }

    std::string raw;
    try {
        raw = util::readFileToString(path_);
    } catch (const std::exception& e) {
        throw FilesystemError(e.what(), path_.string());
    }

    Snapshot baseline;
    try {
        const auto payload = json::parse(raw);
        if (!payload.is_object()) throw std::invalid_argument("top level is not an object");

        if (payload.contains("files")) {
            const auto version = payload.value("version", FORMAT_VERSION);
            if (version > FORMAT_VERSION)
                throw std::invalid_argument(fmt::format("unsupported format version {}", version));
            payload.at("files").get_to(baseline);
        } else if (payload.contains("hashes")) {
            payload.at("hashes").get_to(baseline);
        } else if (!payload.empty()) {
            throw std::invalid_argument("neither 'files' nor 'hashes' present");
        }
    } catch (const std::exception& e) {
        throw ConfigError(fmt::format("Baseline state file {} is unreadable: {}", path_.string(), e.what()),
                          "inspect or remove the state file, then re-run status");
    }

    LogRegistry::baseline()->debug("[BaselineStore] Loaded {} entries from {}", baseline.size(), path_.string());
    return baseline;
}

void BaselineStore::save(const Snapshot& baseline) const {
    const json payload = {
        {"version", FORMAT_VERSION},
        {"files", baseline}
    };

    const auto tmp = tempPath();
    try {
        if (path_.has_parent_path()) fs::create_directories(path_.parent_path());
        util::writeFile(tmp, payload.dump(2) + "\n");
        fs::rename(tmp, path_);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        LogRegistry::baseline()->error("[BaselineStore] Failed to save baseline {}: {}", path_.string(), e.what());
        throw FilesystemError(fmt::format("Failed to save baseline: {}", e.what()), path_.string());
    }

    LogRegistry::baseline()->info("[BaselineStore] Saved {} entries to {}", baseline.size(), path_.string());
}

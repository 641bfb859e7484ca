#include "shell/util/argsHelpers.hpp"
#include "sync/errors.hpp"

#include <fmt/core.h>
#include <algorithm>

using namespace osync::sync;

namespace osync::shell {

CommandResult invalid(std::string msg) { return {EXIT_CONFIG, "", std::move(msg)}; }
CommandResult ok(std::string out) { return {EXIT_OK, std::move(out), ""}; }

int exitCodeFor(const SyncError& e) {
    if (dynamic_cast<const ConflictError*>(&e)) return EXIT_CONFLICT;
    if (dynamic_cast<const FilesystemError*>(&e)) return EXIT_FILESYSTEM;
    if (dynamic_cast<const VersionControlError*>(&e)) return EXIT_VCS;
    return EXIT_CONFIG;
}

std::string listPaths(const std::vector<std::string>& paths, const std::size_t limit, const std::string& indent) {
    std::string out;
    const auto shown = std::min(paths.size(), limit);
    for (std::size_t i = 0; i < shown; ++i) out += fmt::format("{}{}\n", indent, paths[i]);
    if (paths.size() > shown) out += fmt::format("{}... and {} more\n", indent, paths.size() - shown);
    return out;
}

CommandResult failure(const SyncError& e) {
    std::string err = fmt::format("error: {}\n", e.what());

    if (const auto* c = dynamic_cast<const ConflictError*>(&e)) {
        err += fmt::format("conflicting paths ({}):\n", c->paths().size());
        err += listPaths(c->paths());
    } else if (const auto* f = dynamic_cast<const FilesystemError*>(&e)) {
        if (!f->succeeded().empty()) {
            err += fmt::format("completed before the failure ({}):\n", f->succeeded().size());
            err += listPaths(f->succeeded());
        }
        if (!f->path().empty()) err += fmt::format("failed: {}\n", f->path());
    } else if (const auto* v = dynamic_cast<const VersionControlError*>(&e)) {
        if (!v->output().empty()) err += fmt::format("git output:\n{}\n", v->output());
    }

    err += fmt::format("next: {}\n", e.nextAction());
    return {exitCodeFor(e), "", std::move(err)};
}

}

#include "sync/Orchestrator.hpp"
#include "sync/ConflictDetector.hpp"
#include "sync/errors.hpp"
#include "vcs/VersionControl.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <fmt/core.h>

using namespace osync::sync;
using namespace osync::sync::model;
using namespace osync::logging;

namespace fs = std::filesystem;

namespace {

void ensureDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw FilesystemError(fmt::format("Failed to create {}: {}", dir.string(), ec.message()), dir.string());
}

}

Orchestrator::Orchestrator(const Context& ctx, vcs::VersionControl& vcs)
    : ctx_(ctx), vcs_(vcs), scanner_(ctx.scanner()), store_(ctx.baselineStore()) {}

Orchestrator::Classified Orchestrator::classifyAll() const {
    Classified c;
    c.baseline = store_.load();
    c.local = scanner_.scan(ctx_.scope_dir, &c.baseline);
    c.mirror = scanner_.scan(ctx_.mirror_dir, &c.baseline);
    c.changes = ConflictDetector::classify(c.local, c.mirror, c.baseline);
    return c;
}

StatusReport Orchestrator::status() const {
    auto [local, mirror, baseline, changes] = classifyAll();

    LogRegistry::sync()->info("[Orchestrator] status: {} pending, {} conflict(s)",
                              changes.pending(), changes.count(ChangeType::Conflict));

    StatusReport report;
    report.local_files = local.size();
    report.mirror_files = mirror.size();
    report.baseline_files = baseline.size();
    report.changes = std::move(changes);
    return report;
}

PushReport Orchestrator::push(const std::string& message) {
    std::error_code ec;
    if (!fs::is_directory(ctx_.scope_dir, ec))
        throw ConfigError(fmt::format("Local scope directory does not exist: {}", ctx_.scope_dir.string()),
                          "check local_orca_dir and local_scope_subdir in the config");

    auto [local, mirror, baseline, changes] = classifyAll();

    if (changes.hasConflicts()) {
        auto conflicts = changes.conflicts();
        LogRegistry::sync()->warn("[Orchestrator] Push blocked by {} conflict(s)", conflicts.size());
        for (const auto& path : conflicts) LogRegistry::sync()->warn("[Orchestrator] conflict: {}", path);
        throw ConflictError(std::move(conflicts));
    }

    PushReport report;
    std::vector<Copy> batch;
    std::set<std::string> reconciled;

    for (const auto& [path, change] : changes) {
        if (change.flowsToLocal()) {
            ++report.left_for_apply;
            continue;
        }
        reconciled.insert(path);
        if (change.flowsToMirror())
            batch.push_back({change.inLocal() ? Copy::Kind::Write : Copy::Kind::Remove, path});
    }

    ensureDirectory(ctx_.mirror_dir);
    runBatch(batch, ctx_.scope_dir, ctx_.mirror_dir, report.copied, report.removed);
    LogRegistry::sync()->info("[Orchestrator] push: {} copied, {} removed in mirror",
                              report.copied.size(), report.removed.size());

    vcs_.commitAndPush(message);

    const auto fresh = scanner_.scan(ctx_.mirror_dir, &local);
    store_.save(advanceBaseline(baseline, fresh, reconciled));

    report.changes = std::move(changes);
    return report;
}

void Orchestrator::pull() {
    LogRegistry::sync()->info("[Orchestrator] Pulling mirror {} from remote", ctx_.mirror_dir.string());
    vcs_.pullRebase();
}

ApplyReport Orchestrator::apply(const bool prune) {
    std::error_code ec;
    if (!fs::is_directory(ctx_.mirror_dir, ec))
        throw ConfigError(fmt::format("Mirror directory does not exist: {}", ctx_.mirror_dir.string()),
                          "run pull first or check repo_mirror_dir in the config");

    const auto baseline = store_.load();
    const auto mirror = scanner_.scan(ctx_.mirror_dir, &baseline);

    std::vector<Copy> batch;
    std::set<std::string> reconciled;

    for (const auto& [path, fp] : mirror) {
        batch.push_back({Copy::Kind::Write, path});
        reconciled.insert(path);
    }

    const auto local = scanner_.scan(ctx_.scope_dir, &baseline);
    if (prune) {
        for (const auto& [path, fp] : local) {
            if (mirror.contains(path)) continue;
            batch.push_back({Copy::Kind::Remove, path});
            reconciled.insert(path);
        }
    }

    // gone on both sides
    for (const auto& [path, fp] : baseline)
        if (!mirror.contains(path) && !local.contains(path)) reconciled.insert(path);

    LogRegistry::sync()->warn("[Orchestrator] apply: overwriting {} local file(s) from the mirror{}",
                              mirror.size(), prune ? " with prune" : "");

    ApplyReport report;
    ensureDirectory(ctx_.scope_dir);
    runBatch(batch, ctx_.mirror_dir, ctx_.scope_dir, report.copied, report.removed);

    const auto fresh = scanner_.scan(ctx_.scope_dir, &mirror);
    store_.save(advanceBaseline(baseline, fresh, reconciled));
    return report;
}

WipeReport Orchestrator::wipeProfiles(const bool confirmed, const bool resetBaseline) {
    if (!confirmed)
        throw ConfigError("wipe-profiles deletes every file in the mirror directory and needs confirmation",
                          "re-run as 'wipe-profiles --yes'");

    WipeReport report;
    std::error_code ec;
    if (!fs::exists(ctx_.mirror_dir, ec)) {
        ensureDirectory(ctx_.mirror_dir);
    } else {
        try {
            // a nested repository's metadata is not profile data
            report.removed = util::clearDirectory(ctx_.mirror_dir, {".git"});
        } catch (const std::exception& e) {
            throw FilesystemError(fmt::format("Failed to wipe {}: {}", ctx_.mirror_dir.string(), e.what()),
                                  ctx_.mirror_dir.string());
        }
    }
    LogRegistry::sync()->warn("[Orchestrator] wipe-profiles: removed {} entries from {}",
                              report.removed, ctx_.mirror_dir.string());

    if (resetBaseline) {
        store_.save({});
        report.baseline_reset = true;
    }

    return report;
}

Snapshot Orchestrator::advanceBaseline(const Snapshot& previous, const Snapshot& fresh,
                                       const std::set<std::string>& reconciled) {
    Snapshot next = previous;
    for (const auto& path : reconciled) {
        if (const auto* fp = fresh.find(path)) next.insert(*fp);
        else next.erase(path);
    }
    return next;
}

void Orchestrator::runBatch(const std::vector<Copy>& batch, const fs::path& from, const fs::path& to,
                            std::vector<std::string>& written, std::vector<std::string>& removed) {
    for (const auto& op : batch) {
        try {
            if (op.kind == Copy::Kind::Write) {
                util::requireNoSymlinkParents(to, op.path);
                util::copyFilePreservingMtime(from / op.path, to / op.path);
                written.push_back(op.path);
            } else {
                util::removeFileAndPruneParents(to, op.path);
                removed.push_back(op.path);
            }
        } catch (const std::exception& e) {
            std::vector<std::string> done = written;
            done.insert(done.end(), removed.begin(), removed.end());

            const auto* verb = op.kind == Copy::Kind::Write ? "copy" : "remove";
            LogRegistry::sync()->error("[Orchestrator] Failed to {} {}: {} ({} done before the failure)",
                                       verb, op.path, e.what(), done.size());
            throw FilesystemError(fmt::format("Failed to {} {}: {}", verb, op.path, e.what()), op.path, std::move(done));
        }

        LogRegistry::sync()->debug("[Orchestrator] {} {}", op.kind == Copy::Kind::Write ? "wrote" : "removed", op.path);
    }
}

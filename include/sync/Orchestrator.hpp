#pragma once

#include "sync/Context.hpp"
#include "sync/Scanner.hpp"
#include "sync/BaselineStore.hpp"
#include "sync/model/Report.hpp"
#include "sync/model/Snapshot.hpp"

#include <set>
#include <string>
#include <vector>

namespace osync::vcs {
class VersionControl;
}

namespace osync::sync {

// Runs one sync operation per call. The baseline only moves after an
// operation has fully succeeded; every failure leaves it where it was.
class Orchestrator {
public:
    Orchestrator(const Context& ctx, vcs::VersionControl& vcs);

    // Read-only.
    [[nodiscard]] model::StatusReport status() const;

    // Copies local changes into the mirror, commits and pushes, then advances
    // the baseline. Throws ConflictError before touching anything if any path
    // conflicts, FilesystemError on a failed copy, VersionControlError if git fails.
    model::PushReport push(const std::string& message);

    // Fetch + rebase of the mirror only. Local files and baseline are untouched.
    void pull();

    // DESTRUCTIVE: mirror wins. Every mirror file overwrites its local copy with
    // no conflict check; with `prune`, local files missing from the mirror are deleted.
    model::ApplyReport apply(bool prune);

    // Empties the mirror directory. Local files are never touched; the baseline
    // is only cleared when `resetBaseline` is set.
    model::WipeReport wipeProfiles(bool confirmed, bool resetBaseline = false);

    // Previous baseline with every reconciled path replaced by its entry in
    // `fresh`, or dropped when `fresh` no longer has it.
    [[nodiscard]] static model::Snapshot advanceBaseline(const model::Snapshot& previous,
                                                         const model::Snapshot& fresh,
                                                         const std::set<std::string>& reconciled);

private:
    struct Copy {
        enum class Kind { Write, Remove };
        Kind kind;
        std::string path;
    };

    struct Classified {
        model::Snapshot local, mirror, baseline;
        model::ChangeSet changes;
    };

    const Context& ctx_;
    vcs::VersionControl& vcs_;
    Scanner scanner_;
    BaselineStore store_;

    [[nodiscard]] Classified classifyAll() const;

    // Runs the batch in order and stops at the first failure, throwing a
    // FilesystemError that lists what already went through.
    static void runBatch(const std::vector<Copy>& batch,
                         const std::filesystem::path& from,
                         const std::filesystem::path& to,
                         std::vector<std::string>& written,
                         std::vector<std::string>& removed);
};

}

#pragma once

#include "vcs/VersionControl.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace osync::vcs {

class GitClient final : public VersionControl {
public:
    struct RunResult {
        int exit_code = 0;
        std::string output;  // stdout and stderr interleaved
    };

    GitClient(std::filesystem::path repoRoot, std::filesystem::path mirrorDir, config::GitConfig cfg);

    void commitAndPush(const std::string& message) override;
    void pullRebase() override;

    // Runs `git -C <repo> <args...>` and waits for it.
    [[nodiscard]] RunResult run(const std::vector<std::string>& args) const;

private:
    std::filesystem::path repoRoot_;
    std::filesystem::path mirrorDir_;
    config::GitConfig cfg_;

    RunResult runChecked(const std::vector<std::string>& args) const;
    [[nodiscard]] std::vector<std::string> remoteArgs() const;
    [[nodiscard]] std::string describe(const std::vector<std::string>& args) const;
};

}

#include "vcs/GitClient.hpp"
#include "sync/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <fmt/core.h>

using namespace osync::vcs;
using namespace osync::logging;
using osync::sync::VersionControlError;

GitClient::GitClient(std::filesystem::path repoRoot, std::filesystem::path mirrorDir, config::GitConfig cfg)
    : repoRoot_(std::move(repoRoot)), mirrorDir_(std::move(mirrorDir)), cfg_(std::move(cfg)) {}

void GitClient::commitAndPush(const std::string& message) {
    const auto mirror = mirrorDir_.string();

    runChecked({"add", "-A", "--", mirror});

    // exit 0 means the index matches HEAD for the mirror
    if (const auto diff = run({"diff", "--cached", "--quiet", "--", mirror}); diff.exit_code == 0) {
        LogRegistry::vcs()->info("[GitClient] No git changes to commit.");
    } else if (diff.exit_code == 1) {
        runChecked({"commit", "-m", message, "--", mirror});
        LogRegistry::vcs()->info("[GitClient] Committed: {}", message);
    } else {
        throw VersionControlError(describe({"diff", "--cached", "--quiet"}), diff.exit_code, diff.output);
    }

    // A commit left behind by an earlier failed push still has to reach the remote.
    if (run({"rev-parse", "--verify", "--quiet", "HEAD"}).exit_code != 0) {
        LogRegistry::vcs()->info("[GitClient] Repository has no commits yet, nothing to push.");
        return;
    }

    auto push = std::vector<std::string>{"push"};
    for (auto& a : remoteArgs()) push.push_back(std::move(a));
    runChecked(push);
    LogRegistry::vcs()->info("[GitClient] Pushed to remote.");
}

void GitClient::pullRebase() {
    auto pull = std::vector<std::string>{"pull", "--rebase"};
    for (auto& a : remoteArgs()) pull.push_back(std::move(a));
    runChecked(pull);
    LogRegistry::vcs()->info("[GitClient] Pulled with rebase.");
}

std::vector<std::string> GitClient::remoteArgs() const {
    std::vector<std::string> args;
    if (!cfg_.remote.empty()) args.push_back(cfg_.remote);
    if (!cfg_.branch.empty()) args.push_back(cfg_.branch);
    return args;
}

std::string GitClient::describe(const std::vector<std::string>& args) const {
    std::string out = cfg_.executable;
    for (const auto& a : args) out += " " + a;
    return out;
}

GitClient::RunResult GitClient::runChecked(const std::vector<std::string>& args) const {
    auto res = run(args);
    if (res.exit_code != 0) {
        LogRegistry::vcs()->error("[GitClient] '{}' exited with {}: {}", describe(args), res.exit_code, res.output);
        throw VersionControlError(describe(args), res.exit_code, res.output);
    }
    return res;
}

GitClient::RunResult GitClient::run(const std::vector<std::string>& args) const {
    LogRegistry::vcs()->debug("[GitClient] Running '{}' in {}", describe(args), repoRoot_.string());

    int pipefd[2];
    if (pipe(pipefd) == -1) throw VersionControlError(describe(args), -1, "Failed to create pipe for git output");

    const auto repo = repoRoot_.string();
    std::vector<const char*> argv = {cfg_.executable.c_str(), "-C", repo.c_str()};
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw VersionControlError(describe(args), -1, "Failed to fork git process");
    }

    if (pid == 0) {
        // Child process: stdout and stderr both go to the pipe
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127); // exec failed
    }

    // Parent process: drain the pipe until the child closes it
    close(pipefd[1]);

    RunResult result;
    char buffer[4096];
    for (;;) {
        const ssize_t n = read(pipefd[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw VersionControlError(describe(args), -1, "Failed to wait for git process");
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);

    if (result.exit_code == 127 && result.output.empty())
        result.output = fmt::format("Could not execute '{}'", cfg_.executable);

    return result;
}

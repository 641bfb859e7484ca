#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace osync::sync {

class SyncError : public std::runtime_error {
public:
    explicit SyncError(const std::string& what) : std::runtime_error(what) {}

    // One line telling the operator what to do next.
    [[nodiscard]] virtual std::string nextAction() const = 0;
};

// Missing or invalid configuration, or a destructive request without confirmation.
// Always raised before anything on disk is touched.
class ConfigError final : public SyncError {
public:
    explicit ConfigError(const std::string& what, std::string hint = "fix the configuration and re-run")
        : SyncError(what), hint_(std::move(hint)) {}

    [[nodiscard]] std::string nextAction() const override { return hint_; }

private:
    std::string hint_;
};

class ConflictError final : public SyncError {
public:
    explicit ConflictError(std::vector<std::string> paths);

    [[nodiscard]] const std::vector<std::string>& paths() const { return paths_; }
    [[nodiscard]] std::string nextAction() const override { return "resolve conflicts then re-run push"; }

private:
    std::vector<std::string> paths_;
};

// IO failure. When raised from a batch, carries the paths that were already
// processed and the one that failed.
class FilesystemError final : public SyncError {
public:
    FilesystemError(const std::string& what, std::string path,
                    std::vector<std::string> succeeded = {});

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const std::vector<std::string>& succeeded() const { return succeeded_; }
    [[nodiscard]] std::string nextAction() const override {
        return "fix the problem with the listed path then re-run; the baseline was not advanced";
    }

private:
    std::string path_;
    std::vector<std::string> succeeded_;
};

class VersionControlError final : public SyncError {
public:
    VersionControlError(std::string command, int exitCode, std::string output);

    [[nodiscard]] const std::string& command() const { return command_; }
    [[nodiscard]] int exitCode() const { return exitCode_; }
    [[nodiscard]] const std::string& output() const { return output_; }
    [[nodiscard]] std::string nextAction() const override {
        return "resolve the git problem (see git status) then re-run; the baseline was not advanced";
    }

private:
    std::string command_;
    int exitCode_;
    std::string output_;
};

}

#include <gtest/gtest.h>
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/commands.hpp"
#include "shell/util/argsHelpers.hpp"
#include "sync/errors.hpp"

#include <stdexcept>

using namespace osync::shell;
using namespace osync::sync;

namespace {

const ParserSpec SPEC{
    .valueFlags = {"repo", "config", "message"},
    .shortFlags = {{"m", "message"}, {"v", "verbose"}},
    .globalFlags = {"repo", "config", "verbose"},
};

CommandCall parse(std::initializer_list<std::string> args) {
    return parseArgs(std::vector<std::string>(args), SPEC);
}

}

TEST(ParserTest, SplitsGlobalsFromCommandOptions) {
    const auto call = parse({"--repo", "/tmp/r", "-v", "push", "-m", "Tuned PLA"});

    EXPECT_EQ(call.name, "push");
    EXPECT_EQ(globalVal(call, "repo"), "/tmp/r");
    EXPECT_TRUE(hasGlobal(call, "verbose"));
    EXPECT_EQ(optVal(call, "message"), "Tuned PLA");
    EXPECT_FALSE(hasFlag(call, "verbose"));
}

TEST(ParserTest, GlobalFlagsAfterCommandStayGlobal) {
    const auto call = parse({"status", "-v", "--repo", "/tmp/r"});

    EXPECT_EQ(call.name, "status");
    EXPECT_TRUE(hasGlobal(call, "verbose"));
    EXPECT_EQ(globalVal(call, "repo"), "/tmp/r");
    EXPECT_TRUE(call.options.empty());
}

TEST(ParserTest, AcceptsInlineValues) {
    const auto call = parse({"--config=/etc/o.yaml", "push", "--message=hello world"});

    EXPECT_EQ(globalVal(call, "config"), "/etc/o.yaml");
    EXPECT_EQ(optVal(call, "message"), "hello world");
}

TEST(ParserTest, BooleanFlagsHaveNoValue) {
    const auto call = parse({"apply", "--prune"});

    EXPECT_TRUE(hasFlag(call, "prune"));
    EXPECT_FALSE(optVal(call, "prune").has_value());
}

TEST(ParserTest, LastOccurrenceWins) {
    const auto call = parse({"push", "-m", "first", "--message", "second"});
    EXPECT_EQ(optVal(call, "message"), "second");
    EXPECT_EQ(call.options.size(), 1u);
}

TEST(ParserTest, DoubleDashEndsOptions) {
    const auto call = parse({"push", "--", "--prune"});
    EXPECT_FALSE(hasFlag(call, "prune"));
    EXPECT_EQ(call.positionals, std::vector<std::string>{"--prune"});
}

TEST(ParserTest, MissingValueThrows) {
    EXPECT_THROW((void)parse({"push", "--message"}), std::invalid_argument);
    EXPECT_THROW((void)parse({"--repo"}), std::invalid_argument);
}

class RouterTest : public ::testing::Test {
protected:
    Router router;
    std::vector<std::string> ran;

    void SetUp() override {
        router.registerCommand({"status", {"st"}, "status", "Show status", {}},
                               [this](const CommandCall&) { ran.push_back("status"); return ok("clean\n"); });
        router.registerCommand({"push", {}, "push [-m <msg>]", "Push", {"message"}},
                               [this](const CommandCall& c) {
                                   ran.push_back("push:" + optVal(c, "message").value_or(""));
                                   return ok("");
                               });
        router.registerCommand({"conflicted", {}, "conflicted", "Always conflicts", {}},
                               [](const CommandCall&) -> CommandResult {
                                   throw ConflictError({"filament/a.json", "process/b.json"});
                               });
        router.registerCommand({"broken-git", {}, "broken-git", "Always fails in git", {}},
                               [](const CommandCall&) -> CommandResult {
                                   throw VersionControlError("git push", 1, "rejected");
                               });
    }

    CommandResult run(std::initializer_list<std::string> args) const {
        return router.execute(parse(args));
    }
};

TEST_F(RouterTest, DispatchesByNameAndAlias) {
    EXPECT_EQ(run({"status"}).exit_code, EXIT_OK);
    EXPECT_EQ(run({"ST"}).stdout_text, "clean\n");
    EXPECT_EQ(ran, (std::vector<std::string>{"status", "status"}));
}

TEST_F(RouterTest, PassesOptionsToHandler) {
    (void)run({"push", "-m", "msg"});
    EXPECT_EQ(ran, std::vector<std::string>{"push:msg"});
}

TEST_F(RouterTest, UnknownCommandIsUsageError) {
    const auto res = run({"frobnicate"});
    EXPECT_EQ(res.exit_code, EXIT_CONFIG);
    EXPECT_NE(res.stderr_text.find("Unknown command: frobnicate"), std::string::npos);
    EXPECT_NE(res.stderr_text.find("usage:"), std::string::npos);
}

TEST_F(RouterTest, UnknownOptionIsUsageError) {
    const auto res = run({"status", "--prune"});
    EXPECT_EQ(res.exit_code, EXIT_CONFIG);
    EXPECT_TRUE(ran.empty());
}

TEST_F(RouterTest, TrailingVerboseIsNotACommandOption) {
    EXPECT_EQ(run({"status", "--verbose"}).exit_code, EXIT_OK);
    EXPECT_EQ(ran, std::vector<std::string>{"status"});
}

TEST_F(RouterTest, StrayArgumentIsUsageError) {
    EXPECT_EQ(run({"status", "extra"}).exit_code, EXIT_CONFIG);
}

TEST_F(RouterTest, ConflictMapsToExitOneWithPaths) {
    const auto res = run({"conflicted"});
    EXPECT_EQ(res.exit_code, EXIT_CONFLICT);
    EXPECT_NE(res.stderr_text.find("filament/a.json"), std::string::npos);
    EXPECT_NE(res.stderr_text.find("resolve conflicts then re-run push"), std::string::npos);
}

TEST_F(RouterTest, VersionControlFailureMapsToExitFour) {
    const auto res = run({"broken-git"});
    EXPECT_EQ(res.exit_code, EXIT_VCS);
    EXPECT_NE(res.stderr_text.find("rejected"), std::string::npos);
}

TEST(ArgsHelpersTest, ExitCodesFollowErrorKind) {
    EXPECT_EQ(exitCodeFor(ConfigError("bad")), EXIT_CONFIG);
    EXPECT_EQ(exitCodeFor(ConflictError({"a"})), EXIT_CONFLICT);
    EXPECT_EQ(exitCodeFor(FilesystemError("io", "p")), EXIT_FILESYSTEM);
    EXPECT_EQ(exitCodeFor(VersionControlError("git", 128, "")), EXIT_VCS);
}

TEST(ArgsHelpersTest, LongPathListsAreTruncated) {
    std::vector<std::string> paths;
    for (int i = 0; i < 30; ++i) paths.push_back("filament/" + std::to_string(i) + ".json");

    const auto text = listPaths(paths);
    EXPECT_NE(text.find("filament/24.json"), std::string::npos);
    EXPECT_EQ(text.find("filament/25.json"), std::string::npos);
    EXPECT_NE(text.find("... and 5 more"), std::string::npos);
}

TEST(ArgsHelpersTest, FilesystemFailureListsCompletedAndFailedPaths) {
    const auto res = failure(FilesystemError("Failed to copy machine/b.json", "machine/b.json", {"filament/a.json"}));

    EXPECT_EQ(res.exit_code, EXIT_FILESYSTEM);
    EXPECT_NE(res.stderr_text.find("completed before the failure (1)"), std::string::npos);
    EXPECT_NE(res.stderr_text.find("failed: machine/b.json"), std::string::npos);
    EXPECT_NE(res.stderr_text.find("baseline was not advanced"), std::string::npos);
}

TEST(CommandUsagesTest, HelpListsEveryCommand) {
    const auto text = Router::renderUsage(commandUsages());
    for (const auto* name : {"status", "push", "pull", "apply", "wipe-profiles", "help"})
        EXPECT_NE(text.find(name), std::string::npos) << name;
}

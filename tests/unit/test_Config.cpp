#include "TempTree.hpp"
#include "config/Config.hpp"
#include "config/paths.hpp"
#include "sync/errors.hpp"

#include <cstdlib>

using namespace osync;
using namespace osync::config;
using osync::sync::ConfigError;

class ConfigTest : public TempTree {
protected:
    fs::path cfgPath;

    void SetUp() override {
        TempTree::SetUp();
        cfgPath = root / ".orcasync/config.yaml";
    }
};

TEST_F(ConfigTest, FirstRunWritesDefaults) {
    bool created = false;
    const auto cfg = loadOrCreateConfig(cfgPath, &created);

    EXPECT_TRUE(created);
    EXPECT_TRUE(fs::exists(cfgPath));
    EXPECT_EQ(cfg.local_orca_dir, paths::defaultOrcaDir());
    EXPECT_EQ(cfg.local_scope_subdir, "user/default");
    EXPECT_EQ(cfg.sync_folders, (std::vector<std::string>{"filament", "machine", "process"}));
    EXPECT_EQ(cfg.repo_mirror_dir, "./profiles");
    EXPECT_TRUE(cfg.use_mtime_cache);
}

TEST_F(ConfigTest, SecondRunLoadsExistingFile) {
    (void)loadOrCreateConfig(cfgPath);

    bool created = true;
    (void)loadOrCreateConfig(cfgPath, &created);
    EXPECT_FALSE(created);
}

TEST_F(ConfigTest, SaveAndLoadKeepCustomValues) {
    auto cfg = defaultConfig();
    cfg.local_orca_dir = "/opt/orca";
    cfg.sync_folders = {"filament"};
    cfg.git.remote = "origin";
    cfg.git.branch = "main";
    cfg.logging.console_log_level = spdlog::level::debug;
    cfg.logging.subsystem_levels.vcs = spdlog::level::trace;
    cfg.save(cfgPath);

    const auto loaded = loadConfig(cfgPath);
    EXPECT_EQ(loaded.local_orca_dir, "/opt/orca");
    EXPECT_EQ(loaded.sync_folders, std::vector<std::string>{"filament"});
    EXPECT_EQ(loaded.git.remote, "origin");
    EXPECT_EQ(loaded.git.branch, "main");
    EXPECT_EQ(loaded.logging.console_log_level, spdlog::level::debug);
    EXPECT_EQ(loaded.logging.subsystem_levels.vcs, spdlog::level::trace);
}

TEST_F(ConfigTest, MissingKeysFallBackToDefaults) {
    put(cfgPath, "repo_mirror_dir: shared/profiles\n");

    const auto cfg = loadConfig(cfgPath);
    EXPECT_EQ(cfg.repo_mirror_dir, "shared/profiles");
    EXPECT_EQ(cfg.local_orca_dir, paths::defaultOrcaDir());
    EXPECT_EQ(cfg.git.executable, "git");
}

TEST_F(ConfigTest, MalformedYamlRaisesConfigError) {
    put(cfgPath, "sync_folders: [filament, machine\n");
    EXPECT_THROW((void)loadConfig(cfgPath), ConfigError);
}

TEST_F(ConfigTest, UnknownLogLevelRaisesConfigError) {
    put(cfgPath, "logging:\n  console_log_level: chatty\n");
    EXPECT_THROW((void)loadConfig(cfgPath), ConfigError);
}

TEST_F(ConfigTest, ValidationRejectsBadValues) {
    auto cfg = defaultConfig();
    cfg.local_orca_dir.clear();
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg = defaultConfig();
    cfg.sync_folders = {};
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg = defaultConfig();
    cfg.sync_folders = {"filament/sub"};
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg = defaultConfig();
    cfg.local_scope_subdir = "../elsewhere";
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg = defaultConfig();
    cfg.git.branch = "main";
    EXPECT_THROW(cfg.validate(), ConfigError);

    EXPECT_NO_THROW(defaultConfig().validate());
}

TEST_F(ConfigTest, ExpandPathHandlesHomeAndVariables) {
    const char* home = std::getenv("HOME");
    const std::string savedHome = home ? home : "";
    ::setenv("HOME", root.c_str(), 1);
    ::setenv("ORCASYNC_TEST_DIR", (root / "var").c_str(), 1);

    EXPECT_EQ(paths::expandPath("~/orca", "/unused"), root / "orca");
    EXPECT_EQ(paths::expandPath("$ORCASYNC_TEST_DIR/a", "/unused"), root / "var/a");
    EXPECT_EQ(paths::expandPath("${ORCASYNC_TEST_DIR}/b", "/unused"), root / "var/b");
    EXPECT_EQ(paths::expandPath("%ORCASYNC_TEST_DIR%/c", "/unused"), root / "var/c");
    EXPECT_EQ(paths::expandPath("./profiles", root), root / "profiles");

    ::unsetenv("ORCASYNC_TEST_DIR");
    ::setenv("HOME", savedHome.c_str(), 1);
}

TEST_F(ConfigTest, RepoRootPrefersOverrideThenEnvironment) {
    fs::create_directories(root / "from-env");
    ::setenv(paths::REPO_ENV_VAR, (root / "from-env").c_str(), 1);

    EXPECT_EQ(paths::resolveRepoRoot(), root / "from-env");
    EXPECT_EQ(paths::resolveRepoRoot((root / "override").string()), root / "override");

    ::unsetenv(paths::REPO_ENV_VAR);
}

TEST_F(ConfigTest, LayoutLivesUnderAppDir) {
    EXPECT_EQ(paths::configPath(root), root / ".orcasync/config.yaml");
    EXPECT_EQ(paths::statePath(root), root / ".orcasync/state.json");
    EXPECT_EQ(paths::defaultLogDir(root), root / ".orcasync/logs");
}

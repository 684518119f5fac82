#include <gtest/gtest.h>
#include "config/config_resolver.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace cjail;
namespace fs = std::filesystem;

class ConfigResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / ("cjail_resolver_test_" + std::to_string(getpid()));
        projectDir_ = testDir_ / "project";
        homeDir_ = testDir_ / "home";
        fs::create_directories(projectDir_);
        fs::create_directories(homeDir_ / ".config");

        env_["HOME"] = homeDir_.string();
        env_["XDG_CONFIG_HOME"] = (homeDir_ / ".config").string();
    }

    void TearDown() override {
        fs::remove_all(testDir_);
    }

    void writeFile(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }

    ConfigResolver resolver() const {
        return ConfigResolver(env_, projectDir_);
    }

    fs::path testDir_;
    fs::path projectDir_;
    fs::path homeDir_;
    Environment env_;
};

TEST_F(ConfigResolverTest, DefaultsWithoutAnyTier) {
    ResolvedConfiguration config = resolver().resolve();

    EXPECT_EQ("standard", config.settings.getProfile());
    EXPECT_TRUE(config.settings.isNetworkEnabled());
    EXPECT_FALSE(config.loadedFile.has_value());
    EXPECT_EQ(ConfigSource::DEFAULT, config.sourceOf(SandboxSettings::PROP_PROFILE));
}

TEST_F(ConfigResolverTest, CandidateOrder) {
    env_[ConfigResolver::ENV_CONFIG_FILE] = "/custom/config.json";

    std::vector<ConfigCandidate> candidates = resolver().candidates();
    ASSERT_EQ(4u, candidates.size());
    EXPECT_EQ(fs::path("/custom/config.json"), candidates[0].path);
    EXPECT_EQ(ConfigSource::EXPLICIT_FILE, candidates[0].scope);
    EXPECT_EQ(projectDir_ / ".claude-jail.json", candidates[1].path);
    EXPECT_EQ(ConfigSource::PROJECT_FILE, candidates[1].scope);
    EXPECT_EQ(homeDir_ / ".config" / "claude-jail" / "config.json", candidates[2].path);
    EXPECT_EQ(homeDir_ / ".claude-jail.json", candidates[3].path);
    EXPECT_EQ(ConfigSource::USER_FILE, candidates[3].scope);
}

TEST_F(ConfigResolverTest, ExplicitFileReplacesEnvironmentCandidate) {
    env_[ConfigResolver::ENV_CONFIG_FILE] = "/custom/config.json";

    ConfigResolver r = resolver();
    r.setExplicitConfigFile("/cli/config.json");

    std::vector<ConfigCandidate> candidates = r.candidates();
    ASSERT_EQ(4u, candidates.size());
    EXPECT_EQ(fs::path("/cli/config.json"), candidates[0].path);
}

TEST_F(ConfigResolverTest, EnvironmentBeatsFile) {
    writeFile(projectDir_ / ".claude-jail.json", R"({"profile": "minimal", "network": false})");
    env_[ConfigResolver::ENV_PROFILE] = "paranoid";

    ResolvedConfiguration config = resolver().resolve();

    EXPECT_EQ("paranoid", config.settings.getProfile());
    EXPECT_EQ(ConfigSource::ENVIRONMENT, config.sourceOf(SandboxSettings::PROP_PROFILE));
    EXPECT_FALSE(config.settings.isNetworkEnabled());
    EXPECT_EQ(ConfigSource::PROJECT_FILE, config.sourceOf(SandboxSettings::PROP_NETWORK));
    ASSERT_TRUE(config.loadedFile.has_value());
    EXPECT_EQ(ConfigSource::PROJECT_FILE, config.loadedFile->scope);
}

TEST_F(ConfigResolverTest, OverrideBeatsEnvironment) {
    env_[ConfigResolver::ENV_PROFILE] = "standard";

    Properties overrides;
    overrides.set(SandboxSettings::PROP_PROFILE, std::string("paranoid"));

    ResolvedConfiguration config = resolver().resolve(overrides);
    EXPECT_EQ("paranoid", config.settings.getProfile());
    EXPECT_EQ(ConfigSource::OVERRIDE, config.sourceOf(SandboxSettings::PROP_PROFILE));
}

TEST_F(ConfigResolverTest, EnvironmentListReplacesFileList) {
    writeFile(projectDir_ / ".claude-jail.json", R"({"paths": {"extra_ro": ["/a", "/b"]}})");
    env_[ConfigResolver::ENV_EXTRA_RO] = "/c:/d";

    ResolvedConfiguration config = resolver().resolve();

    std::vector<std::string> expected = {"/c", "/d"};
    EXPECT_EQ(expected, config.settings.getExtraReadOnlyPaths());
}

TEST_F(ConfigResolverTest, EmptyEnvironmentValueIsIgnored) {
    writeFile(projectDir_ / ".claude-jail.json", R"({"profile": "dev"})");
    env_[ConfigResolver::ENV_PROFILE] = "";

    ResolvedConfiguration config = resolver().resolve();
    EXPECT_EQ("dev", config.settings.getProfile());
    EXPECT_EQ(ConfigSource::PROJECT_FILE, config.sourceOf(SandboxSettings::PROP_PROFILE));
}

TEST_F(ConfigResolverTest, EnvironmentBooleansAreParsed) {
    env_[ConfigResolver::ENV_NETWORK] = "false";
    env_[ConfigResolver::ENV_GIT_WORKTREE_RO] = "yes";

    ResolvedConfiguration config = resolver().resolve();
    EXPECT_FALSE(config.settings.isNetworkEnabled());
    EXPECT_TRUE(config.settings.isGitWorktreeReadOnly());
}

TEST_F(ConfigResolverTest, OnlyFirstUsableFileIsLoaded) {
    writeFile(projectDir_ / ".claude-jail.json", R"({"profile": "dev"})");
    writeFile(homeDir_ / ".config" / "claude-jail" / "config.json",
              R"({"profile": "minimal", "verbose": true})");

    ResolvedConfiguration config = resolver().resolve();
    EXPECT_EQ("dev", config.settings.getProfile());
    EXPECT_FALSE(config.settings.isVerbose());
}

TEST_F(ConfigResolverTest, MalformedFileFallsThroughToNextCandidate) {
    writeFile(projectDir_ / ".claude-jail.json", "{ not json");
    writeFile(homeDir_ / ".config" / "claude-jail" / "config.json", R"({"profile": "minimal"})");

    ResolvedConfiguration config = resolver().resolve();
    EXPECT_EQ("minimal", config.settings.getProfile());
    ASSERT_TRUE(config.loadedFile.has_value());
    EXPECT_EQ(ConfigSource::USER_FILE, config.loadedFile->scope);
}

TEST_F(ConfigResolverTest, LegacyHomeFileIsLastCandidate) {
    writeFile(homeDir_ / ".claude-jail.json", R"({"sandbox": {"name": "legacy"}})");

    ResolvedConfiguration config = resolver().resolve();
    EXPECT_EQ("legacy", config.settings.getSandboxName());
    EXPECT_EQ(ConfigSource::USER_FILE, config.sourceOf(SandboxSettings::PROP_SANDBOX_NAME));
}

TEST_F(ConfigResolverTest, MissingExplicitFileFallsBack) {
    writeFile(projectDir_ / ".claude-jail.json", R"({"profile": "dev"})");

    ConfigResolver r = resolver();
    r.setExplicitConfigFile(testDir_ / "missing.json");

    ResolvedConfiguration config = r.resolve();
    EXPECT_EQ("dev", config.settings.getProfile());
}

TEST_F(ConfigResolverTest, EveryKnownKeyHasASource) {
    ResolvedConfiguration config = resolver().resolve();

    for (const auto& key : SandboxSettings::knownKeys()) {
        EXPECT_EQ(1u, config.sources.count(key)) << key;
    }
}

TEST_F(ConfigResolverTest, ShowListsSources) {
    env_[ConfigResolver::ENV_PROFILE] = "dev";
    env_[ConfigResolver::ENV_BLOCKED] = "/secret";

    std::string shown = resolver().resolve().show();
    EXPECT_NE(std::string::npos, shown.find("dev  (environment)"));
    EXPECT_NE(std::string::npos, shown.find("Config file: none"));
    EXPECT_NE(std::string::npos, shown.find("  - /secret"));
}

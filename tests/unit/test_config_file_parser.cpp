#include <gtest/gtest.h>
#include "config/config_file_parser.h"
#include "config/sandbox_settings.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace cjail;
namespace fs = std::filesystem;

// ============================================================================
// Config File Parser Tests
// ============================================================================

TEST(ConfigFileParserTest, ParseFullConfig) {
    std::string jsonStr = R"JSON({
        "profile": "dev",
        "network": false,
        "verbose": true,
        "copy_config": false,
        "sandbox": { "home": "/tmp/sandboxes", "name": "box" },
        "git": { "worktree_readonly": true, "root": "~/src/main" },
        "paths": {
            "extra_ro": ["/opt/tools", "~/lib"],
            "extra_rw": ["/scratch"],
            "blocked": ["~/.ssh"]
        }
    })JSON";

    SandboxSettings settings(ConfigFileParser::parseString(jsonStr));

    EXPECT_EQ("dev", settings.getProfile());
    EXPECT_FALSE(settings.isNetworkEnabled());
    EXPECT_TRUE(settings.isVerbose());
    EXPECT_FALSE(settings.isCopyConfigEnabled());
    EXPECT_EQ("/tmp/sandboxes", settings.getSandboxHome());
    EXPECT_EQ("box", settings.getSandboxName());
    EXPECT_TRUE(settings.isGitWorktreeReadOnly());
    EXPECT_EQ("~/src/main", settings.getGitRoot());

    std::vector<std::string> ro = {"/opt/tools", "~/lib"};
    EXPECT_EQ(ro, settings.getExtraReadOnlyPaths());
    EXPECT_EQ(std::vector<std::string>{"/scratch"}, settings.getExtraReadWritePaths());
    EXPECT_EQ(std::vector<std::string>{"~/.ssh"}, settings.getBlockedPaths());
}

TEST(ConfigFileParserTest, OnlyDefinedKeysAreSet) {
    Properties props = ConfigFileParser::parseString(R"({"profile": "minimal"})");

    EXPECT_EQ(1u, props.keys().size());
    EXPECT_EQ("minimal", props.getString(SandboxSettings::PROP_PROFILE));
    EXPECT_FALSE(props.has(SandboxSettings::PROP_NETWORK));
}

TEST(ConfigFileParserTest, UnknownKeysAreIgnored) {
    Properties props = ConfigFileParser::parseString(
        R"({"profile": "dev", "colour": "blue", "sandbox": {"size": 3}})");

    EXPECT_EQ(1u, props.keys().size());
    EXPECT_EQ("dev", props.getString(SandboxSettings::PROP_PROFILE));
}

TEST(ConfigFileParserTest, InvalidJsonThrows) {
    EXPECT_THROW(ConfigFileParser::parseString("{ invalid json }"), ConfigParseError);
}

TEST(ConfigFileParserTest, NonObjectRootThrows) {
    EXPECT_THROW(ConfigFileParser::parseString("[1, 2, 3]"), ConfigParseError);
    EXPECT_THROW(ConfigFileParser::parseString("\"standard\""), ConfigParseError);
}

TEST(ConfigFileParserTest, WrongTypesThrow) {
    EXPECT_THROW(ConfigFileParser::parseString(R"({"profile": 3})"), ConfigParseError);
    EXPECT_THROW(ConfigFileParser::parseString(R"({"network": "yes"})"), ConfigParseError);
    EXPECT_THROW(ConfigFileParser::parseString(R"({"sandbox": "home"})"), ConfigParseError);
    EXPECT_THROW(ConfigFileParser::parseString(R"({"paths": {"blocked": "~/.ssh"}})"),
                 ConfigParseError);
    EXPECT_THROW(ConfigFileParser::parseString(R"({"paths": {"extra_ro": ["/a", 1]}})"),
                 ConfigParseError);
}

TEST(ConfigFileParserTest, ParseFileMissingThrows) {
    EXPECT_THROW(ConfigFileParser::parseFile("/nonexistent/claude-jail.json"), ConfigParseError);
}

TEST(ConfigFileParserTest, ParseFileReportsPath) {
    fs::path file = fs::temp_directory_path() / ("cjail_parser_test_" + std::to_string(getpid()) + ".json");
    {
        std::ofstream out(file);
        out << R"({"network": 1})";
    }

    try {
        ConfigFileParser::parseFile(file.string());
        FAIL() << "Expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find(file.string()));
    }

    fs::remove(file);
}

TEST(SandboxSettingsTest, Defaults) {
    SandboxSettings settings;

    EXPECT_EQ("standard", settings.getProfile());
    EXPECT_TRUE(settings.isNetworkEnabled());
    EXPECT_EQ(".claude-sandbox", settings.getSandboxHome());
    EXPECT_EQ(".claude-sandbox", settings.getSandboxName());
    EXPECT_TRUE(settings.isCopyConfigEnabled());
    EXPECT_FALSE(settings.isVerbose());
    EXPECT_FALSE(settings.isGitWorktreeReadOnly());
    EXPECT_TRUE(settings.getGitRoot().empty());
    EXPECT_TRUE(settings.getBlockedPaths().empty());
    EXPECT_TRUE(settings.validate());
}

TEST(SandboxSettingsTest, ValidateRejectsBadNames) {
    SandboxSettings settings;

    settings.setSandboxName("a/b");
    EXPECT_FALSE(settings.validate());

    settings.setSandboxName("..");
    EXPECT_FALSE(settings.validate());

    settings.setSandboxName("box");
    settings.setProfile("");
    EXPECT_FALSE(settings.validate());
}

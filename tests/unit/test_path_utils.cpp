#include <gtest/gtest.h>
#include "utils/path_utils.h"
#include "utils/environment.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace cjail;
namespace fs = std::filesystem;

TEST(PathUtilsTest, SplitListDropsEmptyElements) {
    std::vector<std::string> expected = {"a", "b", "c"};
    EXPECT_EQ(expected, splitList("a::b:c:"));
    EXPECT_TRUE(splitList("").empty());
    EXPECT_TRUE(splitList(":::").empty());
}

TEST(PathUtilsTest, SplitListCustomSeparator) {
    std::vector<std::string> expected = {"x", "y"};
    EXPECT_EQ(expected, splitList("x,y", ','));
}

TEST(PathUtilsTest, NormalizeDestination) {
    EXPECT_EQ(fs::path("/a/b"), normalizeDestination("/a/./b/"));
    EXPECT_EQ(fs::path("/a"), normalizeDestination("/a/b/.."));
    EXPECT_EQ(fs::path("/"), normalizeDestination("/"));
}

TEST(PathUtilsTest, AncestorsShallowestFirst) {
    std::vector<fs::path> expected = {"/a", "/a/b"};
    EXPECT_EQ(expected, ancestorsOf("/a/b/c"));
}

TEST(PathUtilsTest, AncestorsOfShallowPaths) {
    EXPECT_TRUE(ancestorsOf("/a").empty());
    EXPECT_TRUE(ancestorsOf("/").empty());
    EXPECT_TRUE(ancestorsOf("relative/path").empty());
}

TEST(PathUtilsTest, IsWithinIsComponentWise) {
    EXPECT_TRUE(isWithin("/home/user/project/.git", "/home/user/project"));
    EXPECT_FALSE(isWithin("/home/user/project", "/home/user/project"));
    EXPECT_FALSE(isWithin("/home/user/project2/.git", "/home/user/project"));
    EXPECT_FALSE(isWithin("/home", "/home/user"));
}

TEST(PathUtilsTest, ExpandHome) {
    EXPECT_EQ(fs::path("/home/me"), expandHome("~", "/home/me"));
    EXPECT_EQ(fs::path("/home/me/.ssh"), expandHome("~/.ssh", "/home/me"));
    EXPECT_EQ(fs::path("/etc/hosts"), expandHome("/etc/hosts", "/home/me"));
    EXPECT_EQ(fs::path("~other/x"), expandHome("~other/x", "/home/me"));
}

TEST(PathUtilsTest, CanonicalOrAbsoluteFallsBack) {
    fs::path missing = "/nonexistent_cjail_path/a/../b";
    EXPECT_EQ(fs::path("/nonexistent_cjail_path/b"), canonicalOrAbsolute(missing));
}

TEST(PathUtilsTest, FindExecutableOnSearchPath) {
    fs::path dir = fs::temp_directory_path() / ("cjail_path_utils_test_" + std::to_string(getpid()));
    fs::create_directories(dir);
    fs::path tool = dir / "mytool";
    {
        std::ofstream out(tool);
        out << "#!/bin/sh\n";
    }
    fs::permissions(tool, fs::perms::owner_all);

    auto found = findExecutable("mytool", "/nonexistent_cjail_path:" + dir.string());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(tool, *found);

    EXPECT_FALSE(findExecutable("missing_tool", dir.string()).has_value());
    EXPECT_FALSE(findExecutable("", dir.string()).has_value());

    fs::remove_all(dir);
}

TEST(EnvironmentTest, EmptyValuesCountAsUnset) {
    Environment env = {{"SET", "value"}, {"EMPTY", ""}};

    EXPECT_EQ("value", getEnv(env, "SET"));
    EXPECT_EQ("fallback", getEnv(env, "EMPTY", "fallback"));
    EXPECT_EQ("fallback", getEnv(env, "MISSING", "fallback"));
}

TEST(EnvironmentTest, ConfigHomeFollowsXdg) {
    Environment env = {{"HOME", "/home/me"}};
    EXPECT_EQ(fs::path("/home/me/.config"), configHome(env));

    env["XDG_CONFIG_HOME"] = "/custom/config";
    EXPECT_EQ(fs::path("/custom/config"), configHome(env));
}

TEST(EnvironmentTest, CaptureSeesProcessEnvironment) {
    setenv("CJAIL_TEST_VARIABLE", "captured", 1);
    Environment env = captureEnvironment();
    EXPECT_EQ("captured", getEnv(env, "CJAIL_TEST_VARIABLE"));
    unsetenv("CJAIL_TEST_VARIABLE");
}

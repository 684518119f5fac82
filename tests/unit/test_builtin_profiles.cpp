#include <gtest/gtest.h>
#include "profile/builtin_profiles.h"
#include "profile/system_mounts.h"
#include <algorithm>
#include <filesystem>
#include <unistd.h>

using namespace cjail;
namespace fs = std::filesystem;

namespace {

const BindDirective* findBindTo(const DirectiveList& list, const std::string& dst) {
    for (const auto& d : list) {
        const auto* bind = std::get_if<BindDirective>(&d);
        if (bind && bind->dst == dst) {
            return bind;
        }
    }
    return nullptr;
}

bool hasEnv(const DirectiveList& list, const std::string& name, const std::string& value) {
    return std::find(list.begin(), list.end(), Directive(EnvDirective{name, value})) != list.end();
}

} // anonymous namespace

class BuiltinProfilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs::path dir = fs::temp_directory_path() / ("cjail_profiles_test_" + std::to_string(getpid()));
        fs::create_directories(dir / "project");
        fs::create_directories(dir / "sandbox");
        fs::create_directories(dir / "home" / ".cargo");
        fs::create_directories(dir / "tools" / "bin");
        testDir_ = fs::canonical(dir);

        project_ = testDir_ / "project";
        sandbox_ = testDir_ / "sandbox";

        env_["HOME"] = (testDir_ / "home").string();
        env_["PATH"] = (testDir_ / "tools" / "bin").string() + ":/nonexistent/bin";
        env_["TERM"] = "dumb";
        env_["GIT_AUTHOR_NAME"] = "Tester";

        registerBuiltinProfiles(registry_, env_);
    }

    void TearDown() override {
        fs::remove_all(testDir_);
    }

    DirectiveList applyProfile(const std::string& name) {
        DirectiveAccumulator acc;
        registry_.apply(name, acc, project_, sandbox_);
        return acc.directives().ordered();
    }

    fs::path testDir_;
    fs::path project_;
    fs::path sandbox_;
    Environment env_;
    ProfileRegistry registry_;
};

TEST_F(BuiltinProfilesTest, AllBuiltinsRegistered) {
    std::vector<std::string> expected = {"dev", "minimal", "paranoid", "standard"};
    EXPECT_EQ(expected, registry_.list());

    for (const auto& name : registry_.list()) {
        EXPECT_FALSE(registry_.get(name)->description().empty()) << name;
    }
}

TEST_F(BuiltinProfilesTest, ApplyIsDeterministicAfterReset) {
    for (const auto& name : registry_.list()) {
        DirectiveAccumulator acc;
        registry_.apply(name, acc, project_, sandbox_);
        acc.reset();
        registry_.apply(name, acc, project_, sandbox_);

        EXPECT_EQ(applyProfile(name), acc.directives().ordered()) << name;
    }
}

TEST_F(BuiltinProfilesTest, MinimalUnsharesAllButNetwork) {
    DirectiveAccumulator acc;
    registry_.apply("minimal", acc, project_, sandbox_);

    DirectiveList expected = {
        NamespaceDirective{NamespaceAction::UNSHARE, "all"},
        NamespaceDirective{NamespaceAction::SHARE, "net"},
    };
    EXPECT_EQ(expected, acc.directives().namespaces());

    const auto& env = acc.directives().environment();
    EXPECT_TRUE(hasEnv(env, "HOME", sandbox_.string()));
    EXPECT_TRUE(hasEnv(env, "TERM", "dumb"));
    EXPECT_NE(nullptr, findBindTo(acc.directives().mounts(), project_.string()));
}

TEST_F(BuiltinProfilesTest, StandardKeepsNetworkAndHostPath) {
    DirectiveAccumulator acc;
    registry_.apply("standard", acc, project_, sandbox_);

    for (const auto& d : acc.directives().namespaces()) {
        const auto& ns = std::get<NamespaceDirective>(d);
        EXPECT_NE("net", ns.name);
        EXPECT_NE("all", ns.name);
    }

    const auto& mounts = acc.directives().mounts();
    const BindDirective* tools = findBindTo(mounts, (testDir_ / "tools" / "bin").string());
    ASSERT_NE(nullptr, tools);
    EXPECT_EQ(BindMode::READ_ONLY, tools->mode);

    const BindDirective* project = findBindTo(mounts, project_.string());
    ASSERT_NE(nullptr, project);
    EXPECT_EQ(BindMode::READ_WRITE, project->mode);

    const auto& env = acc.directives().environment();
    EXPECT_TRUE(hasEnv(env, "PATH", env_["PATH"]));
    EXPECT_TRUE(hasEnv(env, "XDG_CONFIG_HOME", (sandbox_ / ".config").string()));
    EXPECT_TRUE(hasEnv(env, "GIT_AUTHOR_NAME", "Tester"));
    EXPECT_FALSE(hasEnv(env, "CARGO_HOME", (testDir_ / "home" / ".cargo").string()));
}

TEST_F(BuiltinProfilesTest, DevAddsToolchains) {
    DirectiveAccumulator acc;
    registry_.apply("dev", acc, project_, sandbox_);

    fs::path cargo = testDir_ / "home" / ".cargo";
    const BindDirective* bind = findBindTo(acc.directives().mounts(), cargo.string());
    ASSERT_NE(nullptr, bind);
    EXPECT_EQ(BindMode::READ_ONLY, bind->mode);
    EXPECT_TRUE(hasEnv(acc.directives().environment(), "CARGO_HOME", cargo.string()));
}

TEST_F(BuiltinProfilesTest, ParanoidRemapsProjectAndHome) {
    DirectiveAccumulator acc;
    registry_.apply("paranoid", acc, project_, sandbox_);

    const auto& mounts = acc.directives().mounts();
    const BindDirective* work = findBindTo(mounts, "/work");
    ASSERT_NE(nullptr, work);
    EXPECT_EQ(project_.string(), work->src);
    EXPECT_EQ(BindMode::READ_WRITE, work->mode);

    const BindDirective* home = findBindTo(mounts, "/sandbox");
    ASSERT_NE(nullptr, home);
    EXPECT_EQ(sandbox_.string(), home->src);

    EXPECT_EQ(nullptr, findBindTo(mounts, project_.string()));
    EXPECT_NE(mounts.end(), std::find(mounts.begin(), mounts.end(), Directive(ChdirDirective{"/work"})));

    const auto& env = acc.directives().environment();
    EXPECT_TRUE(hasEnv(env, "HOME", "/sandbox"));
    EXPECT_TRUE(hasEnv(env, "TMPDIR", "/tmp"));

    EXPECT_EQ(fs::path("/sandbox"), registry_.get("paranoid")->homeInside(sandbox_));
    EXPECT_EQ(sandbox_, registry_.get("standard")->homeInside(sandbox_));
}

TEST(SystemMountsTest, PassthroughSkipsUnsetVariables) {
    Environment env = {{"TZ", "UTC"}, {"HTTP_PROXY", ""}, {"UNRELATED", "x"}};
    DirectiveAccumulator acc;

    EXPECT_EQ(1u, SystemMounts::passthroughEnvironment(acc, env));
    DirectiveList expected = {EnvDirective{"TZ", "UTC"}};
    EXPECT_EQ(expected, acc.directives().environment());
}

TEST(SystemMountsTest, PathDirectoriesSkipsMissingEntries) {
    Environment env = {{"PATH", "/nonexistent/a:/nonexistent/b"}};
    DirectiveAccumulator acc;

    EXPECT_EQ(0u, SystemMounts::pathDirectories(acc, env));
    EXPECT_TRUE(acc.directives().empty());
}

#include <gtest/gtest.h>
#include "profile/profile_registry.h"
#include <memory>
#include <stdexcept>

using namespace cjail;
namespace fs = std::filesystem;

namespace {

std::shared_ptr<IProfile> envProfile(const std::string& name, const std::string& value) {
    return std::make_shared<FunctionProfile>(
        [name, value](DirectiveAccumulator& acc, const fs::path&, const fs::path&) {
            acc.setenv(name, value);
        },
        "sets " + name);
}

} // anonymous namespace

TEST(ProfileRegistryTest, RegisterAndGet) {
    ProfileRegistry registry;
    registry.registerProfile("tiny", envProfile("A", "1"));

    EXPECT_TRUE(registry.contains("tiny"));
    EXPECT_EQ(1u, registry.size());
    EXPECT_EQ("sets A", registry.get("tiny")->description());
}

TEST(ProfileRegistryTest, UnknownProfileListsAvailableNames) {
    ProfileRegistry registry;
    registry.registerProfile("beta", envProfile("A", "1"));
    registry.registerProfile("alpha", envProfile("B", "2"));

    try {
        registry.get("gamma");
        FAIL() << "Expected UnknownProfileError";
    } catch (const UnknownProfileError& e) {
        EXPECT_EQ("gamma", e.name());
        std::vector<std::string> expected = {"alpha", "beta"};
        EXPECT_EQ(expected, e.available());
        EXPECT_STREQ("Unknown profile: gamma (available: alpha beta)", e.what());
    }
}

TEST(ProfileRegistryTest, RegisteringExistingNameReplaces) {
    ProfileRegistry registry;
    registry.registerProfile("p", envProfile("A", "old"));
    registry.registerProfile("p", envProfile("A", "new"));

    EXPECT_EQ(1u, registry.size());

    DirectiveAccumulator acc;
    registry.apply("p", acc, "/project", "/sandbox");

    DirectiveList expected = {EnvDirective{"A", "new"}};
    EXPECT_EQ(expected, acc.directives().environment());
}

TEST(ProfileRegistryTest, ListIsSorted) {
    ProfileRegistry registry;
    registry.registerProfile("standard", envProfile("A", "1"));
    registry.registerProfile("dev", envProfile("A", "1"));
    registry.registerProfile("paranoid", envProfile("A", "1"));

    std::vector<std::string> expected = {"dev", "paranoid", "standard"};
    EXPECT_EQ(expected, registry.list());
}

TEST(ProfileRegistryTest, InvalidRegistrationThrows) {
    ProfileRegistry registry;
    EXPECT_THROW(registry.registerProfile("", envProfile("A", "1")), std::invalid_argument);
    EXPECT_THROW(registry.registerProfile("null", nullptr), std::invalid_argument);
    EXPECT_EQ(0u, registry.size());
}

TEST(ProfileRegistryTest, ApplyUnknownProfileAddsNothing) {
    ProfileRegistry registry;
    DirectiveAccumulator acc;

    EXPECT_THROW(registry.apply("missing", acc, "/project", "/sandbox"), UnknownProfileError);
    EXPECT_TRUE(acc.directives().empty());
}

TEST(ProfileRegistryTest, DefaultHomeInsideIsSandbox) {
    FunctionProfile profile([](DirectiveAccumulator&, const fs::path&, const fs::path&) {});
    EXPECT_EQ(fs::path("/host/sandbox"), profile.homeInside("/host/sandbox"));
    EXPECT_TRUE(profile.description().empty());
}

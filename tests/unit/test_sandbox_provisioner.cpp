#include <gtest/gtest.h>
#include "sandbox/sandbox_provisioner.h"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

using namespace cjail;
namespace fs = std::filesystem;

class SandboxProvisionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / ("cjail_provisioner_test_" + std::to_string(getpid()));
        hostHome_ = testDir_ / "host";
        sandboxHome_ = testDir_ / "sandbox";
        fs::create_directories(hostHome_);
    }

    void TearDown() override {
        fs::remove_all(testDir_);
    }

    void writeFile(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }

    fs::path testDir_;
    fs::path hostHome_;
    fs::path sandboxHome_;
};

TEST_F(SandboxProvisionerTest, CreateLayout) {
    SandboxProvisioner provisioner(hostHome_);

    EXPECT_TRUE(provisioner.createLayout(sandboxHome_));
    EXPECT_TRUE(fs::is_directory(sandboxHome_ / ".config"));
    EXPECT_TRUE(fs::is_directory(sandboxHome_ / ".cache"));
    EXPECT_TRUE(fs::is_directory(sandboxHome_ / ".local" / "share"));
    EXPECT_TRUE(fs::is_directory(sandboxHome_ / ".claude"));

    // Idempotent
    EXPECT_TRUE(provisioner.createLayout(sandboxHome_));
}

TEST_F(SandboxProvisionerTest, CopiesAgentStateFileOnce) {
    writeFile(hostHome_ / ".claude.json", "{\"host\": true}");
    SandboxProvisioner provisioner(hostHome_);
    ASSERT_TRUE(provisioner.createLayout(sandboxHome_));

    EXPECT_TRUE(provisioner.copyAgentConfig(sandboxHome_));
    ASSERT_TRUE(fs::is_regular_file(sandboxHome_ / ".claude.json"));

    writeFile(sandboxHome_ / ".claude.json", "{\"sandbox\": true}");
    EXPECT_TRUE(provisioner.copyAgentConfig(sandboxHome_));

    std::ifstream in(sandboxHome_ / ".claude.json");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ("{\"sandbox\": true}", content);
}

TEST_F(SandboxProvisionerTest, MarkerSkipsDirectoryCopy) {
    writeFile(hostHome_ / ".claude" / "settings.json", "{}");
    writeFile(sandboxHome_ / ".claude" / ".copied", "");

    SandboxProvisioner provisioner(hostHome_);
    EXPECT_TRUE(provisioner.copyAgentConfig(sandboxHome_));
    EXPECT_FALSE(fs::exists(sandboxHome_ / ".claude" / "settings.json"));
}

TEST_F(SandboxProvisionerTest, NothingToCopy) {
    SandboxProvisioner provisioner(hostHome_);
    ASSERT_TRUE(provisioner.createLayout(sandboxHome_));

    EXPECT_TRUE(provisioner.copyAgentConfig(sandboxHome_));
    EXPECT_FALSE(fs::exists(sandboxHome_ / ".claude.json"));
    EXPECT_FALSE(fs::exists(sandboxHome_ / ".claude" / ".copied"));
}

TEST_F(SandboxProvisionerTest, CleanRemovesSandbox) {
    SandboxProvisioner provisioner(hostHome_);
    ASSERT_TRUE(provisioner.createLayout(sandboxHome_));
    writeFile(sandboxHome_ / ".cache" / "file", "data");

    EXPECT_GT(provisioner.clean(sandboxHome_), 0u);
    EXPECT_FALSE(fs::exists(sandboxHome_));
    EXPECT_EQ(0u, provisioner.clean(sandboxHome_));
}

TEST_F(SandboxProvisionerTest, FindCredentialsSearchOrder) {
    Environment env;
    env["HOME"] = hostHome_.string();
    env["XDG_CONFIG_HOME"] = (hostHome_ / ".config").string();

    EXPECT_FALSE(SandboxProvisioner::findCredentials(env).has_value());

    writeFile(hostHome_ / ".claude" / ".credentials.json", "{}");
    auto found = SandboxProvisioner::findCredentials(env);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(hostHome_ / ".claude" / ".credentials.json", *found);

    writeFile(hostHome_ / ".config" / "claude" / ".credentials.json", "{}");
    found = SandboxProvisioner::findCredentials(env);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(hostHome_ / ".config" / "claude" / ".credentials.json", *found);

    env["CLAUDE_CONFIG_DIR"] = (testDir_ / "custom").string();
    writeFile(testDir_ / "custom" / ".credentials.json", "{}");
    found = SandboxProvisioner::findCredentials(env);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(testDir_ / "custom" / ".credentials.json", *found);
}

TEST(SandboxProvisionerCommandTest, RunCommandReportsExitStatus) {
    EXPECT_EQ(0, SandboxProvisioner::runCommand({"true"}));
    EXPECT_EQ(1, SandboxProvisioner::runCommand({"false"}));
    EXPECT_EQ(127, SandboxProvisioner::runCommand({"cjail-no-such-command"}));
    EXPECT_EQ(-1, SandboxProvisioner::runCommand({}));
}

#include "profile/builtin_profiles.h"
#include "profile/system_mounts.h"
#include <memory>
#include <utility>

namespace fs = std::filesystem;

namespace cjail {

namespace {

const char* const kDefaultTerm = "xterm-256color";
const char* const kDefaultLang = "en_US.UTF-8";
const char* const kSystemPath = "/usr/local/bin:/usr/bin:/bin";

void setXdgEnvironment(DirectiveAccumulator& acc, const fs::path& home) {
    acc.setenv("HOME", home.string());
    acc.setenv("XDG_CONFIG_HOME", (home / ".config").string());
    acc.setenv("XDG_DATA_HOME", (home / ".local/share").string());
    acc.setenv("XDG_CACHE_HOME", (home / ".cache").string());
}

} // anonymous namespace

// ==================================================================
// EnvironmentProfile
// ==================================================================

EnvironmentProfile::EnvironmentProfile(Environment env)
    : env_(std::move(env)) {
}

std::string EnvironmentProfile::env(const std::string& name, const std::string& defaultValue) const {
    return getEnv(env_, name, defaultValue);
}

fs::path EnvironmentProfile::hostHome() const {
    return homeDirectory(env_);
}

// ==================================================================
// MinimalProfile
// ==================================================================

void MinimalProfile::apply(DirectiveAccumulator& acc, const fs::path& project,
                           const fs::path& sandbox) const {
    acc.unshare({"all"});
    acc.share({"net"});

    acc.roBind("/usr");
    acc.roBind("/etc");
    acc.roBind("/run");

    acc.proc();
    acc.dev();

    SystemMounts::linkOrBind(acc, "/lib64", "usr/lib64");

    acc.tmpfs("/tmp");

    acc.bind(project);
    acc.bind(sandbox);

    acc.setenv("HOME", sandbox.string());
    acc.setenv("PATH", kSystemPath);
    acc.setenv("TERM", env("TERM", kDefaultTerm));

    acc.chdir(project);
}

std::string MinimalProfile::description() const {
    return "Fast startup, basic protection";
}

// ==================================================================
// StandardProfile
// ==================================================================

void StandardProfile::apply(DirectiveAccumulator& acc, const fs::path& project,
                            const fs::path& sandbox) const {
    acc.unshare({"user", "pid", "uts", "ipc", "cgroup"});

    SystemMounts::base(acc);
    SystemMounts::dns(acc);
    SystemMounts::ssl(acc);
    SystemMounts::users(acc);

    acc.proc();
    acc.dev();

    acc.tmpfs("/tmp");
    acc.tmpfs("/run");

    SystemMounts::pathDirectories(acc, environment());
    bindExtras(acc);

    acc.bind(project);
    acc.bind(sandbox);

    setXdgEnvironment(acc, sandbox);
    setExtraEnvironment(acc);
    acc.setenv("PATH", env("PATH", kSystemPath));
    acc.setenv("TERM", env("TERM", kDefaultTerm));
    acc.setenv("LANG", env("LANG", kDefaultLang));
    acc.setenv("SHELL", "/bin/bash");

    SystemMounts::passthroughEnvironment(acc, environment());

    acc.chdir(project);
}

std::string StandardProfile::description() const {
    return "Selective system mounts, host PATH preserved (default)";
}

void StandardProfile::bindExtras(DirectiveAccumulator&) const {
}

void StandardProfile::setExtraEnvironment(DirectiveAccumulator&) const {
}

// ==================================================================
// DevProfile
// ==================================================================

std::string DevProfile::description() const {
    return "Standard plus user toolchains (mise, cargo, uv, node, go)";
}

void DevProfile::bindExtras(DirectiveAccumulator& acc) const {
    acc.roBind("/etc/alternatives");
    SystemMounts::toolchains(acc, hostHome());
}

void DevProfile::setExtraEnvironment(DirectiveAccumulator& acc) const {
    SystemMounts::toolchainEnvironment(acc, hostHome());
}

// ==================================================================
// ParanoidProfile
// ==================================================================

ParanoidProfile::ParanoidProfile(Environment env)
    : term_(getEnv(env, "TERM", kDefaultTerm)) {
}

void ParanoidProfile::apply(DirectiveAccumulator& acc, const fs::path& project,
                            const fs::path& sandbox) const {
    acc.unshare({"all"});
    // Network is still needed for the API
    acc.share({"net"});

    acc.roBind("/usr");
    acc.roBind("/bin");
    acc.roBind("/lib");
    SystemMounts::linkOrBind(acc, "/lib64", "usr/lib64");

    acc.roBind("/etc/resolv.conf");
    acc.roBind("/etc/hosts");
    acc.roBind("/etc/ssl");
    acc.roBind("/etc/ca-certificates");

    acc.proc();
    acc.dev();
    acc.tmpfs("/tmp");

    acc.bind(project, WORK_DIR);
    acc.bind(sandbox, SANDBOX_DIR);

    setXdgEnvironment(acc, SANDBOX_DIR);
    acc.setenv("PATH", kSystemPath);
    acc.setenv("TERM", term_);
    acc.setenv("LANG", "C.UTF-8");
    acc.setenv("SHELL", "/bin/sh");
    acc.setenv("TMPDIR", "/tmp");

    acc.chdir(WORK_DIR);
}

fs::path ParanoidProfile::homeInside(const fs::path&) const {
    return SANDBOX_DIR;
}

std::string ParanoidProfile::description() const {
    return "Maximum isolation, project at /work and home at /sandbox";
}

// ==================================================================
// Registration
// ==================================================================

void registerBuiltinProfiles(ProfileRegistry& registry, const Environment& env) {
    registry.registerProfile("minimal", std::make_shared<MinimalProfile>(env));
    registry.registerProfile("standard", std::make_shared<StandardProfile>(env));
    registry.registerProfile("dev", std::make_shared<DevProfile>(env));
    registry.registerProfile("paranoid", std::make_shared<ParanoidProfile>(env));
}

} // namespace cjail

#include "config/sandbox_settings.h"

namespace cjail {

SandboxSettings::SandboxSettings() : Properties() {
    loadDefaults();
}

SandboxSettings::SandboxSettings(const Properties& props) : Properties(props) {
    loadDefaults();
}

std::string SandboxSettings::getProfile() const {
    return getString(PROP_PROFILE, DEFAULT_PROFILE);
}

void SandboxSettings::setProfile(const std::string& profile) {
    set(PROP_PROFILE, profile);
}

bool SandboxSettings::isNetworkEnabled() const {
    return getBool(PROP_NETWORK, true);
}

void SandboxSettings::setNetworkEnabled(bool enabled) {
    set(PROP_NETWORK, enabled);
}

std::string SandboxSettings::getSandboxHome() const {
    return getString(PROP_SANDBOX_HOME, DEFAULT_SANDBOX_DIR);
}

void SandboxSettings::setSandboxHome(const std::string& home) {
    set(PROP_SANDBOX_HOME, home);
}

std::string SandboxSettings::getSandboxName() const {
    return getString(PROP_SANDBOX_NAME, DEFAULT_SANDBOX_DIR);
}

void SandboxSettings::setSandboxName(const std::string& name) {
    set(PROP_SANDBOX_NAME, name);
}

bool SandboxSettings::isCopyConfigEnabled() const {
    return getBool(PROP_COPY_CONFIG, true);
}

void SandboxSettings::setCopyConfigEnabled(bool enabled) {
    set(PROP_COPY_CONFIG, enabled);
}

bool SandboxSettings::isVerbose() const {
    return getBool(PROP_VERBOSE, false);
}

void SandboxSettings::setVerbose(bool verbose) {
    set(PROP_VERBOSE, verbose);
}

bool SandboxSettings::isGitWorktreeReadOnly() const {
    return getBool(PROP_GIT_WORKTREE_RO, false);
}

void SandboxSettings::setGitWorktreeReadOnly(bool readOnly) {
    set(PROP_GIT_WORKTREE_RO, readOnly);
}

std::string SandboxSettings::getGitRoot() const {
    return getString(PROP_GIT_ROOT, "");
}

void SandboxSettings::setGitRoot(const std::string& root) {
    set(PROP_GIT_ROOT, root);
}

std::vector<std::string> SandboxSettings::getExtraReadOnlyPaths() const {
    return getStringList(PROP_EXTRA_RO);
}

void SandboxSettings::setExtraReadOnlyPaths(const std::vector<std::string>& paths) {
    set(PROP_EXTRA_RO, paths);
}

std::vector<std::string> SandboxSettings::getExtraReadWritePaths() const {
    return getStringList(PROP_EXTRA_RW);
}

void SandboxSettings::setExtraReadWritePaths(const std::vector<std::string>& paths) {
    set(PROP_EXTRA_RW, paths);
}

std::vector<std::string> SandboxSettings::getBlockedPaths() const {
    return getStringList(PROP_BLOCKED);
}

void SandboxSettings::setBlockedPaths(const std::vector<std::string>& paths) {
    set(PROP_BLOCKED, paths);
}

bool SandboxSettings::validate() const {
    if (getProfile().empty()) {
        return false;
    }

    std::string name = getSandboxName();
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        return false;
    }

    return !getSandboxHome().empty();
}

void SandboxSettings::loadDefaults() {
    if (!has(PROP_PROFILE)) {
        set(PROP_PROFILE, std::string(DEFAULT_PROFILE));
    }
    if (!has(PROP_NETWORK)) {
        set(PROP_NETWORK, true);
    }
    if (!has(PROP_SANDBOX_HOME)) {
        set(PROP_SANDBOX_HOME, std::string(DEFAULT_SANDBOX_DIR));
    }
    if (!has(PROP_SANDBOX_NAME)) {
        set(PROP_SANDBOX_NAME, std::string(DEFAULT_SANDBOX_DIR));
    }
    if (!has(PROP_COPY_CONFIG)) {
        set(PROP_COPY_CONFIG, true);
    }
    if (!has(PROP_VERBOSE)) {
        set(PROP_VERBOSE, false);
    }
    if (!has(PROP_GIT_WORKTREE_RO)) {
        set(PROP_GIT_WORKTREE_RO, false);
    }
    if (!has(PROP_GIT_ROOT)) {
        set(PROP_GIT_ROOT, std::string());
    }
    if (!has(PROP_EXTRA_RO)) {
        set(PROP_EXTRA_RO, std::vector<std::string>());
    }
    if (!has(PROP_EXTRA_RW)) {
        set(PROP_EXTRA_RW, std::vector<std::string>());
    }
    if (!has(PROP_BLOCKED)) {
        set(PROP_BLOCKED, std::vector<std::string>());
    }
}

const std::vector<std::string>& SandboxSettings::knownKeys() {
    static const std::vector<std::string> keys = {
        PROP_PROFILE,
        PROP_NETWORK,
        PROP_SANDBOX_HOME,
        PROP_SANDBOX_NAME,
        PROP_COPY_CONFIG,
        PROP_VERBOSE,
        PROP_GIT_WORKTREE_RO,
        PROP_GIT_ROOT,
        PROP_EXTRA_RO,
        PROP_EXTRA_RW,
        PROP_BLOCKED
    };
    return keys;
}

} // namespace cjail

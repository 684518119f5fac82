#ifndef CJAIL_SANDBOX_SETTINGS_H
#define CJAIL_SANDBOX_SETTINGS_H

#include "utils/properties.h"
#include <string>
#include <vector>

namespace cjail {

/**
 * @brief Sandbox configuration properties
 *
 * Extends the base Properties class with the sandbox configuration keys.
 * Provides strongly-typed access to every key; a default-constructed
 * object carries the built-in defaults.
 */
class SandboxSettings : public Properties {
public:
    // Property keys
    static constexpr const char* PROP_PROFILE = "profile";
    static constexpr const char* PROP_NETWORK = "network";
    static constexpr const char* PROP_SANDBOX_HOME = "sandbox_home";
    static constexpr const char* PROP_SANDBOX_NAME = "sandbox_name";
    static constexpr const char* PROP_COPY_CONFIG = "copy_config";
    static constexpr const char* PROP_VERBOSE = "verbose";
    static constexpr const char* PROP_GIT_WORKTREE_RO = "git_worktree_ro";
    static constexpr const char* PROP_GIT_ROOT = "git_root";

    static constexpr const char* PROP_EXTRA_RO = "extra_ro";
    static constexpr const char* PROP_EXTRA_RW = "extra_rw";
    static constexpr const char* PROP_BLOCKED = "blocked";

    static constexpr const char* DEFAULT_PROFILE = "standard";
    static constexpr const char* DEFAULT_SANDBOX_DIR = ".claude-sandbox";

    /**
     * @brief Default constructor with default values
     */
    SandboxSettings();

    /**
     * @brief Construct from base Properties, filling missing keys with defaults
     */
    explicit SandboxSettings(const Properties& props);

    std::string getProfile() const;
    void setProfile(const std::string& profile);

    bool isNetworkEnabled() const;
    void setNetworkEnabled(bool enabled);

    /**
     * @brief Sandbox home: an absolute parent directory, or a relative leaf name
     */
    std::string getSandboxHome() const;
    void setSandboxHome(const std::string& home);

    std::string getSandboxName() const;
    void setSandboxName(const std::string& name);

    bool isCopyConfigEnabled() const;
    void setCopyConfigEnabled(bool enabled);

    bool isVerbose() const;
    void setVerbose(bool verbose);

    bool isGitWorktreeReadOnly() const;
    void setGitWorktreeReadOnly(bool readOnly);

    /**
     * @brief Manual main repository root, empty when auto-detection is used
     */
    std::string getGitRoot() const;
    void setGitRoot(const std::string& root);

    std::vector<std::string> getExtraReadOnlyPaths() const;
    void setExtraReadOnlyPaths(const std::vector<std::string>& paths);

    std::vector<std::string> getExtraReadWritePaths() const;
    void setExtraReadWritePaths(const std::vector<std::string>& paths);

    std::vector<std::string> getBlockedPaths() const;
    void setBlockedPaths(const std::vector<std::string>& paths);

    /**
     * @brief Validate settings
     * @return true if the profile and sandbox name are usable
     */
    bool validate() const;

    /**
     * @brief Load default properties for missing keys
     */
    void loadDefaults();

    /**
     * @brief All keys understood by the resolver, in display order
     */
    static const std::vector<std::string>& knownKeys();
};

} // namespace cjail

#endif // CJAIL_SANDBOX_SETTINGS_H

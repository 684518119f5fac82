#ifndef CJAIL_CONFIG_RESOLVER_H
#define CJAIL_CONFIG_RESOLVER_H

#include "config/config_source.h"
#include "config/sandbox_settings.h"
#include "utils/environment.h"
#include "utils/properties.h"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cjail {

/**
 * @brief A config file location and the scope it represents
 */
struct ConfigCandidate {
    std::filesystem::path path;
    ConfigSource scope;
};

/**
 * @brief Result of configuration resolution
 *
 * Immutable once returned: every key has exactly one value and remembers
 * the tier it came from.
 */
struct ResolvedConfiguration {
    SandboxSettings settings;
    std::map<std::string, ConfigSource> sources;
    std::optional<ConfigCandidate> loadedFile;

    /**
     * @brief Tier that supplied the value of key (DEFAULT if unknown)
     */
    ConfigSource sourceOf(const std::string& key) const;

    /**
     * @brief Render the configuration, one key per line with its source
     */
    std::string show() const;
};

/**
 * @brief Layered configuration resolver
 *
 * Resolution order, highest wins:
 * 1. invocation-time overrides (command line)
 * 2. CJ_* environment variables
 * 3. the first existing, well-formed file among the candidates
 * 4. built-in defaults
 *
 * Candidates, in order: $CJ_CONFIG_FILE (or an explicit --config path),
 * <project>/.claude-jail.json, $XDG_CONFIG_HOME/claude-jail/config.json,
 * ~/.claude-jail.json. At most one file is loaded; a file that fails to
 * parse is skipped with a warning and the search goes on.
 *
 * A tier that defines a key replaces the lower tiers' value wholesale,
 * lists included.
 */
class ConfigResolver {
public:
    static constexpr const char* ENV_PROFILE = "CJ_PROFILE";
    static constexpr const char* ENV_NETWORK = "CJ_NETWORK";
    static constexpr const char* ENV_SANDBOX_HOME = "CJ_SANDBOX_HOME";
    static constexpr const char* ENV_SANDBOX_NAME = "CJ_SANDBOX_NAME";
    static constexpr const char* ENV_COPY_CONFIG = "CJ_COPY_CLAUDE_CONFIG";
    static constexpr const char* ENV_VERBOSE = "CJ_VERBOSE";
    static constexpr const char* ENV_GIT_WORKTREE_RO = "CJ_GIT_WORKTREE_RO";
    static constexpr const char* ENV_EXTRA_RO = "CJ_EXTRA_RO";
    static constexpr const char* ENV_EXTRA_RW = "CJ_EXTRA_RW";
    static constexpr const char* ENV_BLOCKED = "CJ_BLOCKED";
    static constexpr const char* ENV_CONFIG_FILE = "CJ_CONFIG_FILE";

    static constexpr const char* PROJECT_CONFIG_NAME = ".claude-jail.json";
    static constexpr const char* USER_CONFIG_DIR = "claude-jail";
    static constexpr const char* USER_CONFIG_NAME = "config.json";
    static constexpr const char* LEGACY_CONFIG_NAME = ".claude-jail.json";

    /**
     * @param env Environment snapshot
     * @param projectDir Project directory searched for the project-local file
     */
    ConfigResolver(Environment env, std::filesystem::path projectDir);

    /**
     * @brief Use this file as the explicit candidate instead of $CJ_CONFIG_FILE
     */
    void setExplicitConfigFile(const std::filesystem::path& path);

    /**
     * @brief Config file candidates in search order
     */
    std::vector<ConfigCandidate> candidates() const;

    /**
     * @brief Resolve the configuration
     * @param overrides Command line values (highest precedence)
     */
    ResolvedConfiguration resolve(const Properties& overrides = Properties()) const;

    /**
     * @brief Values defined by CJ_* environment variables
     */
    Properties environmentTier() const;

    /**
     * @brief Load the first well-formed candidate into out
     * @return The loaded candidate, std::nullopt if none was usable
     */
    std::optional<ConfigCandidate> loadFileTier(Properties& out) const;

    /**
     * @brief Configuration reference shown by --help-config
     */
    static std::string helpText();

private:
    static void applyTier(Properties& merged, std::map<std::string, ConfigSource>& sources,
                          const Properties& tier, ConfigSource source);

    Environment env_;
    std::filesystem::path projectDir_;
    std::optional<std::filesystem::path> explicitConfig_;
};

} // namespace cjail

#endif // CJAIL_CONFIG_RESOLVER_H

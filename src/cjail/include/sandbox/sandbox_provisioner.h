#ifndef CJAIL_SANDBOX_PROVISIONER_H
#define CJAIL_SANDBOX_PROVISIONER_H

#include "utils/environment.h"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cjail {

/**
 * @brief Prepares the sandbox home on the host
 *
 * The sandbox home becomes $HOME inside the sandbox. On first use it
 * receives a copy of the host agent configuration so that the agent starts
 * logged in with the user's settings. The copy is delegated to rsync and
 * is made once: a marker file records that it happened.
 */
class SandboxProvisioner {
public:
    static constexpr const char* AGENT_DIR = ".claude";
    static constexpr const char* AGENT_STATE_FILE = ".claude.json";
    static constexpr const char* COPIED_MARKER = ".copied";
    static constexpr const char* CREDENTIALS_FILE = ".credentials.json";

    /**
     * @param hostHome Host home directory holding the agent configuration
     */
    explicit SandboxProvisioner(std::filesystem::path hostHome);

    /**
     * @brief Create .config, .cache, .local/share and .claude under home
     * @return false if a directory could not be created
     */
    bool createLayout(const std::filesystem::path& home) const;

    /**
     * @brief Copy the host agent configuration into a fresh sandbox home
     *
     * Copies ~/.claude/ with "rsync -a --ignore-existing" unless the marker
     * exists, then creates the marker. Copies ~/.claude.json when the
     * sandbox has none. Failures are logged as warnings.
     *
     * @return true if everything needed was copied
     */
    bool copyAgentConfig(const std::filesystem::path& home) const;

    /**
     * @brief Remove the sandbox home and everything below it
     * @return Number of removed entries, 0 if home did not exist
     */
    std::uintmax_t clean(const std::filesystem::path& home) const;

    /**
     * @brief Locate the host credentials file
     *
     * Searched in $CLAUDE_CONFIG_DIR, ${XDG_CONFIG_HOME:-~/.config}/claude
     * and ~/.claude, in that order.
     */
    static std::optional<std::filesystem::path> findCredentials(const Environment& env);

    /**
     * @brief Run a command and wait for it
     * @return Exit status, or -1 if it could not be started
     */
    static int runCommand(const std::vector<std::string>& argv);

private:
    std::filesystem::path hostHome_;
};

} // namespace cjail

#endif // CJAIL_SANDBOX_PROVISIONER_H

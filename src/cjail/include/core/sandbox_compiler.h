#ifndef CJAIL_SANDBOX_COMPILER_H
#define CJAIL_SANDBOX_COMPILER_H

#include "config/config_resolver.h"
#include "directive/directive_accumulator.h"
#include "git/git_worktree_resolver.h"
#include "profile/profile_registry.h"
#include "utils/environment.h"
#include "utils/properties.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cjail {

/**
 * @brief Inputs of one compilation
 */
struct CompileRequest {
    std::filesystem::path projectDir;             ///< Project to expose (must exist)
    std::filesystem::path workingDir;             ///< Base of a relative sandbox home
    std::vector<std::string> command;             ///< Command to run inside the sandbox
    Properties overrides;                         ///< Command line configuration values
    std::optional<std::filesystem::path> configFile;
    bool dryRun = false;                          ///< Do not copy agent config or touch files
    bool gitEnabled = true;
};

/**
 * @brief Output of one compilation
 */
struct CompiledSandbox {
    std::filesystem::path projectDir;             ///< Canonical project directory
    std::filesystem::path sandboxHome;            ///< Sandbox root on the host
    std::filesystem::path homeInside;             ///< Sandbox root as seen inside
    std::string profile;
    GitBindingResult git;
    std::optional<std::filesystem::path> credentials;
    std::vector<std::string> arguments;           ///< Engine argument vector
};

/**
 * @brief Runs the whole pipeline for one invocation
 *
 * Order:
 * 1. validate the project directory
 * 2. resolve the configuration (or use the one given)
 * 3. look up the profile
 * 4. resolve and validate the sandbox home
 * 5. provision the sandbox home
 * 6. reset the accumulator and apply the profile
 * 7. unshare the network when disabled
 * 8. git worktree bindings and shared worktree agent files
 * 9. extra read-only and read-write paths
 * 10. blocked paths
 * 11. credentials
 * 12. resolve the command binary and expose its directory
 * 13. emit the argument vector
 *
 * Fatal errors (unknown profile, unsafe sandbox root, invalid git root,
 * missing project) are thrown before anything is executed.
 */
class SandboxCompiler {
public:
    static constexpr const char* DEV_NULL = "/dev/null";

    /**
     * @param registry Profiles to choose from (must outlive the compiler)
     * @param env Environment snapshot
     */
    SandboxCompiler(const ProfileRegistry& registry, Environment env);

    // Prevent copying
    SandboxCompiler(const SandboxCompiler&) = delete;
    SandboxCompiler& operator=(const SandboxCompiler&) = delete;

    /**
     * @brief Resolve the configuration for a request
     * @throws PathNotFoundError if the project directory does not exist
     */
    ResolvedConfiguration resolveConfiguration(const CompileRequest& request) const;

    /**
     * @brief Sandbox root for a resolved configuration
     * @throws UnsafeSandboxRootError if the root is a system directory
     */
    std::filesystem::path resolveSandboxHome(const ResolvedConfiguration& config,
                                             const CompileRequest& request) const;

    /**
     * @brief Compile a request, resolving its configuration first
     */
    CompiledSandbox compile(const CompileRequest& request);

    /**
     * @brief Compile a request with an already resolved configuration
     *
     * @throws PathNotFoundError if the project directory does not exist
     * @throws UnknownProfileError if the configured profile is not registered
     * @throws UnsafeSandboxRootError if the sandbox root is a system directory
     * @throws InvalidGitRootError if the manual git root has no .git directory
     */
    CompiledSandbox compile(const CompileRequest& request, const ResolvedConfiguration& config);

    /**
     * @brief Directives of the last compilation
     */
    const DirectiveAccumulator& accumulator() const { return acc_; }

private:
    std::filesystem::path projectDirectory(const CompileRequest& request) const;
    void applyExtraPaths(const std::vector<std::string>& paths, BindMode mode);
    void applyBlockedPaths(const std::vector<std::string>& paths);
    std::vector<std::string> resolveCommand(std::vector<std::string> command);
    std::optional<std::filesystem::path> bindCredentials(const std::filesystem::path& sandboxHome,
                                                         const std::filesystem::path& homeInside,
                                                         bool dryRun);

    const ProfileRegistry& registry_;
    Environment env_;
    DirectiveAccumulator acc_;
};

} // namespace cjail

#endif // CJAIL_SANDBOX_COMPILER_H

#ifndef CJAIL_SANDBOX_HOME_RESOLVER_H
#define CJAIL_SANDBOX_HOME_RESOLVER_H

#include "config/config_source.h"
#include "config/sandbox_settings.h"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace cjail {

/**
 * @brief Thrown when the sandbox root would be a system directory
 */
class UnsafeSandboxRootError : public std::runtime_error {
public:
    explicit UnsafeSandboxRootError(const std::string& path)
        : std::runtime_error("Refusing to use system directory as sandbox root: " + path)
        , path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Computes and validates the sandbox root directory
 *
 * The sandbox root is parent/name:
 * - an absolute sandbox home is the parent, and the sandbox name the leaf
 * - a relative sandbox home is the leaf, and the working directory the parent
 *
 * Resolving from the working directory (not the project) lets several
 * worktrees started from the same directory share one sandbox.
 */
class SandboxHomeResolver {
public:
    /**
     * @brief Compute the sandbox root
     *
     * @param home Configured sandbox home (~ is expanded against homeDir)
     * @param name Sandbox directory name, used when home is absolute
     * @param cwd Working directory, used when home is relative
     * @param homeDir Host home directory
     */
    static std::filesystem::path resolve(const std::string& home, const std::string& name,
                                         const std::filesystem::path& cwd,
                                         const std::filesystem::path& homeDir);

    /**
     * @brief Compute and validate the sandbox root for resolved settings
     *
     * Logs an advisory warning when the sandbox home came from a user-level
     * config file, since it then applies to every project.
     *
     * @throws UnsafeSandboxRootError if the root is a system directory
     */
    static std::filesystem::path resolve(const SandboxSettings& settings, ConfigSource homeSource,
                                         const std::filesystem::path& cwd,
                                         const std::filesystem::path& homeDir);

    /**
     * @brief Test whether path (lexically normalized) is a protected system directory
     *
     * Only the directories themselves are protected; anything below them
     * is accepted.
     */
    static bool isUnsafeRoot(const std::filesystem::path& path);

    /**
     * @throws UnsafeSandboxRootError if isUnsafeRoot(path)
     */
    static void validate(const std::filesystem::path& path);
};

} // namespace cjail

#endif // CJAIL_SANDBOX_HOME_RESOLVER_H

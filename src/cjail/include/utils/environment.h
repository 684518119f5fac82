#ifndef CJAIL_ENVIRONMENT_H
#define CJAIL_ENVIRONMENT_H

#include <filesystem>
#include <map>
#include <string>

namespace cjail {

/**
 * @brief Snapshot of process environment variables
 *
 * Components receive a snapshot instead of calling getenv() so that a
 * compilation pass sees one consistent view and tests can inject values.
 */
using Environment = std::map<std::string, std::string>;

/**
 * @brief Capture the current process environment
 */
Environment captureEnvironment();

/**
 * @brief Look up a variable, treating empty values as unset
 */
std::string getEnv(const Environment& env, const std::string& name,
                   const std::string& defaultValue = "");

/**
 * @brief $HOME, or the password database entry of the current user
 */
std::filesystem::path homeDirectory(const Environment& env);

/**
 * @brief $XDG_CONFIG_HOME, or ~/.config
 */
std::filesystem::path configHome(const Environment& env);

} // namespace cjail

#endif // CJAIL_ENVIRONMENT_H

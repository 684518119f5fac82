#ifndef CJAIL_PATH_UTILS_H
#define CJAIL_PATH_UTILS_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cjail {

/**
 * @brief Split a separator-delimited list ("a:b:c")
 *
 * Empty elements are dropped, so "a::b:" yields {"a", "b"}.
 */
std::vector<std::string> splitList(const std::string& value, char separator = ':');

/**
 * @brief Normalize a sandbox-side destination path
 *
 * Collapses "." and ".." lexically and strips a trailing separator.
 * No filesystem access: the destination lives inside the sandbox.
 */
std::filesystem::path normalizeDestination(const std::filesystem::path& path);

/**
 * @brief Resolve a host path to its canonical (symlink-free) form
 *
 * Falls back to the absolute, lexically normalized path when the path
 * cannot be canonicalized.
 */
std::filesystem::path canonicalOrAbsolute(const std::filesystem::path& path);

/**
 * @brief Strict ancestors of an absolute path, shallowest first
 *
 * "/a/b/c" yields {"/a", "/a/b"}. The root and the path itself are not
 * included. Relative paths yield no ancestors.
 */
std::vector<std::filesystem::path> ancestorsOf(const std::filesystem::path& path);

/**
 * @brief Test whether child lies strictly below parent (component-wise)
 */
bool isWithin(const std::filesystem::path& child, const std::filesystem::path& parent);

/**
 * @brief Expand a leading "~" against the given home directory
 */
std::filesystem::path expandHome(const std::string& path, const std::filesystem::path& home);

/**
 * @brief Look up an executable on a colon-separated search path
 *
 * A name containing '/' is returned as is when it is executable.
 */
std::optional<std::filesystem::path> findExecutable(const std::string& name,
                                                    const std::string& searchPath);

} // namespace cjail

#endif // CJAIL_PATH_UTILS_H

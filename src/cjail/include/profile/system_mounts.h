#ifndef CJAIL_SYSTEM_MOUNTS_H
#define CJAIL_SYSTEM_MOUNTS_H

#include "directive/directive_accumulator.h"
#include "utils/environment.h"
#include <filesystem>
#include <string>

namespace cjail {

/**
 * @brief Reusable directive groups shared by the built-in profiles
 *
 * Every group checks the host first and silently skips what is absent,
 * so profiles work across distributions (merged /usr or not, with or
 * without /etc/pki, ...).
 */
class SystemMounts {
public:
    /**
     * @brief /usr read-only, /bin /lib /lib64 /sbin as symlinks or binds,
     * /etc/alternatives
     */
    static void base(DirectiveAccumulator& acc);

    /**
     * @brief Name resolution files under /etc
     */
    static void dns(DirectiveAccumulator& acc);

    /**
     * @brief Certificate stores
     */
    static void ssl(DirectiveAccumulator& acc);

    /**
     * @brief passwd, group and localtime
     */
    static void users(DirectiveAccumulator& acc);

    /**
     * @brief Every existing directory of $PATH, read-only
     * @return Number of directories bound
     */
    static size_t pathDirectories(DirectiveAccumulator& acc, const Environment& env);

    /**
     * @brief Per-user toolchain directories (mise, cargo, uv, node, go, ...), read-only
     * @return Number of directories bound
     */
    static size_t toolchains(DirectiveAccumulator& acc, const std::filesystem::path& hostHome);

    /**
     * @brief Toolchain variables pointing at the host directories
     */
    static void toolchainEnvironment(DirectiveAccumulator& acc, const std::filesystem::path& hostHome);

    /**
     * @brief Forward git identity, proxy settings, API key and TZ when set
     * @return Number of variables forwarded
     */
    static size_t passthroughEnvironment(DirectiveAccumulator& acc, const Environment& env);

    /**
     * @brief Recreate a top-level symlink (e.g. /lib64 -> usr/lib64) or bind
     * the directory when it is real
     */
    static void linkOrBind(DirectiveAccumulator& acc, const std::filesystem::path& path,
                           const std::string& target);
};

} // namespace cjail

#endif // CJAIL_SYSTEM_MOUNTS_H

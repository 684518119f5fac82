#ifndef CJAIL_DIRECTIVE_ACCUMULATOR_H
#define CJAIL_DIRECTIVE_ACCUMULATOR_H

#include "directive/directive.h"
#include "directive/path_directive_set.h"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace cjail {

/**
 * @brief Thrown when a mandatory bind source does not exist
 */
class PathNotFoundError : public std::runtime_error {
public:
    explicit PathNotFoundError(const std::string& path)
        : std::runtime_error("Path not found: " + path)
        , path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Builds a PathDirectiveSet through primitive sandbox operations
 *
 * One accumulator is owned by one compilation pass. Profiles and the
 * auxiliary contributors (git resolver, extra path lists) only talk to the
 * sandbox through these primitives.
 *
 * Rules:
 * - bind/roBind fail (return false, add nothing) when the source is missing.
 *   The source is resolved to its canonical form. Missing ancestors of the
 *   destination get Dir directives, each queued once. Binding an already
 *   bound destination is a silent no-op that still reports success.
 * - tmpfs and symlink follow the same ancestor rule. A symlink link is also
 *   remembered as an existing directory for later ancestor walks.
 * - unshare/share append one directive per recognized namespace name and
 *   ignore the others.
 * - setenv always appends; the engine applies them in order so the last
 *   value for a name wins.
 *
 * Not thread-safe: a compilation pass is single-threaded.
 */
class DirectiveAccumulator {
public:
    DirectiveAccumulator() = default;

    DirectiveAccumulator(const DirectiveAccumulator&) = delete;
    DirectiveAccumulator& operator=(const DirectiveAccumulator&) = delete;

    /**
     * @brief Bind src at the same path inside the sandbox
     * @return false if src does not exist
     */
    bool bind(const std::filesystem::path& src, BindMode mode = BindMode::READ_WRITE);

    /**
     * @brief Bind src at dst inside the sandbox
     * @return false if src does not exist
     */
    bool bind(const std::filesystem::path& src, const std::filesystem::path& dst,
              BindMode mode = BindMode::READ_WRITE);

    bool roBind(const std::filesystem::path& src) {
        return bind(src, BindMode::READ_ONLY);
    }

    bool roBind(const std::filesystem::path& src, const std::filesystem::path& dst) {
        return bind(src, dst, BindMode::READ_ONLY);
    }

    /**
     * @brief Bind a path that must exist
     * @throws PathNotFoundError if src does not exist
     */
    void requireBind(const std::filesystem::path& src, const std::filesystem::path& dst,
                     BindMode mode = BindMode::READ_WRITE);

    void tmpfs(const std::filesystem::path& path);
    void symlink(const std::string& target, const std::filesystem::path& link);
    void dev(const std::filesystem::path& path = "/dev");
    void proc(const std::filesystem::path& path = "/proc");
    void setenv(const std::string& name, const std::string& value);
    void chdir(const std::filesystem::path& path);

    /**
     * @brief Detach from the named namespaces
     *
     * Recognized: all, user, pid, net, ipc, uts, cgroup.
     *
     * @return Number of directives appended
     */
    size_t unshare(const std::vector<std::string>& names);

    /**
     * @brief Keep the named namespaces shared with the host
     *
     * Recognized: net.
     *
     * @return Number of directives appended
     */
    size_t share(const std::vector<std::string>& names);

    /**
     * @brief Empty all buckets and dedup state
     */
    void reset();

    const PathDirectiveSet& directives() const { return set_; }

    static bool isKnownNamespace(NamespaceAction action, const std::string& name);

private:
    void ensureAncestors(const std::filesystem::path& path);
    size_t addNamespaces(NamespaceAction action, const std::vector<std::string>& names);

    PathDirectiveSet set_;
};

} // namespace cjail

#endif // CJAIL_DIRECTIVE_ACCUMULATOR_H

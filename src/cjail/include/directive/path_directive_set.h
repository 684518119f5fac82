#ifndef CJAIL_PATH_DIRECTIVE_SET_H
#define CJAIL_PATH_DIRECTIVE_SET_H

#include "directive/directive.h"
#include <set>
#include <string>

namespace cjail {

/**
 * @brief Dedup-aware collection of sandbox directives
 *
 * Directives are kept in four ordered buckets which are always emitted in
 * this order, whatever the insertion order:
 * 1. namespace flags
 * 2. ancestor-directory creations (Dir)
 * 3. binds, mounts, symlinks, tmpfs, dev, proc, chdir
 * 4. environment settings
 *
 * The engine has to create ancestor directories before a bind target
 * inside them can be created, hence the fixed bucket order.
 *
 * Dedup tables:
 * - mount destinations: shared by Bind and Symlink, each destination at most once
 * - directories: Dir paths plus symlink links, each at most once
 *
 * Tmpfs, dev, proc, chdir, namespace and environment directives are never
 * deduplicated.
 */
class PathDirectiveSet {
public:
    PathDirectiveSet() = default;

    void addNamespace(const NamespaceDirective& directive);

    /**
     * @brief Queue an ancestor directory
     * @return true if added, false if the directory was already known
     */
    bool addDirectory(const std::string& path);

    /**
     * @brief Record a directory as existing without emitting a Dir directive
     */
    void markDirectory(const std::string& path);

    bool hasDirectory(const std::string& path) const;

    /**
     * @brief Add a bind directive
     * @return true if added, false if its destination was already claimed
     */
    bool addBind(const BindDirective& directive);

    /**
     * @brief Add a symlink directive
     * @return true if added, false if its link path was already claimed
     */
    bool addSymlink(const SymlinkDirective& directive);

    bool hasMountDestination(const std::string& path) const;

    /**
     * @brief Append a non-deduplicated directive to the mount bucket
     *
     * Accepts tmpfs, dev, proc and chdir directives.
     *
     * @throws std::invalid_argument for any other directive kind
     */
    void addMount(const Directive& directive);

    void addEnvironment(const EnvDirective& directive);

    const DirectiveList& namespaces() const { return namespaces_; }
    const DirectiveList& ancestors() const { return ancestors_; }
    const DirectiveList& mounts() const { return mounts_; }
    const DirectiveList& environment() const { return environment_; }

    /**
     * @brief All directives in emission order
     */
    DirectiveList ordered() const;

    size_t size() const;
    bool empty() const;

    /**
     * @brief Drop all directives and dedup state
     */
    void clear();

private:
    DirectiveList namespaces_;
    DirectiveList ancestors_;
    DirectiveList mounts_;
    DirectiveList environment_;

    std::set<std::string> directories_;
    std::set<std::string> mountDestinations_;
};

} // namespace cjail

#endif // CJAIL_PATH_DIRECTIVE_SET_H

#ifndef CJAIL_GIT_WORKTREE_RESOLVER_H
#define CJAIL_GIT_WORKTREE_RESOLVER_H

#include "directive/directive.h"
#include "directive/directive_accumulator.h"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace cjail {

/**
 * @brief Thrown when a manual git root does not contain a .git directory
 */
class InvalidGitRootError : public std::runtime_error {
public:
    explicit InvalidGitRootError(const std::string& root)
        : std::runtime_error("Git root does not contain a .git directory: " + root)
        , root_(root) {}

    const std::string& root() const { return root_; }

private:
    std::string root_;
};

/**
 * @brief Repository layout of a project directory
 */
enum class GitRepoState {
    NOT_A_REPO,      ///< No .git marker
    PRIMARY_CLONE,   ///< .git is a directory
    WORKTREE         ///< .git is a file pointing at worktree-private metadata
};

inline const char* gitRepoStateToString(GitRepoState state) {
    switch (state) {
        case GitRepoState::NOT_A_REPO:    return "not a repository";
        case GitRepoState::PRIMARY_CLONE: return "primary clone";
        case GitRepoState::WORKTREE:      return "worktree";
        default:                          return "unknown";
    }
}

struct GitRepoInfo {
    std::filesystem::path root;   ///< Main repository root (parent of the real .git)
    GitRepoState state;
};

/**
 * @brief Outcome of contributing git bindings to an accumulator
 */
enum class GitBindingStatus {
    NOT_A_REPOSITORY,
    PRIMARY_CLONE,            ///< .git is part of the project bind
    BOUND,                    ///< Main .git bound
    ALREADY_INSIDE_PROJECT,   ///< Main .git lies inside the project
    UNRESOLVED                ///< Worktree pointer could not be followed
};

struct GitBindingResult {
    GitBindingStatus status;
    std::filesystem::path mainRoot;
    DirectiveList directives;   ///< Directives added to the accumulator
};

/**
 * @brief Resolves git worktree topology
 *
 * A linked worktree keeps only a ".git" file ("gitdir: <path>") pointing at
 * its private metadata under the main repository's .git/worktrees/. The
 * private directory holds a "commondir" file pointing back at the shared
 * .git directory, whose parent is the main repository root. Inside the
 * sandbox the shared .git must be bound for git to work.
 *
 * Every call reads the filesystem afresh; nothing is cached.
 */
class GitWorktreeResolver {
public:
    static constexpr const char* GIT_MARKER = ".git";
    static constexpr const char* GITDIR_PREFIX = "gitdir: ";
    static constexpr const char* COMMONDIR_FILE = "commondir";

    /**
     * @brief Classify the .git marker of a directory
     */
    static GitRepoState detectState(const std::filesystem::path& path);

    /**
     * @brief Main repository root of path
     *
     * A primary clone is its own root. A worktree is resolved through its
     * gitdir and commondir pointers.
     *
     * @return std::nullopt if path is not a repository or a pointer is missing
     */
    static std::optional<std::filesystem::path> resolveMainRoot(const std::filesystem::path& path);

    /**
     * @brief Root and state of the repository at path
     * @return std::nullopt if path is not a repository or cannot be resolved
     */
    static std::optional<GitRepoInfo> inspect(const std::filesystem::path& path);

    /**
     * @brief Bind the main .git directory of a worktree project
     *
     * @param acc Accumulator to populate
     * @param project Project directory
     * @param readOnly Bind read-only instead of read-write
     * @param manualRoot Main repository root to use instead of auto-detection
     * @return Status and the directives that were added
     * @throws InvalidGitRootError if manualRoot has no .git directory
     */
    static GitBindingResult contributeBindings(DirectiveAccumulator& acc,
                                               const std::filesystem::path& project,
                                               bool readOnly,
                                               const std::optional<std::filesystem::path>& manualRoot = std::nullopt);

    /**
     * @brief Share agent files kept next to a set of worktrees
     *
     * Binds the parent directory's .claude/, CLAUDE.md and .claudeignore
     * into the project when the project has none of its own. Only a linked
     * worktree is considered: a plain directory or a primary clone gets
     * nothing.
     *
     * @return Number of paths bound
     */
    static size_t bindWorktreeAgentFiles(DirectiveAccumulator& acc,
                                         const std::filesystem::path& project);

private:
    static std::optional<std::filesystem::path> readGitdirPointer(const std::filesystem::path& gitFile);
    static std::optional<std::filesystem::path> readCommondir(const std::filesystem::path& privateDir);
};

} // namespace cjail

#endif // CJAIL_GIT_WORKTREE_RESOLVER_H

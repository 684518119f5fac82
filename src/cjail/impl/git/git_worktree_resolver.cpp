#include "git/git_worktree_resolver.h"
#include "utils/path_utils.h"
#include "utils/log.h"
#include <fstream>
#include <initializer_list>
#include <system_error>

namespace fs = std::filesystem;

namespace cjail {

namespace {

std::string readFirstLine(const fs::path& file) {
    std::ifstream in(file);
    std::string line;
    if (in.is_open()) {
        std::getline(in, line);
    }
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

// Directives appended to the ancestor and mount buckets since a snapshot
class AddedDirectives {
public:
    explicit AddedDirectives(const DirectiveAccumulator& acc)
        : acc_(acc)
        , ancestors_(acc.directives().ancestors().size())
        , mounts_(acc.directives().mounts().size()) {}

    DirectiveList collect() const {
        const auto& set = acc_.directives();
        DirectiveList added(set.ancestors().begin() + ancestors_, set.ancestors().end());
        added.insert(added.end(), set.mounts().begin() + mounts_, set.mounts().end());
        return added;
    }

private:
    const DirectiveAccumulator& acc_;
    size_t ancestors_;
    size_t mounts_;
};

} // anonymous namespace

GitRepoState GitWorktreeResolver::detectState(const fs::path& path) {
    std::error_code ec;
    fs::path marker = path / GIT_MARKER;

    if (fs::is_directory(marker, ec)) {
        return GitRepoState::PRIMARY_CLONE;
    }
    if (fs::is_regular_file(marker, ec)) {
        return GitRepoState::WORKTREE;
    }
    return GitRepoState::NOT_A_REPO;
}

std::optional<fs::path> GitWorktreeResolver::resolveMainRoot(const fs::path& path) {
    switch (detectState(path)) {
        case GitRepoState::NOT_A_REPO:
            return std::nullopt;
        case GitRepoState::PRIMARY_CLONE:
            return canonicalOrAbsolute(path);
        case GitRepoState::WORKTREE:
            break;
    }

    auto privateDir = readGitdirPointer(path / GIT_MARKER);
    if (!privateDir) {
        LOGD_FMT("No gitdir pointer in " << (path / GIT_MARKER).string());
        return std::nullopt;
    }
    if (privateDir->is_relative()) {
        privateDir = canonicalOrAbsolute(path / *privateDir);
    }

    auto commonDir = readCommondir(*privateDir);
    if (!commonDir) {
        LOGD_FMT("No commondir file in " << privateDir->string());
        return std::nullopt;
    }
    if (commonDir->is_relative()) {
        commonDir = canonicalOrAbsolute(*privateDir / *commonDir);
    }

    return normalizeDestination(*commonDir).parent_path();
}

std::optional<GitRepoInfo> GitWorktreeResolver::inspect(const fs::path& path) {
    GitRepoState state = detectState(path);
    if (state == GitRepoState::NOT_A_REPO) {
        return std::nullopt;
    }

    auto root = resolveMainRoot(path);
    if (!root) {
        return std::nullopt;
    }
    return GitRepoInfo{*root, state};
}

GitBindingResult GitWorktreeResolver::contributeBindings(DirectiveAccumulator& acc,
                                                         const fs::path& project,
                                                         bool readOnly,
                                                         const std::optional<fs::path>& manualRoot) {
    GitBindingResult result{GitBindingStatus::NOT_A_REPOSITORY, fs::path(), {}};

    GitRepoState state = detectState(project);
    if (state == GitRepoState::NOT_A_REPO) {
        LOGD_FMT("Git: " << project.string() << " is not a repository");
        return result;
    }

    fs::path mainRoot;
    if (manualRoot && !manualRoot->empty()) {
        mainRoot = canonicalOrAbsolute(*manualRoot);
        std::error_code ec;
        if (!fs::is_directory(mainRoot / GIT_MARKER, ec)) {
            throw InvalidGitRootError(manualRoot->string());
        }
    } else if (state == GitRepoState::PRIMARY_CLONE) {
        LOGI("Git: primary clone, .git is part of project");
        result.status = GitBindingStatus::PRIMARY_CLONE;
        result.mainRoot = canonicalOrAbsolute(project);
        return result;
    } else {
        auto resolved = resolveMainRoot(project);
        if (!resolved) {
            LOGW_FMT("Git: could not resolve main repository of worktree " << project.string());
            result.status = GitBindingStatus::UNRESOLVED;
            return result;
        }
        mainRoot = *resolved;
    }

    result.mainRoot = mainRoot;
    fs::path mainGitDir = mainRoot / GIT_MARKER;

    if (isWithin(mainGitDir, canonicalOrAbsolute(project))) {
        LOGI("Git: main .git is inside project directory");
        result.status = GitBindingStatus::ALREADY_INSIDE_PROJECT;
        return result;
    }

    BindMode mode = readOnly ? BindMode::READ_ONLY : BindMode::READ_WRITE;
    LOGI_FMT("Git: binding " << mainGitDir.string() << " (" << bindModeToString(mode) << ")");

    AddedDirectives added(acc);
    if (!acc.bind(mainGitDir, mode)) {
        LOGW_FMT("Git: main .git not found at " << mainGitDir.string());
        result.status = GitBindingStatus::UNRESOLVED;
        return result;
    }
    result.directives = added.collect();
    result.status = GitBindingStatus::BOUND;
    return result;
}

size_t GitWorktreeResolver::bindWorktreeAgentFiles(DirectiveAccumulator& acc, const fs::path& project) {
    if (project.empty() || detectState(project) != GitRepoState::WORKTREE) {
        return 0;
    }

    fs::path projectDir = normalizeDestination(project);
    fs::path parent = projectDir.parent_path();
    size_t bound = 0;
    std::error_code ec;

    if (fs::is_directory(parent / ".claude", ec) && !fs::is_directory(projectDir / ".claude", ec)) {
        LOGI_FMT("Worktree: binding " << (parent / ".claude").string());
        if (acc.bind(parent / ".claude", projectDir / ".claude")) {
            ++bound;
        }
    }

    for (const char* name : {"CLAUDE.md", ".claudeignore"}) {
        if (fs::is_regular_file(parent / name, ec) && !fs::is_regular_file(projectDir / name, ec)) {
            LOGI_FMT("Worktree: binding " << (parent / name).string());
            if (acc.bind(parent / name, projectDir / name)) {
                ++bound;
            }
        }
    }

    return bound;
}

std::optional<fs::path> GitWorktreeResolver::readGitdirPointer(const fs::path& gitFile) {
    std::string line = readFirstLine(gitFile);
    std::string prefix(GITDIR_PREFIX);
    if (line.compare(0, prefix.size(), prefix) != 0 || line.size() == prefix.size()) {
        return std::nullopt;
    }
    return fs::path(line.substr(prefix.size()));
}

std::optional<fs::path> GitWorktreeResolver::readCommondir(const fs::path& privateDir) {
    std::error_code ec;
    fs::path file = privateDir / COMMONDIR_FILE;
    if (!fs::is_regular_file(file, ec)) {
        return std::nullopt;
    }

    std::string line = readFirstLine(file);
    if (line.empty()) {
        return std::nullopt;
    }
    return fs::path(line);
}

} // namespace cjail

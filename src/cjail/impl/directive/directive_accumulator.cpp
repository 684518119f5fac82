#include "directive/directive_accumulator.h"
#include "utils/path_utils.h"
#include "utils/log.h"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace cjail {

namespace {

const std::vector<std::string> kUnshareNamespaces = {
    "all", "user", "pid", "net", "ipc", "uts", "cgroup"
};

const std::vector<std::string> kShareNamespaces = {
    "net"
};

fs::path sandboxPath(const fs::path& path) {
    if (path.is_relative()) {
        std::error_code ec;
        fs::path absolute = fs::absolute(path, ec);
        if (!ec) {
            return normalizeDestination(absolute);
        }
    }
    return normalizeDestination(path);
}

} // anonymous namespace

bool DirectiveAccumulator::bind(const fs::path& src, BindMode mode) {
    return bind(src, src, mode);
}

bool DirectiveAccumulator::bind(const fs::path& src, const fs::path& dst, BindMode mode) {
    std::error_code ec;
    if (src.empty() || !fs::exists(src, ec)) {
        LOGD_FMT("Skipping bind of missing path: " << src.string());
        return false;
    }

    fs::path destination = sandboxPath(dst.empty() ? src : dst);
    if (set_.hasMountDestination(destination.string())) {
        LOGV_FMT("Destination already bound: " << destination.string());
        return true;
    }

    fs::path realSource = canonicalOrAbsolute(src);
    ensureAncestors(destination);
    set_.addBind(BindDirective{realSource.string(), destination.string(), mode});
    return true;
}

void DirectiveAccumulator::requireBind(const fs::path& src, const fs::path& dst, BindMode mode) {
    if (!bind(src, dst, mode)) {
        throw PathNotFoundError(src.string());
    }
}

void DirectiveAccumulator::tmpfs(const fs::path& path) {
    fs::path target = sandboxPath(path);
    ensureAncestors(target);
    set_.addMount(TmpfsDirective{target.string()});
}

void DirectiveAccumulator::symlink(const std::string& target, const fs::path& link) {
    fs::path linkPath = sandboxPath(link);
    if (set_.hasMountDestination(linkPath.string())) {
        return;
    }

    ensureAncestors(linkPath);
    set_.addSymlink(SymlinkDirective{target, linkPath.string()});
    set_.markDirectory(linkPath.string());
}

void DirectiveAccumulator::dev(const fs::path& path) {
    set_.addMount(DevDirective{sandboxPath(path).string()});
}

void DirectiveAccumulator::proc(const fs::path& path) {
    set_.addMount(ProcDirective{sandboxPath(path).string()});
}

void DirectiveAccumulator::setenv(const std::string& name, const std::string& value) {
    set_.addEnvironment(EnvDirective{name, value});
}

void DirectiveAccumulator::chdir(const fs::path& path) {
    set_.addMount(ChdirDirective{sandboxPath(path).string()});
}

size_t DirectiveAccumulator::unshare(const std::vector<std::string>& names) {
    return addNamespaces(NamespaceAction::UNSHARE, names);
}

size_t DirectiveAccumulator::share(const std::vector<std::string>& names) {
    return addNamespaces(NamespaceAction::SHARE, names);
}

void DirectiveAccumulator::reset() {
    set_.clear();
}

bool DirectiveAccumulator::isKnownNamespace(NamespaceAction action, const std::string& name) {
    const auto& known = (action == NamespaceAction::UNSHARE) ? kUnshareNamespaces : kShareNamespaces;
    return std::find(known.begin(), known.end(), name) != known.end();
}

void DirectiveAccumulator::ensureAncestors(const fs::path& path) {
    for (const auto& ancestor : ancestorsOf(path)) {
        set_.addDirectory(ancestor.string());
    }
}

size_t DirectiveAccumulator::addNamespaces(NamespaceAction action, const std::vector<std::string>& names) {
    size_t added = 0;
    for (const auto& name : names) {
        if (!isKnownNamespace(action, name)) {
            // Unknown names are tolerated for forward compatibility
            LOGD_FMT("Ignoring unrecognized namespace: " << name);
            continue;
        }
        set_.addNamespace(NamespaceDirective{action, name});
        ++added;
    }
    return added;
}

} // namespace cjail

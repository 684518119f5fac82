#include "directive/path_directive_set.h"
#include <stdexcept>

namespace cjail {

void PathDirectiveSet::addNamespace(const NamespaceDirective& directive) {
    namespaces_.push_back(directive);
}

bool PathDirectiveSet::addDirectory(const std::string& path) {
    if (!directories_.insert(path).second) {
        return false;
    }
    ancestors_.push_back(DirDirective{path});
    return true;
}

void PathDirectiveSet::markDirectory(const std::string& path) {
    directories_.insert(path);
}

bool PathDirectiveSet::hasDirectory(const std::string& path) const {
    return directories_.count(path) > 0;
}

bool PathDirectiveSet::addBind(const BindDirective& directive) {
    if (!mountDestinations_.insert(directive.dst).second) {
        return false;
    }
    mounts_.push_back(directive);
    return true;
}

bool PathDirectiveSet::addSymlink(const SymlinkDirective& directive) {
    if (!mountDestinations_.insert(directive.link).second) {
        return false;
    }
    mounts_.push_back(directive);
    return true;
}

bool PathDirectiveSet::hasMountDestination(const std::string& path) const {
    return mountDestinations_.count(path) > 0;
}

void PathDirectiveSet::addMount(const Directive& directive) {
    if (!std::holds_alternative<TmpfsDirective>(directive) &&
        !std::holds_alternative<DevDirective>(directive) &&
        !std::holds_alternative<ProcDirective>(directive) &&
        !std::holds_alternative<ChdirDirective>(directive)) {
        throw std::invalid_argument("Directive does not belong to the mount bucket: " +
                                    describeDirective(directive));
    }
    mounts_.push_back(directive);
}

void PathDirectiveSet::addEnvironment(const EnvDirective& directive) {
    environment_.push_back(directive);
}

DirectiveList PathDirectiveSet::ordered() const {
    DirectiveList result;
    result.reserve(size());
    result.insert(result.end(), namespaces_.begin(), namespaces_.end());
    result.insert(result.end(), ancestors_.begin(), ancestors_.end());
    result.insert(result.end(), mounts_.begin(), mounts_.end());
    result.insert(result.end(), environment_.begin(), environment_.end());
    return result;
}

size_t PathDirectiveSet::size() const {
    return namespaces_.size() + ancestors_.size() + mounts_.size() + environment_.size();
}

bool PathDirectiveSet::empty() const {
    return size() == 0;
}

void PathDirectiveSet::clear() {
    namespaces_.clear();
    ancestors_.clear();
    mounts_.clear();
    environment_.clear();
    directories_.clear();
    mountDestinations_.clear();
}

} // namespace cjail

#include "directive/directive.h"
#include <sstream>

namespace cjail {

namespace {

struct DescribeVisitor {
    std::ostringstream& out;

    void operator()(const NamespaceDirective& d) const {
        out << (d.action == NamespaceAction::UNSHARE ? "unshare " : "share ") << d.name;
    }
    void operator()(const BindDirective& d) const {
        out << "bind(" << bindModeToString(d.mode) << ") " << d.src << " -> " << d.dst;
    }
    void operator()(const TmpfsDirective& d) const { out << "tmpfs " << d.path; }
    void operator()(const SymlinkDirective& d) const { out << "symlink " << d.link << " -> " << d.target; }
    void operator()(const DevDirective& d) const { out << "dev " << d.path; }
    void operator()(const ProcDirective& d) const { out << "proc " << d.path; }
    void operator()(const EnvDirective& d) const { out << "setenv " << d.name << "=" << d.value; }
    void operator()(const DirDirective& d) const { out << "dir " << d.path; }
    void operator()(const ChdirDirective& d) const { out << "chdir " << d.path; }
};

} // anonymous namespace

std::string describeDirective(const Directive& directive) {
    std::ostringstream oss;
    std::visit(DescribeVisitor{oss}, directive);
    return oss.str();
}

} // namespace cjail

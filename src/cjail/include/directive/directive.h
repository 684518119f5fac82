#ifndef CJAIL_DIRECTIVE_H
#define CJAIL_DIRECTIVE_H

#include <string>
#include <variant>
#include <vector>

namespace cjail {

/**
 * @brief Bind mount access mode
 */
enum class BindMode {
    READ_ONLY,
    READ_WRITE
};

/**
 * @brief Namespace directive action
 */
enum class NamespaceAction {
    UNSHARE,
    SHARE
};

inline const char* bindModeToString(BindMode mode) {
    switch (mode) {
        case BindMode::READ_ONLY:  return "ro";
        case BindMode::READ_WRITE: return "rw";
        default:                   return "unknown";
    }
}

/**
 * @brief Detach from (or rejoin) a namespace: "user", "pid", "net", ...
 */
struct NamespaceDirective {
    NamespaceAction action;
    std::string name;
};

/**
 * @brief Expose host path src at dst inside the sandbox
 */
struct BindDirective {
    std::string src;
    std::string dst;
    BindMode mode;
};

struct TmpfsDirective {
    std::string path;
};

/**
 * @brief Create a symlink at link pointing to target
 */
struct SymlinkDirective {
    std::string target;
    std::string link;
};

struct DevDirective {
    std::string path;
};

struct ProcDirective {
    std::string path;
};

struct EnvDirective {
    std::string name;
    std::string value;
};

/**
 * @brief Ancestor-creation marker: the engine creates the directory before
 * any mount below it is set up
 */
struct DirDirective {
    std::string path;
};

struct ChdirDirective {
    std::string path;
};

using Directive = std::variant<
    NamespaceDirective,
    BindDirective,
    TmpfsDirective,
    SymlinkDirective,
    DevDirective,
    ProcDirective,
    EnvDirective,
    DirDirective,
    ChdirDirective>;

using DirectiveList = std::vector<Directive>;

inline bool operator==(const NamespaceDirective& a, const NamespaceDirective& b) {
    return a.action == b.action && a.name == b.name;
}

inline bool operator==(const BindDirective& a, const BindDirective& b) {
    return a.src == b.src && a.dst == b.dst && a.mode == b.mode;
}

inline bool operator==(const TmpfsDirective& a, const TmpfsDirective& b) {
    return a.path == b.path;
}

inline bool operator==(const SymlinkDirective& a, const SymlinkDirective& b) {
    return a.target == b.target && a.link == b.link;
}

inline bool operator==(const DevDirective& a, const DevDirective& b) {
    return a.path == b.path;
}

inline bool operator==(const ProcDirective& a, const ProcDirective& b) {
    return a.path == b.path;
}

inline bool operator==(const EnvDirective& a, const EnvDirective& b) {
    return a.name == b.name && a.value == b.value;
}

inline bool operator==(const DirDirective& a, const DirDirective& b) {
    return a.path == b.path;
}

inline bool operator==(const ChdirDirective& a, const ChdirDirective& b) {
    return a.path == b.path;
}

/**
 * @brief Human-readable one-line description, used in debug logs
 */
std::string describeDirective(const Directive& directive);

} // namespace cjail

#endif // CJAIL_DIRECTIVE_H

#include "emit/command_emitter.h"
#include <cctype>
#include <type_traits>

namespace cjail {

namespace {

bool isShellSafe(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    switch (c) {
        case '_': case '@': case '%': case '+': case '=':
        case ':': case ',': case '.': case '/': case '-':
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

std::vector<std::string> CommandEmitter::buildArguments(const PathDirectiveSet& directives,
                                                        const std::vector<std::string>& command) {
    std::vector<std::string> args = {ENGINE, "--die-with-parent", "--new-session"};

    for (const auto& directive : directives.ordered()) {
        std::vector<std::string> flags = flagsFor(directive);
        args.insert(args.end(), flags.begin(), flags.end());
    }

    args.push_back("--");
    args.insert(args.end(), command.begin(), command.end());
    return args;
}

std::vector<std::string> CommandEmitter::flagsFor(const Directive& directive) {
    return std::visit([](const auto& d) -> std::vector<std::string> {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, NamespaceDirective>) {
            if (d.action == NamespaceAction::SHARE) {
                return {"--share-" + d.name};
            }
            return {"--unshare-" + d.name};
        } else if constexpr (std::is_same_v<T, BindDirective>) {
            return {d.mode == BindMode::READ_ONLY ? "--ro-bind" : "--bind", d.src, d.dst};
        } else if constexpr (std::is_same_v<T, TmpfsDirective>) {
            return {"--tmpfs", d.path};
        } else if constexpr (std::is_same_v<T, SymlinkDirective>) {
            return {"--symlink", d.target, d.link};
        } else if constexpr (std::is_same_v<T, DevDirective>) {
            return {"--dev", d.path};
        } else if constexpr (std::is_same_v<T, ProcDirective>) {
            return {"--proc", d.path};
        } else if constexpr (std::is_same_v<T, EnvDirective>) {
            return {"--setenv", d.name, d.value};
        } else if constexpr (std::is_same_v<T, DirDirective>) {
            return {"--dir", d.path};
        } else {
            return {"--chdir", d.path};
        }
    }, directive);
}

std::string CommandEmitter::toShellString(const std::vector<std::string>& arguments) {
    std::string line;
    for (const auto& arg : arguments) {
        if (!line.empty()) {
            line += ' ';
        }
        line += shellQuote(arg);
    }
    return line;
}

std::string CommandEmitter::shellQuote(const std::string& word) {
    if (word.empty()) {
        return "''";
    }

    bool safe = true;
    for (char c : word) {
        if (!isShellSafe(c)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return word;
    }

    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace cjail

#include "cli/command_line.h"
#include "config/sandbox_settings.h"
#include <sstream>

namespace cjail {

namespace {

ParseResult failure(const std::string& message) {
    return ParseResult{false, message, CommandLine()};
}

bool parseCommandWord(const std::string& word, CommandKind& kind) {
    if (word == "shell") {
        kind = CommandKind::SHELL;
    } else if (word == "debug") {
        kind = CommandKind::DEBUG;
    } else if (word == "clean") {
        kind = CommandKind::CLEAN;
    } else {
        return false;
    }
    return true;
}

} // anonymous namespace

ParseResult CommandLineParser::parse(int argc, const char* const argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

ParseResult CommandLineParser::parse(const std::vector<std::string>& args) {
    CommandLine cl;
    bool commandSeen = false;
    std::vector<std::string> positionals;
    std::vector<std::string> extraRo;
    std::vector<std::string> extraRw;
    bool roGiven = false;
    bool rwGiven = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto takeValue = [&](std::string& out) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            out = args[++i];
            return true;
        };

        std::string value;
        if (arg == "--") {
            cl.arguments.insert(cl.arguments.end(), args.begin() + i + 1, args.end());
            break;
        } else if (arg == "-h" || arg == "--help") {
            cl.query = QueryAction::HELP;
        } else if (arg == "--list-profiles") {
            cl.query = QueryAction::LIST_PROFILES;
        } else if (arg == "--show-config") {
            cl.query = QueryAction::SHOW_CONFIG;
        } else if (arg == "--help-config") {
            cl.query = QueryAction::HELP_CONFIG;
        } else if (arg == "-v" || arg == "--verbose") {
            cl.verbose = true;
            cl.overrides.set(SandboxSettings::PROP_VERBOSE, true);
        } else if (arg == "--network") {
            cl.overrides.set(SandboxSettings::PROP_NETWORK, true);
        } else if (arg == "--no-network") {
            cl.overrides.set(SandboxSettings::PROP_NETWORK, false);
        } else if (arg == "--git-ro") {
            cl.overrides.set(SandboxSettings::PROP_GIT_WORKTREE_RO, true);
        } else if (arg == "-d" || arg == "--dir") {
            if (!takeValue(cl.projectDir)) {
                return failure("Option " + arg + " requires a directory");
            }
        } else if (arg == "-p" || arg == "--profile") {
            if (!takeValue(value)) {
                return failure("Option " + arg + " requires a profile name");
            }
            cl.overrides.set(SandboxSettings::PROP_PROFILE, value);
        } else if (arg == "-c" || arg == "--config") {
            if (!takeValue(value)) {
                return failure("Option " + arg + " requires a file");
            }
            cl.configFile = value;
        } else if (arg == "--ro") {
            if (!takeValue(value)) {
                return failure("Option --ro requires a path");
            }
            extraRo.push_back(value);
            roGiven = true;
        } else if (arg == "--rw") {
            if (!takeValue(value)) {
                return failure("Option --rw requires a path");
            }
            extraRw.push_back(value);
            rwGiven = true;
        } else if (arg == "--sandbox-home") {
            if (!takeValue(value)) {
                return failure("Option --sandbox-home requires a path");
            }
            cl.overrides.set(SandboxSettings::PROP_SANDBOX_HOME, value);
        } else if (arg == "--sandbox-name") {
            if (!takeValue(value)) {
                return failure("Option --sandbox-name requires a name");
            }
            cl.overrides.set(SandboxSettings::PROP_SANDBOX_NAME, value);
        } else if (arg == "--git-root") {
            if (!takeValue(value)) {
                return failure("Option --git-root requires a path");
            }
            cl.overrides.set(SandboxSettings::PROP_GIT_ROOT, value);
        } else if (arg.size() > 1 && arg[0] == '-') {
            return failure("Unknown option: " + arg);
        } else if (!commandSeen && positionals.empty() && parseCommandWord(arg, cl.command)) {
            commandSeen = true;
        } else {
            positionals.push_back(arg);
        }
    }

    if (roGiven) {
        cl.overrides.set(SandboxSettings::PROP_EXTRA_RO, extraRo);
    }
    if (rwGiven) {
        cl.overrides.set(SandboxSettings::PROP_EXTRA_RW, extraRw);
    }

    switch (cl.command) {
        case CommandKind::RUN:
            cl.arguments.insert(cl.arguments.begin(), positionals.begin(), positionals.end());
            break;
        case CommandKind::SHELL:
        case CommandKind::DEBUG:
            if (positionals.size() > 2) {
                return failure(std::string("Too many arguments for ") + commandKindToString(cl.command));
            }
            if (!positionals.empty() && cl.projectDir.empty()) {
                cl.projectDir = positionals[0];
            }
            if (positionals.size() > 1 && !cl.overrides.has(SandboxSettings::PROP_PROFILE)) {
                cl.overrides.set(SandboxSettings::PROP_PROFILE, positionals[1]);
            }
            break;
        case CommandKind::CLEAN:
            if (positionals.size() > 1) {
                return failure("Too many arguments for clean");
            }
            if (!positionals.empty() && cl.projectDir.empty()) {
                cl.projectDir = positionals[0];
            }
            break;
    }

    return ParseResult{true, std::string(), cl};
}

std::string CommandLineParser::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options] [command] [-- args...]\n"
        << "\n"
        << "Run Claude Code inside a bubblewrap sandbox.\n"
        << "\n"
        << "Commands:\n"
        << "  (none)                 Run claude in the sandbox\n"
        << "  shell [DIR] [PROFILE]  Interactive bash in the sandbox\n"
        << "  debug [DIR] [PROFILE]  Print the bwrap command without running it\n"
        << "  clean [DIR]            Remove the sandbox directory\n"
        << "\n"
        << "Options:\n"
        << "  -d, --dir DIR          Project directory (default: current directory)\n"
        << "  -p, --profile NAME     Isolation profile (default: standard)\n"
        << "  -v, --verbose          Verbose output\n"
        << "      --network          Enable network\n"
        << "      --no-network       Disable network\n"
        << "      --ro PATH          Extra read-only path (repeatable)\n"
        << "      --rw PATH          Extra read-write path (repeatable)\n"
        << "      --sandbox-home PATH  Sandbox parent directory, or sandbox name if relative\n"
        << "      --sandbox-name NAME  Sandbox directory name\n"
        << "      --git-root PATH    Main repository root for worktrees\n"
        << "      --git-ro           Bind the main .git read-only\n"
        << "  -c, --config FILE      Config file to use\n"
        << "      --list-profiles    List profiles\n"
        << "      --show-config      Show the resolved configuration\n"
        << "      --help-config      Show configuration help\n"
        << "  -h, --help             Show this help\n";
    return oss.str();
}

} // namespace cjail

#ifndef CJAIL_COMMAND_LINE_H
#define CJAIL_COMMAND_LINE_H

#include "utils/properties.h"
#include <optional>
#include <string>
#include <vector>

namespace cjail {

/**
 * @brief What the invocation does inside (or to) the sandbox
 */
enum class CommandKind {
    RUN,     ///< Run the agent
    SHELL,   ///< Interactive bash inside the sandbox
    DEBUG,   ///< Print the engine command without running it
    CLEAN    ///< Remove the sandbox directory
};

/**
 * @brief Informational actions that stop before compiling
 */
enum class QueryAction {
    NONE,
    HELP,
    LIST_PROFILES,
    SHOW_CONFIG,
    HELP_CONFIG
};

inline const char* commandKindToString(CommandKind kind) {
    switch (kind) {
        case CommandKind::RUN:   return "run";
        case CommandKind::SHELL: return "shell";
        case CommandKind::DEBUG: return "debug";
        case CommandKind::CLEAN: return "clean";
        default:                 return "unknown";
    }
}

/**
 * @brief Parsed command line
 */
struct CommandLine {
    CommandKind command = CommandKind::RUN;
    QueryAction query = QueryAction::NONE;
    std::string projectDir;
    std::optional<std::string> configFile;
    bool verbose = false;
    Properties overrides;                  ///< Configuration values set by flags
    std::vector<std::string> arguments;    ///< Passed to the command inside the sandbox
};

/**
 * @brief Parse result
 */
struct ParseResult {
    bool success;
    std::string message;
    CommandLine commandLine;
};

/**
 * @brief claude-jail argument parser
 *
 * Usage: claude-jail [options] [command] [-- args...]
 *
 * Options may appear anywhere before "--". "shell" and "debug" accept an
 * optional project directory and profile as positional arguments, "clean"
 * an optional project directory. Positional words of the default command
 * go to the agent, as does everything after "--".
 *
 * --ro and --rw may be repeated; the collected list replaces any list
 * from the environment or a config file.
 */
class CommandLineParser {
public:
    static ParseResult parse(int argc, const char* const argv[]);
    static ParseResult parse(const std::vector<std::string>& args);

    /**
     * @brief Usage text shown by --help
     */
    static std::string usage(const std::string& program);
};

} // namespace cjail

#endif // CJAIL_COMMAND_LINE_H

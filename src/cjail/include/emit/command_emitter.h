#ifndef CJAIL_COMMAND_EMITTER_H
#define CJAIL_COMMAND_EMITTER_H

#include "directive/directive.h"
#include "directive/path_directive_set.h"
#include <string>
#include <vector>

namespace cjail {

/**
 * @brief Serializes a directive set into a bubblewrap argument vector
 *
 * Layout:
 * @code
 * bwrap --die-with-parent --new-session
 *       <namespace flags> <--dir flags> <mount flags> <--setenv flags>
 *       -- <command> <args...>
 * @endcode
 */
class CommandEmitter {
public:
    static constexpr const char* ENGINE = "bwrap";

    /**
     * @brief Full argument vector, engine name included
     */
    static std::vector<std::string> buildArguments(const PathDirectiveSet& directives,
                                                   const std::vector<std::string>& command);

    /**
     * @brief Engine flags for a single directive
     */
    static std::vector<std::string> flagsFor(const Directive& directive);

    /**
     * @brief Render arguments as one shell-quoted line
     */
    static std::string toShellString(const std::vector<std::string>& arguments);

    /**
     * @brief Quote one word for a POSIX shell, unchanged when no quoting is needed
     */
    static std::string shellQuote(const std::string& word);
};

} // namespace cjail

#endif // CJAIL_COMMAND_EMITTER_H

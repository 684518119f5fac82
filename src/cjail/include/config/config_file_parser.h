#ifndef CJAIL_CONFIG_FILE_PARSER_H
#define CJAIL_CONFIG_FILE_PARSER_H

#include "utils/properties.h"
#include <nlohmann/json.hpp>
#include <initializer_list>
#include <stdexcept>
#include <string>

namespace cjail {

/**
 * @brief Thrown when a config file cannot be read or does not match the schema
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Config file parser
 *
 * Parses and validates claude-jail JSON config files into a Properties
 * object holding only the keys the file defines. The file is data only;
 * nothing in it is ever executed.
 *
 * Config schema:
 * @code
 * {
 *   "profile": "standard",
 *   "network": true,
 *   "verbose": false,
 *   "copy_config": true,
 *   "sandbox": { "home": "/path/to/sandboxes", "name": ".claude-sandbox" },
 *   "git":     { "worktree_readonly": false, "root": "/path/to/main" },
 *   "paths":   { "extra_ro": [...], "extra_rw": [...], "blocked": [...] }
 * }
 * @endcode
 *
 * Unknown keys are ignored with a warning.
 */
class ConfigFileParser {
public:
    /**
     * @brief Parse config from JSON file
     *
     * @param configPath Path to the config file
     * @return Properties defined by the file
     * @throws ConfigParseError if file cannot be read, JSON is invalid or
     *         a value has the wrong type
     */
    static Properties parseFile(const std::string& configPath);

    /**
     * @brief Parse config from JSON string
     * @throws ConfigParseError if JSON is invalid or a value has the wrong type
     */
    static Properties parseString(const std::string& jsonString);

    /**
     * @brief Parse config from JSON object
     * @throws ConfigParseError if a value has the wrong type
     */
    static Properties parse(const nlohmann::json& json);

private:
    static void parseSandboxSection(const nlohmann::json& json, Properties& props);
    static void parseGitSection(const nlohmann::json& json, Properties& props);
    static void parsePathsSection(const nlohmann::json& json, Properties& props);

    static void readString(const nlohmann::json& json, const std::string& key,
                           const std::string& propertyKey, Properties& props);
    static void readBool(const nlohmann::json& json, const std::string& key,
                         const std::string& propertyKey, Properties& props);
    static void readStringList(const nlohmann::json& json, const std::string& key,
                               const std::string& propertyKey, Properties& props);
    static void warnUnknownKeys(const nlohmann::json& json, const std::string& section,
                                std::initializer_list<const char*> known);
};

} // namespace cjail

#endif // CJAIL_CONFIG_FILE_PARSER_H

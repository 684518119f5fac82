#include "config/config_file_parser.h"
#include "config/sandbox_settings.h"
#include "utils/log.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace cjail {

Properties ConfigFileParser::parseFile(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open config file: " + configPath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return parseString(buffer.str());
    } catch (const ConfigParseError& e) {
        throw ConfigParseError(configPath + ": " + e.what());
    }
}

Properties ConfigFileParser::parseString(const std::string& jsonString) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(jsonString);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
    return parse(json);
}

Properties ConfigFileParser::parse(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigParseError("Config root must be an object");
    }

    Properties props;

    readString(json, "profile", SandboxSettings::PROP_PROFILE, props);
    readBool(json, "network", SandboxSettings::PROP_NETWORK, props);
    readBool(json, "verbose", SandboxSettings::PROP_VERBOSE, props);
    readBool(json, "copy_config", SandboxSettings::PROP_COPY_CONFIG, props);

    if (json.contains("sandbox")) {
        parseSandboxSection(json["sandbox"], props);
    }

    if (json.contains("git")) {
        parseGitSection(json["git"], props);
    }

    if (json.contains("paths")) {
        parsePathsSection(json["paths"], props);
    }

    warnUnknownKeys(json, "", {"profile", "network", "verbose", "copy_config",
                               "sandbox", "git", "paths"});

    return props;
}

void ConfigFileParser::parseSandboxSection(const nlohmann::json& json, Properties& props) {
    if (!json.is_object()) {
        throw ConfigParseError("'sandbox' must be an object");
    }

    readString(json, "home", SandboxSettings::PROP_SANDBOX_HOME, props);
    readString(json, "name", SandboxSettings::PROP_SANDBOX_NAME, props);
    warnUnknownKeys(json, "sandbox", {"home", "name"});
}

void ConfigFileParser::parseGitSection(const nlohmann::json& json, Properties& props) {
    if (!json.is_object()) {
        throw ConfigParseError("'git' must be an object");
    }

    readBool(json, "worktree_readonly", SandboxSettings::PROP_GIT_WORKTREE_RO, props);
    readString(json, "root", SandboxSettings::PROP_GIT_ROOT, props);
    warnUnknownKeys(json, "git", {"worktree_readonly", "root"});
}

void ConfigFileParser::parsePathsSection(const nlohmann::json& json, Properties& props) {
    if (!json.is_object()) {
        throw ConfigParseError("'paths' must be an object");
    }

    readStringList(json, "extra_ro", SandboxSettings::PROP_EXTRA_RO, props);
    readStringList(json, "extra_rw", SandboxSettings::PROP_EXTRA_RW, props);
    readStringList(json, "blocked", SandboxSettings::PROP_BLOCKED, props);
    warnUnknownKeys(json, "paths", {"extra_ro", "extra_rw", "blocked"});
}

void ConfigFileParser::readString(const nlohmann::json& json, const std::string& key,
                                  const std::string& propertyKey, Properties& props) {
    if (!json.contains(key)) {
        return;
    }
    if (!json[key].is_string()) {
        throw ConfigParseError("'" + key + "' must be a string");
    }
    props.set(propertyKey, json[key].get<std::string>());
}

void ConfigFileParser::readBool(const nlohmann::json& json, const std::string& key,
                                const std::string& propertyKey, Properties& props) {
    if (!json.contains(key)) {
        return;
    }
    if (!json[key].is_boolean()) {
        throw ConfigParseError("'" + key + "' must be a boolean");
    }
    props.set(propertyKey, json[key].get<bool>());
}

void ConfigFileParser::readStringList(const nlohmann::json& json, const std::string& key,
                                      const std::string& propertyKey, Properties& props) {
    if (!json.contains(key)) {
        return;
    }
    if (!json[key].is_array()) {
        throw ConfigParseError("'" + key + "' must be an array of strings");
    }

    std::vector<std::string> values;
    for (const auto& item : json[key]) {
        if (!item.is_string()) {
            throw ConfigParseError("'" + key + "' must be an array of strings");
        }
        values.push_back(item.get<std::string>());
    }
    props.set(propertyKey, values);
}

void ConfigFileParser::warnUnknownKeys(const nlohmann::json& json, const std::string& section,
                                       std::initializer_list<const char*> known) {
    for (auto it = json.begin(); it != json.end(); ++it) {
        bool recognized = std::any_of(known.begin(), known.end(),
                                      [&it](const char* k) { return it.key() == k; });
        if (!recognized) {
            LOGW_FMT("Ignoring unknown config key: "
                     << (section.empty() ? "" : section + ".") << it.key());
        }
    }
}

} // namespace cjail

#ifndef CJAIL_CONFIG_SOURCE_H
#define CJAIL_CONFIG_SOURCE_H

namespace cjail {

/**
 * @brief Tier a resolved configuration value came from
 *
 * Precedence (highest first): OVERRIDE > ENVIRONMENT > file tiers > DEFAULT.
 * Only one config file is ever loaded, so the three file scopes never
 * compete with each other.
 */
enum class ConfigSource {
    DEFAULT,
    USER_FILE,       ///< ~/.config/claude-jail/config.json or ~/.claude-jail.json
    PROJECT_FILE,    ///< <project>/.claude-jail.json
    EXPLICIT_FILE,   ///< $CJ_CONFIG_FILE or --config
    ENVIRONMENT,
    OVERRIDE         ///< command line
};

inline const char* configSourceToString(ConfigSource source) {
    switch (source) {
        case ConfigSource::DEFAULT:       return "default";
        case ConfigSource::USER_FILE:     return "user config";
        case ConfigSource::PROJECT_FILE:  return "project config";
        case ConfigSource::EXPLICIT_FILE: return "explicit config";
        case ConfigSource::ENVIRONMENT:   return "environment";
        case ConfigSource::OVERRIDE:      return "command line";
        default:                          return "unknown";
    }
}

} // namespace cjail

#endif // CJAIL_CONFIG_SOURCE_H

#include "config/config_resolver.h"
#include "config/config_file_parser.h"
#include "utils/log.h"
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace cjail {

namespace {

struct EnvBinding {
    const char* variable;
    const char* key;
};

// String-valued at this tier; typed getters convert on read.
const EnvBinding ENV_BINDINGS[] = {
    {ConfigResolver::ENV_PROFILE,         SandboxSettings::PROP_PROFILE},
    {ConfigResolver::ENV_NETWORK,         SandboxSettings::PROP_NETWORK},
    {ConfigResolver::ENV_SANDBOX_HOME,    SandboxSettings::PROP_SANDBOX_HOME},
    {ConfigResolver::ENV_SANDBOX_NAME,    SandboxSettings::PROP_SANDBOX_NAME},
    {ConfigResolver::ENV_COPY_CONFIG,     SandboxSettings::PROP_COPY_CONFIG},
    {ConfigResolver::ENV_VERBOSE,         SandboxSettings::PROP_VERBOSE},
    {ConfigResolver::ENV_GIT_WORKTREE_RO, SandboxSettings::PROP_GIT_WORKTREE_RO},
    {ConfigResolver::ENV_EXTRA_RO,        SandboxSettings::PROP_EXTRA_RO},
    {ConfigResolver::ENV_EXTRA_RW,        SandboxSettings::PROP_EXTRA_RW},
    {ConfigResolver::ENV_BLOCKED,         SandboxSettings::PROP_BLOCKED},
};

void appendList(std::ostringstream& out, const char* title,
                const std::vector<std::string>& paths, ConfigSource source) {
    if (paths.empty()) {
        return;
    }
    out << "\n" << title << " (" << configSourceToString(source) << "):\n";
    for (const auto& path : paths) {
        out << "  - " << path << "\n";
    }
}

} // anonymous namespace

// ==================================================================
// ResolvedConfiguration
// ==================================================================

ConfigSource ResolvedConfiguration::sourceOf(const std::string& key) const {
    auto it = sources.find(key);
    if (it == sources.end()) {
        return ConfigSource::DEFAULT;
    }
    return it->second;
}

std::string ResolvedConfiguration::show() const {
    auto line = [this](std::ostringstream& out, const char* label, const std::string& key,
                       const std::string& value) {
        out << "  " << label << value << "  (" << configSourceToString(sourceOf(key)) << ")\n";
    };
    auto flag = [](bool value) { return std::string(value ? "true" : "false"); };

    std::ostringstream out;
    out << "claude-jail configuration:\n";
    line(out, "profile:          ", SandboxSettings::PROP_PROFILE, settings.getProfile());
    line(out, "network:          ", SandboxSettings::PROP_NETWORK,
         flag(settings.isNetworkEnabled()));
    line(out, "sandbox-home:     ", SandboxSettings::PROP_SANDBOX_HOME,
         settings.getSandboxHome());
    line(out, "sandbox-name:     ", SandboxSettings::PROP_SANDBOX_NAME,
         settings.getSandboxName());
    line(out, "copy-config:      ", SandboxSettings::PROP_COPY_CONFIG,
         flag(settings.isCopyConfigEnabled()));
    line(out, "verbose:          ", SandboxSettings::PROP_VERBOSE, flag(settings.isVerbose()));
    line(out, "git-worktree-ro:  ", SandboxSettings::PROP_GIT_WORKTREE_RO,
         flag(settings.isGitWorktreeReadOnly()));
    if (!settings.getGitRoot().empty()) {
        line(out, "git-root:         ", SandboxSettings::PROP_GIT_ROOT, settings.getGitRoot());
    }

    out << "\n";
    if (loadedFile) {
        out << "Config file: " << loadedFile->path.string()
            << " (" << configSourceToString(loadedFile->scope) << ")\n";
    } else {
        out << "Config file: none\n";
    }

    appendList(out, "Extra read-only paths", settings.getExtraReadOnlyPaths(),
               sourceOf(SandboxSettings::PROP_EXTRA_RO));
    appendList(out, "Extra read-write paths", settings.getExtraReadWritePaths(),
               sourceOf(SandboxSettings::PROP_EXTRA_RW));
    appendList(out, "Blocked paths", settings.getBlockedPaths(),
               sourceOf(SandboxSettings::PROP_BLOCKED));

    return out.str();
}

// ==================================================================
// ConfigResolver
// ==================================================================

ConfigResolver::ConfigResolver(Environment env, fs::path projectDir)
    : env_(std::move(env)), projectDir_(std::move(projectDir)) {
}

void ConfigResolver::setExplicitConfigFile(const fs::path& path) {
    explicitConfig_ = path;
}

std::vector<ConfigCandidate> ConfigResolver::candidates() const {
    std::vector<ConfigCandidate> result;

    if (explicitConfig_ && !explicitConfig_->empty()) {
        result.push_back({*explicitConfig_, ConfigSource::EXPLICIT_FILE});
    } else {
        std::string fromEnv = getEnv(env_, ENV_CONFIG_FILE);
        if (!fromEnv.empty()) {
            result.push_back({fs::path(fromEnv), ConfigSource::EXPLICIT_FILE});
        }
    }

    result.push_back({projectDir_ / PROJECT_CONFIG_NAME, ConfigSource::PROJECT_FILE});
    result.push_back({configHome(env_) / USER_CONFIG_DIR / USER_CONFIG_NAME,
                      ConfigSource::USER_FILE});
    result.push_back({homeDirectory(env_) / LEGACY_CONFIG_NAME, ConfigSource::USER_FILE});

    return result;
}

Properties ConfigResolver::environmentTier() const {
    Properties tier;
    for (const auto& binding : ENV_BINDINGS) {
        std::string value = getEnv(env_, binding.variable);
        if (!value.empty()) {
            tier.set(binding.key, value);
        }
    }
    return tier;
}

std::optional<ConfigCandidate> ConfigResolver::loadFileTier(Properties& out) const {
    for (const auto& candidate : candidates()) {
        std::error_code ec;
        if (!fs::is_regular_file(candidate.path, ec)) {
            if (candidate.scope == ConfigSource::EXPLICIT_FILE) {
                LOGW_FMT("Config file not found: " << candidate.path.string());
            }
            continue;
        }

        try {
            out = ConfigFileParser::parseFile(candidate.path.string());
        } catch (const ConfigParseError& e) {
            LOGW_FMT("Failed to parse config file: " << e.what());
            continue;
        }

        LOGI_FMT("Loaded " << configSourceToString(candidate.scope)
                 << " from " << candidate.path.string());
        return candidate;
    }

    return std::nullopt;
}

ResolvedConfiguration ConfigResolver::resolve(const Properties& overrides) const {
    Properties merged;
    std::map<std::string, ConfigSource> sources;

    Properties fileTier;
    std::optional<ConfigCandidate> loaded = loadFileTier(fileTier);
    if (loaded) {
        applyTier(merged, sources, fileTier, loaded->scope);
    }

    applyTier(merged, sources, environmentTier(), ConfigSource::ENVIRONMENT);
    applyTier(merged, sources, overrides, ConfigSource::OVERRIDE);

    ResolvedConfiguration resolved;
    resolved.settings = SandboxSettings(merged);
    resolved.loadedFile = loaded;
    for (const auto& key : SandboxSettings::knownKeys()) {
        auto it = sources.find(key);
        resolved.sources[key] = (it == sources.end()) ? ConfigSource::DEFAULT : it->second;
    }

    return resolved;
}

void ConfigResolver::applyTier(Properties& merged, std::map<std::string, ConfigSource>& sources,
                               const Properties& tier, ConfigSource source) {
    merged.merge(tier);
    for (const auto& key : tier.keys()) {
        sources[key] = source;
    }
}

std::string ConfigResolver::helpText() {
    return R"(CONFIGURATION

claude-jail is configured from, highest priority first:

1. Command line arguments:
   --profile, --network, --no-network, --ro, --rw,
   --sandbox-home, --sandbox-name, --git-root, --git-ro

2. Environment variables (empty values are ignored):
   CJ_PROFILE=standard              Profile to use
   CJ_NETWORK=true                  Enable/disable network
   CJ_SANDBOX_HOME=/path            Parent directory for the sandbox (default: cwd)
   CJ_SANDBOX_NAME=.claude-sandbox  Sandbox directory name
   CJ_COPY_CLAUDE_CONFIG=true       Copy ~/.claude on first run
   CJ_VERBOSE=false                 Verbose output
   CJ_GIT_WORKTREE_RO=false         Bind the main .git read-only in worktrees
   CJ_EXTRA_RO=/path1:/path2        Extra read-only paths (colon-separated)
   CJ_EXTRA_RW=/path1:/path2        Extra read-write paths (colon-separated)
   CJ_BLOCKED=/path1:/path2         Blocked paths (colon-separated)
   CJ_CONFIG_FILE=/path/to/config   Custom config file location

3. The first readable config file among:
   - $CJ_CONFIG_FILE (or --config FILE)
   - <project>/.claude-jail.json
   - ${XDG_CONFIG_HOME:-~/.config}/claude-jail/config.json
   - ~/.claude-jail.json

   Config file format (JSON):
   {
     "profile": "standard",
     "network": true,
     "verbose": false,
     "copy_config": true,
     "sandbox": { "home": "/path/to/sandboxes", "name": ".claude-sandbox" },
     "git": { "worktree_readonly": false, "root": "/path/to/main" },
     "paths": {
       "extra_ro": ["/usr/local/mylib"],
       "extra_rw": ["/path/to/scratch"],
       "blocked": ["~/.ssh"]
     }
   }

   NOTE: Setting sandbox.home in a user-level config affects all projects
   and is usually not what you want. Prefer the project-level
   .claude-jail.json for project-specific sandbox locations.

4. Built-in defaults.

A list defined at a higher level replaces the lower level's list.

GIT WORKTREE SUPPORT

claude-jail detects git worktrees and binds the main .git directory so
that git works inside the sandbox. The binding is read-write by default;
use --git-ro or CJ_GIT_WORKTREE_RO=true for a read-only binding.

EXAMPLES

  CJ_PROFILE=paranoid claude-jail
  CJ_EXTRA_RO="/usr/local/mylib:/opt/tools" claude-jail
  CJ_PROFILE=standard claude-jail --profile paranoid   # uses paranoid
  claude-jail --sandbox-home /tmp/sandboxes --sandbox-name mysandbox
  claude-jail -d feat-branch --git-root ./main
)";
}

} // namespace cjail

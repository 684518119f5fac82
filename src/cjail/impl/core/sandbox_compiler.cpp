#include "core/sandbox_compiler.h"
#include "emit/command_emitter.h"
#include "sandbox/sandbox_home_resolver.h"
#include "sandbox/sandbox_provisioner.h"
#include "utils/path_utils.h"
#include "utils/log.h"
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace cjail {

SandboxCompiler::SandboxCompiler(const ProfileRegistry& registry, Environment env)
    : registry_(registry), env_(std::move(env)) {
}

ResolvedConfiguration SandboxCompiler::resolveConfiguration(const CompileRequest& request) const {
    ConfigResolver resolver(env_, projectDirectory(request));
    if (request.configFile) {
        resolver.setExplicitConfigFile(*request.configFile);
    }
    return resolver.resolve(request.overrides);
}

fs::path SandboxCompiler::resolveSandboxHome(const ResolvedConfiguration& config,
                                             const CompileRequest& request) const {
    fs::path cwd = request.workingDir;
    if (cwd.empty()) {
        cwd = fs::current_path();
    }
    return SandboxHomeResolver::resolve(config.settings,
                                        config.sourceOf(SandboxSettings::PROP_SANDBOX_HOME),
                                        cwd, homeDirectory(env_));
}

CompiledSandbox SandboxCompiler::compile(const CompileRequest& request) {
    return compile(request, resolveConfiguration(request));
}

CompiledSandbox SandboxCompiler::compile(const CompileRequest& request,
                                         const ResolvedConfiguration& config) {
    const SandboxSettings& settings = config.settings;

    CompiledSandbox result;
    result.projectDir = projectDirectory(request);
    result.profile = settings.getProfile();
    result.git = GitBindingResult{GitBindingStatus::NOT_A_REPOSITORY, fs::path(), {}};

    std::shared_ptr<IProfile> profile = registry_.get(result.profile);

    result.sandboxHome = resolveSandboxHome(config, request);
    result.homeInside = profile->homeInside(result.sandboxHome);

    SandboxProvisioner provisioner(homeDirectory(env_));
    if (!provisioner.createLayout(result.sandboxHome)) {
        LOGW_FMT("Sandbox layout incomplete: " << result.sandboxHome.string());
    }
    if (!request.dryRun && settings.isCopyConfigEnabled()
        && !provisioner.copyAgentConfig(result.sandboxHome)) {
        LOGW("Agent configuration was only partially copied");
    }

    LOGI_FMT("Profile: " << result.profile);
    LOGI_FMT("Project: " << result.projectDir.string());
    LOGI_FMT("Sandbox: " << result.sandboxHome.string());

    acc_.reset();
    registry_.apply(result.profile, acc_, result.projectDir, result.sandboxHome);

    if (!settings.isNetworkEnabled()) {
        LOGI("Network: disabled");
        acc_.unshare({"net"});
    }

    if (request.gitEnabled) {
        std::optional<fs::path> manualRoot;
        if (!settings.getGitRoot().empty()) {
            manualRoot = expandHome(settings.getGitRoot(), homeDirectory(env_));
        }
        result.git = GitWorktreeResolver::contributeBindings(acc_, result.projectDir,
                                                             settings.isGitWorktreeReadOnly(),
                                                             manualRoot);
        GitWorktreeResolver::bindWorktreeAgentFiles(acc_, result.projectDir);
    }

    applyExtraPaths(settings.getExtraReadOnlyPaths(), BindMode::READ_ONLY);
    applyExtraPaths(settings.getExtraReadWritePaths(), BindMode::READ_WRITE);
    applyBlockedPaths(settings.getBlockedPaths());

    result.credentials = bindCredentials(result.sandboxHome, result.homeInside, request.dryRun);

    result.arguments = CommandEmitter::buildArguments(acc_.directives(), resolveCommand(request.command));
    LOGD_FMT("Compiled " << acc_.directives().size() << " directives");
    return result;
}

fs::path SandboxCompiler::projectDirectory(const CompileRequest& request) const {
    fs::path project = request.projectDir.empty() ? fs::path(".") : request.projectDir;
    std::error_code ec;
    if (!fs::is_directory(project, ec)) {
        throw PathNotFoundError(project.string());
    }
    return canonicalOrAbsolute(project);
}

void SandboxCompiler::applyExtraPaths(const std::vector<std::string>& paths, BindMode mode) {
    for (const auto& entry : paths) {
        fs::path path = expandHome(entry, homeDirectory(env_));
        if (!acc_.bind(path, mode)) {
            LOGW_FMT("Skipping missing " << bindModeToString(mode) << " path: " << entry);
        }
    }
}

void SandboxCompiler::applyBlockedPaths(const std::vector<std::string>& paths) {
    for (const auto& entry : paths) {
        fs::path path = normalizeDestination(fs::absolute(expandHome(entry, homeDirectory(env_))));

        if (acc_.directives().hasMountDestination(path.string())) {
            LOGW_FMT("Cannot block " << entry << ": it is bound explicitly");
            continue;
        }

        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            LOGI_FMT("Blocking directory " << path.string());
            acc_.tmpfs(path);
        } else if (fs::exists(path, ec)) {
            LOGI_FMT("Blocking file " << path.string());
            acc_.roBind(DEV_NULL, path);
        } else {
            LOGD_FMT("Blocked path does not exist: " << entry);
        }
    }
}

std::vector<std::string> SandboxCompiler::resolveCommand(std::vector<std::string> command) {
    if (command.empty()) {
        return command;
    }

    auto executable = findExecutable(command[0], getEnv(env_, "PATH"));
    if (!executable) {
        LOGW_FMT("Command not found on PATH: " << command[0]);
        return command;
    }

    // Launchers are often symlinks into a per-user install directory
    fs::path real = canonicalOrAbsolute(*executable);
    acc_.roBind(real.parent_path());
    command[0] = real.string();
    return command;
}

std::optional<fs::path> SandboxCompiler::bindCredentials(const fs::path& sandboxHome,
                                                         const fs::path& homeInside,
                                                         bool dryRun) {
    auto credentials = SandboxProvisioner::findCredentials(env_);
    if (!credentials) {
        LOGD("No credentials file found");
        return std::nullopt;
    }

    fs::path relative = fs::path(SandboxProvisioner::AGENT_DIR) / SandboxProvisioner::CREDENTIALS_FILE;
    if (!dryRun) {
        // The bind target has to exist as a file inside the sandbox home
        fs::path placeholder = sandboxHome / relative;
        std::error_code ec;
        if (!fs::exists(placeholder, ec)) {
            std::ofstream touch(placeholder);
            if (!touch.is_open()) {
                LOGW_FMT("Cannot create " << placeholder.string());
            }
        }
    }

    if (!acc_.bind(*credentials, homeInside / relative)) {
        return std::nullopt;
    }
    LOGI_FMT("Credentials: " << credentials->string());
    return credentials;
}

} // namespace cjail

/**
 * @file main.cpp
 * @brief Main entry point for claude-jail
 *
 * Compiles the sandbox for the current project and replaces itself with
 * bubblewrap running the agent (or a shell) inside it:
 * - Configuration (command line, CJ_* environment, config file, defaults)
 * - Sandbox home resolution and provisioning
 * - Profile application, git worktree and extra path bindings
 * - bwrap argument emission and exec
 */

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

#include "cli/command_line.h"
#include "config/config_resolver.h"
#include "core/sandbox_compiler.h"
#include "emit/command_emitter.h"
#include "profile/builtin_profiles.h"
#include "profile/profile_registry.h"
#include "sandbox/sandbox_provisioner.h"
#include "utils/environment.h"
#include "utils/log.h"

namespace {

const char* const kAgentCommand = "claude";
const char* const kShellCommand = "bash";

/**
 * Print registered profiles with their descriptions
 */
void listProfiles(const cjail::ProfileRegistry& registry) {
    std::cout << "Available profiles:\n";
    for (const auto& name : registry.list()) {
        std::string description = registry.get(name)->description();
        std::cout << "  " << name;
        if (!description.empty()) {
            std::cout << std::string(name.size() < 10 ? 10 - name.size() : 1, ' ') << description;
        }
        std::cout << "\n";
    }
}

/**
 * Command to run inside the sandbox
 */
std::vector<std::string> sandboxCommand(const cjail::CommandLine& cl) {
    std::vector<std::string> command;
    command.push_back(cl.command == cjail::CommandKind::SHELL ? kShellCommand : kAgentCommand);
    command.insert(command.end(), cl.arguments.begin(), cl.arguments.end());
    return command;
}

/**
 * Replace the process with the engine
 */
int execEngine(const std::vector<std::string>& arguments) {
    std::vector<char*> argv;
    for (const auto& arg : arguments) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    execvp(argv[0], argv.data());

    LOGE_FMT("Failed to execute " << arguments[0] << ": " << strerror(errno));
    return 127;
}

} // anonymous namespace

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    utils::setLogLevel(CJAIL_LOG_LEVEL_DEFAULT);

    cjail::ParseResult parsed = cjail::CommandLineParser::parse(argc, argv);
    if (!parsed.success) {
        LOGE(parsed.message);
        std::cerr << cjail::CommandLineParser::usage("claude-jail");
        return 1;
    }

    const cjail::CommandLine& cl = parsed.commandLine;

    if (cl.query == cjail::QueryAction::HELP) {
        std::cout << cjail::CommandLineParser::usage("claude-jail");
        return 0;
    }
    if (cl.query == cjail::QueryAction::HELP_CONFIG) {
        std::cout << cjail::ConfigResolver::helpText();
        return 0;
    }

    if (cl.verbose) {
        utils::setLogLevel(utils::LogLevel::INFO);
    }

    cjail::Environment env = cjail::captureEnvironment();

    cjail::ProfileRegistry registry;
    cjail::registerBuiltinProfiles(registry, env);

    if (cl.query == cjail::QueryAction::LIST_PROFILES) {
        listProfiles(registry);
        return 0;
    }

    try {
        cjail::CompileRequest request;
        request.projectDir = cl.projectDir.empty() ? std::filesystem::current_path()
                                                   : std::filesystem::path(cl.projectDir);
        request.workingDir = std::filesystem::current_path();
        request.command = sandboxCommand(cl);
        request.overrides = cl.overrides;
        if (cl.configFile) {
            request.configFile = std::filesystem::path(*cl.configFile);
        }
        request.dryRun = (cl.command == cjail::CommandKind::DEBUG);

        cjail::SandboxCompiler compiler(registry, env);
        cjail::ResolvedConfiguration config = compiler.resolveConfiguration(request);

        if (config.settings.isVerbose()) {
            utils::setLogLevel(utils::LogLevel::INFO);
        }
        if (!config.settings.validate()) {
            LOGE_FMT("Invalid sandbox name: " << config.settings.getSandboxName());
            return 1;
        }

        if (cl.query == cjail::QueryAction::SHOW_CONFIG) {
            std::cout << config.show();
            return 0;
        }

        if (cl.command == cjail::CommandKind::CLEAN) {
            std::filesystem::path home = compiler.resolveSandboxHome(config, request);
            cjail::SandboxProvisioner provisioner(cjail::homeDirectory(env));
            if (provisioner.clean(home) > 0) {
                std::cout << "Removed " << home.string() << "\n";
            } else {
                std::cout << "No sandbox at " << home.string() << "\n";
            }
            return 0;
        }

        cjail::CompiledSandbox compiled = compiler.compile(request, config);

        if (cl.command == cjail::CommandKind::DEBUG) {
            std::cout << cjail::CommandEmitter::toShellString(compiled.arguments) << "\n";
            return 0;
        }

        if (cl.command == cjail::CommandKind::SHELL) {
            std::cerr << "Entering sandbox shell (profile: " << compiled.profile << ")\n"
                      << "   $HOME = " << compiled.homeInside.string() << "\n\n";
        }

        return execEngine(compiled.arguments);

    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }
}

#include "sandbox/sandbox_provisioner.h"
#include "utils/log.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <initializer_list>
#include <system_error>
#include <utility>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cjail {

SandboxProvisioner::SandboxProvisioner(fs::path hostHome)
    : hostHome_(std::move(hostHome)) {
}

bool SandboxProvisioner::createLayout(const fs::path& home) const {
    bool ok = true;
    for (const char* sub : {".config", ".cache", ".local/share", AGENT_DIR}) {
        std::error_code ec;
        fs::create_directories(home / sub, ec);
        if (ec) {
            LOGE_FMT("Failed to create " << (home / sub).string() << ": " << ec.message());
            ok = false;
        }
    }
    return ok;
}

bool SandboxProvisioner::copyAgentConfig(const fs::path& home) const {
    bool ok = true;
    std::error_code ec;

    fs::path hostAgentDir = hostHome_ / AGENT_DIR;
    fs::path sandboxAgentDir = home / AGENT_DIR;
    fs::path marker = sandboxAgentDir / COPIED_MARKER;

    if (fs::is_directory(hostAgentDir, ec) && !fs::exists(marker, ec)) {
        LOGI_FMT("Copying " << hostAgentDir.string() << " into sandbox");
        fs::create_directories(sandboxAgentDir, ec);

        int status = runCommand({"rsync", "-a", "--ignore-existing",
                                 hostAgentDir.string() + "/", sandboxAgentDir.string() + "/"});
        if (status != 0) {
            LOGW_FMT("rsync of " << hostAgentDir.string() << " failed with status " << status);
            ok = false;
        }

        std::ofstream touch(marker);
        if (!touch.is_open()) {
            LOGW_FMT("Cannot create marker " << marker.string());
            ok = false;
        }
    }

    fs::path hostState = hostHome_ / AGENT_STATE_FILE;
    fs::path sandboxState = home / AGENT_STATE_FILE;
    if (fs::is_regular_file(hostState, ec) && !fs::exists(sandboxState, ec)) {
        fs::copy_file(hostState, sandboxState, ec);
        if (ec) {
            LOGW_FMT("Cannot copy " << hostState.string() << ": " << ec.message());
            ok = false;
        }
    }

    return ok;
}

std::uintmax_t SandboxProvisioner::clean(const fs::path& home) const {
    std::error_code ec;
    if (!fs::exists(home, ec)) {
        LOGI_FMT("No sandbox at " << home.string());
        return 0;
    }

    std::uintmax_t removed = fs::remove_all(home, ec);
    if (ec) {
        throw fs::filesystem_error("Cannot remove sandbox", home, ec);
    }
    return removed;
}

std::optional<fs::path> SandboxProvisioner::findCredentials(const Environment& env) {
    std::vector<fs::path> dirs;

    std::string configDir = getEnv(env, "CLAUDE_CONFIG_DIR");
    if (!configDir.empty()) {
        dirs.emplace_back(configDir);
    }
    dirs.push_back(configHome(env) / "claude");
    dirs.push_back(homeDirectory(env) / AGENT_DIR);

    for (const auto& dir : dirs) {
        std::error_code ec;
        fs::path candidate = dir / CREDENTIALS_FILE;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

int SandboxProvisioner::runCommand(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return -1;
    }

    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        LOGE_FMT("Fork failed: " << strerror(errno));
        return -1;
    }

    if (pid == 0) {
        execvp(args[0], args.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            LOGE_FMT("waitpid failed: " << strerror(errno));
            return -1;
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

} // namespace cjail

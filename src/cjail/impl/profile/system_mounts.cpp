#include "profile/system_mounts.h"
#include "utils/path_utils.h"
#include "utils/log.h"
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace cjail {

namespace {

const char* const kDnsFiles[] = {
    "/etc/resolv.conf", "/etc/hosts", "/etc/nsswitch.conf", "/etc/host.conf", "/etc/gai.conf"
};

const char* const kSslPaths[] = {
    "/etc/ssl", "/etc/ca-certificates", "/etc/pki", "/etc/ca-certificates.conf"
};

const char* const kUserFiles[] = {
    "/etc/passwd", "/etc/group", "/etc/localtime"
};

// Relative to the host home directory
const char* const kToolchainDirs[] = {
    ".local/share/mise", ".config/mise",
    ".cargo", ".rustup",
    ".cache/uv", ".local/share/uv", ".pyenv",
    ".nvm", ".npm", ".volta", ".bun",
    "go",
    ".local/bin"
};

const char* const kPassthroughVariables[] = {
    "GIT_AUTHOR_NAME", "GIT_AUTHOR_EMAIL", "GIT_COMMITTER_NAME", "GIT_COMMITTER_EMAIL",
    "http_proxy", "https_proxy", "HTTP_PROXY", "HTTPS_PROXY", "no_proxy", "NO_PROXY",
    "ANTHROPIC_API_KEY",
    "TZ"
};

} // anonymous namespace

void SystemMounts::base(DirectiveAccumulator& acc) {
    acc.roBind("/usr");
    linkOrBind(acc, "/bin", "usr/bin");
    linkOrBind(acc, "/lib", "usr/lib");
    linkOrBind(acc, "/lib64", "usr/lib64");
    linkOrBind(acc, "/sbin", "usr/sbin");
    acc.roBind("/etc/alternatives");
}

void SystemMounts::dns(DirectiveAccumulator& acc) {
    for (const char* file : kDnsFiles) {
        acc.roBind(file);
    }
}

void SystemMounts::ssl(DirectiveAccumulator& acc) {
    for (const char* path : kSslPaths) {
        acc.roBind(path);
    }
}

void SystemMounts::users(DirectiveAccumulator& acc) {
    for (const char* file : kUserFiles) {
        acc.roBind(file);
    }
}

size_t SystemMounts::pathDirectories(DirectiveAccumulator& acc, const Environment& env) {
    size_t bound = 0;
    for (const auto& dir : splitList(getEnv(env, "PATH"))) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            LOGV_FMT("Skipping PATH entry: " << dir);
            continue;
        }
        if (acc.roBind(dir)) {
            ++bound;
        }
    }
    return bound;
}

size_t SystemMounts::toolchains(DirectiveAccumulator& acc, const fs::path& hostHome) {
    size_t bound = 0;
    for (const char* dir : kToolchainDirs) {
        std::error_code ec;
        fs::path path = hostHome / dir;
        if (fs::is_directory(path, ec) && acc.roBind(path)) {
            ++bound;
        }
    }
    return bound;
}

void SystemMounts::toolchainEnvironment(DirectiveAccumulator& acc, const fs::path& hostHome) {
    acc.setenv("MISE_DATA_DIR", (hostHome / ".local/share/mise").string());
    acc.setenv("MISE_CONFIG_DIR", (hostHome / ".config/mise").string());
    acc.setenv("CARGO_HOME", (hostHome / ".cargo").string());
    acc.setenv("RUSTUP_HOME", (hostHome / ".rustup").string());
}

size_t SystemMounts::passthroughEnvironment(DirectiveAccumulator& acc, const Environment& env) {
    size_t forwarded = 0;
    for (const char* name : kPassthroughVariables) {
        std::string value = getEnv(env, name);
        if (!value.empty()) {
            acc.setenv(name, value);
            ++forwarded;
        }
    }
    return forwarded;
}

void SystemMounts::linkOrBind(DirectiveAccumulator& acc, const fs::path& path, const std::string& target) {
    std::error_code ec;
    if (fs::is_symlink(fs::symlink_status(path, ec))) {
        acc.symlink(target, path);
    } else if (fs::is_directory(path, ec)) {
        acc.roBind(path);
    }
}

} // namespace cjail

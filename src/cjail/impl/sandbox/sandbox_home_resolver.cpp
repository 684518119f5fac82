#include "sandbox/sandbox_home_resolver.h"
#include "utils/path_utils.h"
#include "utils/log.h"
#include <algorithm>
#include <vector>

namespace fs = std::filesystem;

namespace cjail {

namespace {

const std::vector<std::string> kUnsafeRoots = {
    "/", "/etc", "/home", "/root", "/usr", "/bin", "/sbin", "/lib", "/lib64",
    "/var", "/tmp", "/boot", "/dev", "/proc", "/sys"
};

} // anonymous namespace

fs::path SandboxHomeResolver::resolve(const std::string& home, const std::string& name,
                                      const fs::path& cwd, const fs::path& homeDir) {
    fs::path configured = expandHome(home, homeDir);

    if (configured.is_absolute()) {
        return normalizeDestination(configured / name);
    }
    return normalizeDestination(cwd / configured);
}

fs::path SandboxHomeResolver::resolve(const SandboxSettings& settings, ConfigSource homeSource,
                                      const fs::path& cwd, const fs::path& homeDir) {
    if (homeSource == ConfigSource::USER_FILE) {
        LOGW("sandbox home is set in a user-level config file and applies to every project; "
             "prefer a project-level .claude-jail.json");
    }

    fs::path root = resolve(settings.getSandboxHome(), settings.getSandboxName(), cwd, homeDir);
    validate(root);
    return root;
}

bool SandboxHomeResolver::isUnsafeRoot(const fs::path& path) {
    std::string normal = normalizeDestination(path).string();
    return std::find(kUnsafeRoots.begin(), kUnsafeRoots.end(), normal) != kUnsafeRoots.end();
}

void SandboxHomeResolver::validate(const fs::path& path) {
    if (isUnsafeRoot(path)) {
        throw UnsafeSandboxRootError(path.string());
    }
}

} // namespace cjail

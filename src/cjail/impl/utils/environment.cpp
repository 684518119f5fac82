#include "utils/environment.h"
#include <pwd.h>
#include <unistd.h>

extern char** environ;

namespace cjail {

Environment captureEnvironment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto pos = item.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        env[item.substr(0, pos)] = item.substr(pos + 1);
    }
    return env;
}

std::string getEnv(const Environment& env, const std::string& name, const std::string& defaultValue) {
    auto it = env.find(name);
    if (it == env.end() || it->second.empty()) {
        return defaultValue;
    }
    return it->second;
}

std::filesystem::path homeDirectory(const Environment& env) {
    std::string home = getEnv(env, "HOME");
    if (!home.empty()) {
        return home;
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return "/";
}

std::filesystem::path configHome(const Environment& env) {
    std::string xdg = getEnv(env, "XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return xdg;
    }
    return homeDirectory(env) / ".config";
}

} // namespace cjail

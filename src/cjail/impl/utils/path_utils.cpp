#include "utils/path_utils.h"
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cjail {

std::vector<std::string> splitList(const std::string& value, char separator) {
    std::vector<std::string> result;
    std::istringstream iss(value);
    std::string item;

    while (std::getline(iss, item, separator)) {
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

fs::path normalizeDestination(const fs::path& path) {
    if (path.empty()) {
        return path;
    }

    fs::path normal = path.lexically_normal();
    std::string str = normal.string();
    while (str.size() > 1 && str.back() == '/') {
        str.pop_back();
    }
    return fs::path(str);
}

fs::path canonicalOrAbsolute(const fs::path& path) {
    std::error_code ec;
    fs::path resolved = fs::canonical(path, ec);
    if (!ec) {
        return resolved;
    }

    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    return absolute.lexically_normal();
}

std::vector<fs::path> ancestorsOf(const fs::path& path) {
    std::vector<fs::path> result;
    fs::path normal = normalizeDestination(path);
    if (!normal.is_absolute()) {
        return result;
    }

    fs::path build = normal.root_path();
    fs::path relative = normal.relative_path();
    auto last = relative.end();
    if (relative.begin() == last) {
        return result;
    }
    --last;

    for (auto it = relative.begin(); it != last; ++it) {
        build /= *it;
        result.push_back(build);
    }

    return result;
}

bool isWithin(const fs::path& child, const fs::path& parent) {
    fs::path c = normalizeDestination(child);
    fs::path p = normalizeDestination(parent);

    auto cit = c.begin();
    for (auto pit = p.begin(); pit != p.end(); ++pit, ++cit) {
        if (cit == c.end() || *cit != *pit) {
            return false;
        }
    }

    return cit != c.end();
}

fs::path expandHome(const std::string& path, const fs::path& home) {
    if (path == "~") {
        return home;
    }
    if (path.size() > 1 && path[0] == '~' && path[1] == '/') {
        return home / path.substr(2);
    }
    return fs::path(path);
}

std::optional<fs::path> findExecutable(const std::string& name, const std::string& searchPath) {
    if (name.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    if (name.find('/') != std::string::npos) {
        if (fs::is_regular_file(name, ec) && access(name.c_str(), X_OK) == 0) {
            return fs::path(name);
        }
        return std::nullopt;
    }

    for (const auto& dir : splitList(searchPath)) {
        fs::path candidate = fs::path(dir) / name;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace cjail

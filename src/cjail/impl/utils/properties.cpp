#include "utils/properties.h"
#include "utils/path_utils.h"

namespace cjail {

namespace {

bool parseBoolString(const std::string& str) {
    return str == "true" || str == "1" || str == "yes" || str == "on";
}

} // anonymous namespace

void Properties::set(const std::string& key, const std::any& value) {
    properties_[key] = value;
}

std::string Properties::getString(const std::string& key, const std::string& defaultValue) const {
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* str = std::any_cast<std::string>(&it->second)) {
        return *str;
    }
    if (const auto* cstr = std::any_cast<const char*>(&it->second)) {
        return std::string(*cstr);
    }
    if (const auto* flag = std::any_cast<bool>(&it->second)) {
        return *flag ? "true" : "false";
    }
    return defaultValue;
}

bool Properties::getBool(const std::string& key, bool defaultValue) const {
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* flag = std::any_cast<bool>(&it->second)) {
        return *flag;
    }
    if (const auto* str = std::any_cast<std::string>(&it->second)) {
        return parseBoolString(*str);
    }
    if (const auto* cstr = std::any_cast<const char*>(&it->second)) {
        return parseBoolString(*cstr);
    }
    return defaultValue;
}

std::vector<std::string> Properties::getStringList(const std::string& key) const {
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return {};
    }

    if (const auto* list = std::any_cast<std::vector<std::string>>(&it->second)) {
        return *list;
    }
    if (const auto* str = std::any_cast<std::string>(&it->second)) {
        return splitList(*str);
    }
    if (const auto* cstr = std::any_cast<const char*>(&it->second)) {
        return splitList(*cstr);
    }
    return {};
}

bool Properties::has(const std::string& key) const {
    return properties_.find(key) != properties_.end();
}

std::vector<std::string> Properties::keys() const {
    std::vector<std::string> result;
    result.reserve(properties_.size());

    for (const auto& pair : properties_) {
        result.push_back(pair.first);
    }

    return result;
}

void Properties::merge(const Properties& other) {
    if (this == &other) {
        return;
    }

    for (const auto& pair : other.properties_) {
        properties_[pair.first] = pair.second;
    }
}

} // namespace cjail

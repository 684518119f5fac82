#include "profile/profile_registry.h"
#include "utils/log.h"
#include <sstream>
#include <utility>

namespace cjail {

namespace {

std::string unknownProfileMessage(const std::string& name, const std::vector<std::string>& available) {
    std::ostringstream oss;
    oss << "Unknown profile: " << name << " (available:";
    for (const auto& entry : available) {
        oss << " " << entry;
    }
    oss << ")";
    return oss.str();
}

} // anonymous namespace

UnknownProfileError::UnknownProfileError(const std::string& name,
                                         const std::vector<std::string>& available)
    : std::runtime_error(unknownProfileMessage(name, available))
    , name_(name)
    , available_(available) {
}

void ProfileRegistry::registerProfile(const std::string& name, std::shared_ptr<IProfile> profile) {
    if (name.empty()) {
        throw std::invalid_argument("Profile name cannot be empty");
    }
    if (!profile) {
        throw std::invalid_argument("Profile cannot be null: " + name);
    }

    if (profiles_.count(name) > 0) {
        LOGD_FMT("Replacing profile: " << name);
    }
    profiles_[name] = std::move(profile);
}

void ProfileRegistry::apply(const std::string& name, DirectiveAccumulator& acc,
                            const std::filesystem::path& project,
                            const std::filesystem::path& sandbox) const {
    LOGD_FMT("Applying profile: " << name);
    get(name)->apply(acc, project, sandbox);
}

std::shared_ptr<IProfile> ProfileRegistry::get(const std::string& name) const {
    auto it = profiles_.find(name);
    if (it == profiles_.end()) {
        throw UnknownProfileError(name, list());
    }
    return it->second;
}

bool ProfileRegistry::contains(const std::string& name) const {
    return profiles_.find(name) != profiles_.end();
}

std::vector<std::string> ProfileRegistry::list() const {
    std::vector<std::string> names;
    names.reserve(profiles_.size());
    for (const auto& entry : profiles_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace cjail

#ifndef CJAIL_PROFILE_REGISTRY_H
#define CJAIL_PROFILE_REGISTRY_H

#include "profile/profile.h"
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace cjail {

/**
 * @brief Thrown when a profile name is not registered
 *
 * The message lists every registered name.
 */
class UnknownProfileError : public std::runtime_error {
public:
    UnknownProfileError(const std::string& name, const std::vector<std::string>& available);

    const std::string& name() const { return name_; }
    const std::vector<std::string>& available() const { return available_; }

private:
    std::string name_;
    std::vector<std::string> available_;
};

/**
 * @brief Registry of named isolation profiles
 *
 * Names are unique; registering an existing name replaces the profile.
 * Populated once at startup and read-only afterwards.
 */
class ProfileRegistry {
public:
    ProfileRegistry() = default;

    // Prevent copying
    ProfileRegistry(const ProfileRegistry&) = delete;
    ProfileRegistry& operator=(const ProfileRegistry&) = delete;

    /**
     * @brief Register a profile under name, replacing any previous one
     * @throws std::invalid_argument if name is empty or profile is null
     */
    void registerProfile(const std::string& name, std::shared_ptr<IProfile> profile);

    /**
     * @brief Apply the named profile to acc
     * @throws UnknownProfileError if name is not registered
     */
    void apply(const std::string& name, DirectiveAccumulator& acc,
               const std::filesystem::path& project,
               const std::filesystem::path& sandbox) const;

    /**
     * @brief Get a profile by name
     * @throws UnknownProfileError if name is not registered
     */
    std::shared_ptr<IProfile> get(const std::string& name) const;

    bool contains(const std::string& name) const;

    /**
     * @brief Registered names, sorted
     */
    std::vector<std::string> list() const;

    size_t size() const { return profiles_.size(); }

private:
    std::map<std::string, std::shared_ptr<IProfile>> profiles_;
};

} // namespace cjail

#endif // CJAIL_PROFILE_REGISTRY_H

#ifndef CJAIL_BUILTIN_PROFILES_H
#define CJAIL_BUILTIN_PROFILES_H

#include "profile/profile.h"
#include "profile/profile_registry.h"
#include "utils/environment.h"
#include <filesystem>
#include <string>

namespace cjail {

/**
 * @brief Base for profiles that read host environment values
 *
 * The environment is captured at construction so that apply() depends only
 * on its arguments and the filesystem.
 */
class EnvironmentProfile : public IProfile {
public:
    explicit EnvironmentProfile(Environment env);

protected:
    std::string env(const std::string& name, const std::string& defaultValue = "") const;
    std::filesystem::path hostHome() const;
    const Environment& environment() const { return env_; }

private:
    Environment env_;
};

/**
 * @brief Fast startup, basic protection
 *
 * All namespaces unshared except the network; /usr, /etc and /run are
 * exposed read-only as a whole.
 */
class MinimalProfile : public EnvironmentProfile {
public:
    using EnvironmentProfile::EnvironmentProfile;

    void apply(DirectiveAccumulator& acc, const std::filesystem::path& project,
               const std::filesystem::path& sandbox) const override;
    std::string description() const override;
};

/**
 * @brief Selective system mounts, host PATH preserved (default)
 */
class StandardProfile : public EnvironmentProfile {
public:
    using EnvironmentProfile::EnvironmentProfile;

    void apply(DirectiveAccumulator& acc, const std::filesystem::path& project,
               const std::filesystem::path& sandbox) const override;
    std::string description() const override;

protected:
    // Extension points, called before the project bind and after the base environment
    virtual void bindExtras(DirectiveAccumulator& acc) const;
    virtual void setExtraEnvironment(DirectiveAccumulator& acc) const;
};

/**
 * @brief Standard plus the per-user toolchains (mise, cargo, uv, nvm, ...)
 */
class DevProfile : public StandardProfile {
public:
    using StandardProfile::StandardProfile;

    std::string description() const override;

protected:
    void bindExtras(DirectiveAccumulator& acc) const override;
    void setExtraEnvironment(DirectiveAccumulator& acc) const override;
};

/**
 * @brief Maximum isolation
 *
 * Minimal system mounts, the project at /work and the sandbox home at
 * /sandbox, so no host path leaks into the sandbox view.
 */
class ParanoidProfile : public IProfile {
public:
    static constexpr const char* WORK_DIR = "/work";
    static constexpr const char* SANDBOX_DIR = "/sandbox";

    explicit ParanoidProfile(Environment env);

    void apply(DirectiveAccumulator& acc, const std::filesystem::path& project,
               const std::filesystem::path& sandbox) const override;
    std::filesystem::path homeInside(const std::filesystem::path& sandbox) const override;
    std::string description() const override;

private:
    std::string term_;
};

/**
 * @brief Register minimal, standard, dev and paranoid
 */
void registerBuiltinProfiles(ProfileRegistry& registry, const Environment& env);

} // namespace cjail

#endif // CJAIL_BUILTIN_PROFILES_H

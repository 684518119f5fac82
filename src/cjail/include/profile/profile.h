#ifndef CJAIL_PROFILE_H
#define CJAIL_PROFILE_H

#include "directive/directive_accumulator.h"
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

namespace cjail {

/**
 * @brief Isolation profile interface
 *
 * A profile describes one isolation level. apply() populates a freshly
 * reset accumulator using only its primitives; it must not keep state
 * between calls, so applying the same profile twice to reset accumulators
 * gives identical directive sets.
 *
 * Example implementation:
 * @code
 * class TinyProfile : public IProfile {
 * public:
 *     void apply(DirectiveAccumulator& acc, const std::filesystem::path& project,
 *                const std::filesystem::path& sandbox) const override {
 *         acc.unshare({"all"});
 *         acc.roBind("/usr");
 *         acc.bind(project);
 *         acc.bind(sandbox);
 *         acc.setenv("HOME", sandbox.string());
 *     }
 * };
 * @endcode
 */
class IProfile {
public:
    virtual ~IProfile() = default;

    /**
     * @brief Populate the accumulator
     *
     * @param acc Accumulator, reset by the caller
     * @param project Host project directory
     * @param sandbox Host sandbox home directory
     */
    virtual void apply(DirectiveAccumulator& acc,
                       const std::filesystem::path& project,
                       const std::filesystem::path& sandbox) const = 0;

    /**
     * @brief Where the sandbox home appears inside the sandbox
     */
    virtual std::filesystem::path homeInside(const std::filesystem::path& sandbox) const {
        return sandbox;
    }

    /**
     * @brief One-line description shown by --list-profiles
     */
    virtual std::string description() const {
        return std::string();
    }
};

/**
 * @brief Profile backed by a callable
 */
class FunctionProfile : public IProfile {
public:
    using ApplyFunction = std::function<void(DirectiveAccumulator&,
                                             const std::filesystem::path&,
                                             const std::filesystem::path&)>;

    explicit FunctionProfile(ApplyFunction fn, std::string description = std::string())
        : fn_(std::move(fn)), description_(std::move(description)) {}

    void apply(DirectiveAccumulator& acc,
               const std::filesystem::path& project,
               const std::filesystem::path& sandbox) const override {
        fn_(acc, project, sandbox);
    }

    std::string description() const override {
        return description_;
    }

private:
    ApplyFunction fn_;
    std::string description_;
};

} // namespace cjail

#endif // CJAIL_PROFILE_H

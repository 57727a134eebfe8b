#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// IEnvironment — read-only view of environment variables.
//
// The configuration resolver and the confirmation gate read the environment
// through this interface instead of calling getenv() directly, so both can be
// exercised in tests with a scripted environment.
// ---------------------------------------------------------------------------
class IEnvironment {
public:
    virtual ~IEnvironment() = default;

    // Returns the raw value, or nullopt when the variable is not set.
    [[nodiscard]] virtual std::optional<std::string> Get(
        std::string_view name) const = 0;
};

// Reads the environment of the current process.
class ProcessEnvironment : public IEnvironment {
public:
    [[nodiscard]] std::optional<std::string> Get(
        std::string_view name) const override;
};

// Value of `name` if it is set to something other than the empty string.
std::optional<std::string> GetNonEmpty(const IEnvironment& env,
                                       std::string_view name);

// "1", "true", "yes" and "on" (any case) are true; everything else is false.
bool IsTruthy(std::string_view value);

// Name of the variable that marks an automated host (CLOUD_SHELL, CI), or
// nullopt when none of them is set to a non-empty value.
std::optional<std::string> DetectNonInteractiveContext(const IEnvironment& env);

} // namespace vsearch_deploy

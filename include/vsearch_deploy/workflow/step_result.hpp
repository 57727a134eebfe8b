#pragma once

#include <vsearch_deploy/core/result.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// StepOutcome — outcome of one provisioning or pipeline step.
// ---------------------------------------------------------------------------
enum class StepOutcome {
    Created,
    AlreadyPresent,
    Failed,
};

[[nodiscard]] const char* StepOutcomeName(StepOutcome outcome);

// ---------------------------------------------------------------------------
// StepResult — outcome + timing for a single step. `error` is set exactly
// when the outcome is Failed.
// ---------------------------------------------------------------------------
struct StepResult {
    std::string step_name;
    StepOutcome outcome = StepOutcome::Failed;
    std::string message;
    std::chrono::milliseconds duration{0};
    std::optional<Error> error;

    [[nodiscard]] bool Failed() const noexcept {
        return outcome == StepOutcome::Failed;
    }
};

// Step names, in execution order.
namespace steps {
constexpr const char* kEnableServices = "enable-services";
constexpr const char* kCreateServiceAccount = "create-service-account";
constexpr const char* kVerifyPropagation = "verify-propagation";
constexpr const char* kGrantRole = "grant-role";
constexpr const char* kCreateRepository = "create-repository";
constexpr const char* kBuild = "build";
constexpr const char* kDeploy = "deploy";
} // namespace steps

} // namespace vsearch_deploy

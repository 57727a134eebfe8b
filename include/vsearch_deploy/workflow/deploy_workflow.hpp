#pragma once

#include <vsearch_deploy/cloud/i_cloud_provider.hpp>
#include <vsearch_deploy/config/app_config.hpp>
#include <vsearch_deploy/core/retry.hpp>
#include <vsearch_deploy/workflow/step_result.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// DeployResult — aggregated results from the full workflow run.
// ---------------------------------------------------------------------------
struct DeployResult {
    bool success = false;
    std::vector<StepResult> steps;
    std::optional<std::string> service_url;
    // Error of the step that stopped the run.
    std::optional<Error> failure;
    std::string summary;
    std::chrono::milliseconds total_duration{0};

    [[nodiscard]] const StepResult* FailedStep() const;
};

// ---------------------------------------------------------------------------
// DeployWorkflow — provisioning steps followed by build and deploy.
//
// Strictly sequential; the first failed step ends the run and nothing is
// rolled back. Re-running after a failure resumes where it stopped because
// every step checks the remote state first.
//
// Takes ownership of nothing — the collaborators and the config must outlive
// this object.
// ---------------------------------------------------------------------------
class DeployWorkflow {
public:
    DeployWorkflow(CloudServices cloud,
                   const DeploymentConfig& config,
                   SleepFn sleep = ThreadSleep());

    ~DeployWorkflow();

    // Non-copyable, non-movable.
    DeployWorkflow(const DeployWorkflow&) = delete;
    DeployWorkflow& operator=(const DeployWorkflow&) = delete;
    DeployWorkflow(DeployWorkflow&&) = delete;
    DeployWorkflow& operator=(DeployWorkflow&&) = delete;

    [[nodiscard]] DeployResult Execute();

private:
    CloudServices cloud_;
    const DeploymentConfig& config_;
    SleepFn sleep_;
};

} // namespace vsearch_deploy

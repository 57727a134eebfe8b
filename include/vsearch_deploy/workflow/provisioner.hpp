#pragma once

#include <vsearch_deploy/cloud/i_cloud_provider.hpp>
#include <vsearch_deploy/config/app_config.hpp>
#include <vsearch_deploy/core/retry.hpp>
#include <vsearch_deploy/workflow/step_result.hpp>

#include <vector>

namespace vsearch_deploy {

constexpr const char* kServiceAccountDisplayName = "Vertex Search App Service Account";

// ---------------------------------------------------------------------------
// IdempotentProvisioner — brings the project to the state the application
// needs: enable-services -> create-service-account -> verify-propagation ->
// grant-role -> create-repository.
//
// Every step describes the remote resource afresh and only creates what is
// absent, so a second run against the same project reports AlreadyPresent
// everywhere. Execution stops at the first failed step.
//
// Takes ownership of nothing — the collaborators and the config must outlive
// this object.
// ---------------------------------------------------------------------------
class IdempotentProvisioner {
public:
    IdempotentProvisioner(CloudServices cloud,
                          const DeploymentConfig& config,
                          SleepFn sleep = ThreadSleep());

    IdempotentProvisioner(const IdempotentProvisioner&) = delete;
    IdempotentProvisioner& operator=(const IdempotentProvisioner&) = delete;

    // Run all steps in order. The returned list ends at the first failure.
    [[nodiscard]] std::vector<StepResult> Run();

    StepResult EnableServices();
    StepResult CreateServiceAccount();
    StepResult VerifyPropagation();
    StepResult GrantRole();
    StepResult CreateRepository();

private:
    CloudServices cloud_;
    const DeploymentConfig& config_;
    SleepFn sleep_;
    // Set by CreateServiceAccount when the identity did not exist before.
    bool identity_created_ = false;
};

} // namespace vsearch_deploy

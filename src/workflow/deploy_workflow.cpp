#include <vsearch_deploy/workflow/deploy_workflow.hpp>

#include <vsearch_deploy/core/log.hpp>
#include <vsearch_deploy/workflow/deploy_pipeline.hpp>
#include <vsearch_deploy/workflow/provisioner.hpp>

#include <sstream>

namespace vsearch_deploy {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

// Move `from` onto the end of `into`; true if the last step failed.
bool Append(std::vector<StepResult>& into, std::vector<StepResult> from) {
    for (auto& step : from) {
        into.push_back(std::move(step));
    }
    return !into.empty() && into.back().Failed();
}

} // namespace

const StepResult* DeployResult::FailedStep() const {
    for (const auto& step : steps) {
        if (step.Failed()) {
            return &step;
        }
    }
    return nullptr;
}

DeployWorkflow::DeployWorkflow(CloudServices cloud,
                               const DeploymentConfig& config,
                               SleepFn sleep)
    : cloud_(cloud), config_(config), sleep_(std::move(sleep)) {}

DeployWorkflow::~DeployWorkflow() = default;

DeployResult DeployWorkflow::Execute() {
    auto total_start = Clock::now();
    DeployResult result;

    auto finish = [&](bool success) {
        result.success = success;
        result.total_duration = Elapsed(total_start);
        if (const auto* failed = result.FailedStep()) {
            result.failure = failed->error;
            result.summary = failed->step_name + " failed: " + failed->message;
            return;
        }

        int created = 0;
        int present = 0;
        for (const auto& s : result.steps) {
            if (s.outcome == StepOutcome::Created) ++created;
            if (s.outcome == StepOutcome::AlreadyPresent) ++present;
        }
        std::ostringstream oss;
        oss << created << " created, " << present << " already present";
        result.summary = oss.str();
    };

    // Steps 1-5: provisioning.
    IdempotentProvisioner provisioner(cloud_, config_, sleep_);
    if (Append(result.steps, provisioner.Run())) {
        finish(false);
        return result;
    }

    // Build and deploy.
    BuildAndDeployPipeline pipeline(cloud_.builder, cloud_.hoster, config_);
    auto deployed = pipeline.Run();
    if (Append(result.steps, std::move(deployed.steps))) {
        finish(false);
        return result;
    }

    result.service_url = std::move(deployed.service_url);
    finish(true);
    LogInfo("provision", "Deployment finished: " + result.summary);
    return result;
}

} // namespace vsearch_deploy

#pragma once

#include <vsearch_deploy/cloud/i_cloud_provider.hpp>
#include <vsearch_deploy/config/app_config.hpp>
#include <vsearch_deploy/workflow/step_result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vsearch_deploy {

struct PipelineResult {
    std::vector<StepResult> steps;
    // Reachable address of the deployed service; set only on success.
    std::optional<std::string> service_url;
};

// ---------------------------------------------------------------------------
// BuildAndDeployPipeline — build the image into the registry, deploy it, and
// read back the service address. Neither the build nor the deploy is retried.
// ---------------------------------------------------------------------------
class BuildAndDeployPipeline {
public:
    BuildAndDeployPipeline(IBuilder& builder, IHoster& hoster,
                           const DeploymentConfig& config);

    [[nodiscard]] PipelineResult Run();

    // The deploy request derived from the configuration.
    [[nodiscard]] DeploySpec MakeDeploySpec() const;

private:
    IBuilder& builder_;
    IHoster& hoster_;
    const DeploymentConfig& config_;
};

// True for "https://<host>[/...]" with a non-empty host.
bool IsWellFormedServiceUrl(std::string_view url);

} // namespace vsearch_deploy

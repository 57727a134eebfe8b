#include <vsearch_deploy/workflow/deploy_pipeline.hpp>

#include <vsearch_deploy/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>

namespace vsearch_deploy {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

StepResult Failed(const char* name, Error error, Clock::time_point start) {
    LogError("pipeline", std::string(name) + " failed: " + error.ToString());
    auto message = error.message;
    return StepResult{name, StepOutcome::Failed, std::move(message),
                      Elapsed(start), std::move(error)};
}

} // anonymous namespace

bool IsWellFormedServiceUrl(std::string_view url) {
    constexpr std::string_view kScheme = "https://";
    if (url.substr(0, kScheme.size()) != kScheme) {
        return false;
    }
    auto rest = url.substr(kScheme.size());
    auto host = rest.substr(0, rest.find('/'));
    if (host.empty()) {
        return false;
    }
    return std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '.' || c == ':';
    });
}

BuildAndDeployPipeline::BuildAndDeployPipeline(IBuilder& builder, IHoster& hoster,
                                               const DeploymentConfig& config)
    : builder_(builder), hoster_(hoster), config_(config) {}

DeploySpec BuildAndDeployPipeline::MakeDeploySpec() const {
    DeploySpec spec;
    spec.service = config_.app_name.Value();
    spec.image = config_.ImageTag();
    spec.identity = config_.ServiceAccountEmail();
    spec.region = config_.region;
    spec.env = config_.RuntimeEnv();
    spec.allow_unauthenticated = true;
    return spec;
}

PipelineResult BuildAndDeployPipeline::Run() {
    PipelineResult result;
    const auto tag = config_.ImageTag();

    // Build.
    {
        auto start = Clock::now();
        LogInfo("pipeline", "Building " + tag + " from " + config_.source_dir);
        auto built = builder_.Build(config_.source_dir, tag);
        if (built.IsErr()) {
            result.steps.push_back(Failed(steps::kBuild, built.Error(), start));
            return result;
        }
        result.steps.push_back(StepResult{steps::kBuild, StepOutcome::Created,
                                          "built " + tag, Elapsed(start),
                                          std::nullopt});
    }

    // Deploy, then read the address back.
    auto start = Clock::now();
    const auto spec = MakeDeploySpec();
    LogInfo("pipeline", "Deploying " + spec.service + " to " + spec.region);
    auto deployed = hoster_.Deploy(spec);
    if (deployed.IsErr()) {
        result.steps.push_back(Failed(steps::kDeploy, deployed.Error(), start));
        return result;
    }

    auto address = hoster_.GetAddress(spec.service, spec.region);
    if (address.IsErr()) {
        result.steps.push_back(Failed(steps::kDeploy, address.Error(), start));
        return result;
    }
    if (!IsWellFormedServiceUrl(address.Value())) {
        result.steps.push_back(Failed(
            steps::kDeploy,
            Error{"GetServiceAddress", spec.service,
                  "Service reported no usable address: '" + address.Value() + "'",
                  std::nullopt, ErrorCategory::Deploy, std::nullopt},
            start));
        return result;
    }

    result.service_url = address.Value();
    result.steps.push_back(StepResult{steps::kDeploy, StepOutcome::Created,
                                      "deployed " + spec.service, Elapsed(start),
                                      std::nullopt});
    return result;
}

} // namespace vsearch_deploy

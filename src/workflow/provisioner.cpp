#include <vsearch_deploy/workflow/provisioner.hpp>

#include <vsearch_deploy/cloud/iam_policy.hpp>
#include <vsearch_deploy/core/log.hpp>

#include <string>

namespace vsearch_deploy {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

StepResult Done(const char* name, StepOutcome outcome, std::string message,
                Clock::time_point start) {
    LogInfo("provision", std::string(name) + ": " + message);
    return StepResult{name, outcome, std::move(message), Elapsed(start), std::nullopt};
}

StepResult Failure(const char* name, Error error, Clock::time_point start) {
    LogError("provision", std::string(name) + " failed: " + error.ToString());
    auto message = error.message;
    return StepResult{name, StepOutcome::Failed, std::move(message),
                      Elapsed(start), std::move(error)};
}

// Record what a describe call found.
ProvisionedResource Observed(ResourceKind kind, std::string identifier,
                             ExistenceState state) {
    ProvisionedResource resource{kind, std::move(identifier), state};
    LogDebug("provision", std::string(ResourceKindName(resource.kind)) + " " +
                              resource.identifier + ": " +
                              ExistenceStateName(resource.state));
    return resource;
}

} // anonymous namespace

const char* StepOutcomeName(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Created:        return "created";
        case StepOutcome::AlreadyPresent: return "already-present";
        case StepOutcome::Failed:         return "failed";
    }
    return "failed";
}

IdempotentProvisioner::IdempotentProvisioner(CloudServices cloud,
                                             const DeploymentConfig& config,
                                             SleepFn sleep)
    : cloud_(cloud), config_(config), sleep_(std::move(sleep)) {}

std::vector<StepResult> IdempotentProvisioner::Run() {
    using StepFn = StepResult (IdempotentProvisioner::*)();
    static constexpr StepFn kSteps[] = {
        &IdempotentProvisioner::EnableServices,
        &IdempotentProvisioner::CreateServiceAccount,
        &IdempotentProvisioner::VerifyPropagation,
        &IdempotentProvisioner::GrantRole,
        &IdempotentProvisioner::CreateRepository,
    };

    std::vector<StepResult> results;
    for (auto step : kSteps) {
        results.push_back((this->*step)());
        if (results.back().Failed()) {
            break;
        }
    }
    return results;
}

// ---------------------------------------------------------------------------
// Step 1: platform APIs.
// ---------------------------------------------------------------------------
StepResult IdempotentProvisioner::EnableServices() {
    auto start = Clock::now();
    int enabled = 0;

    for (const auto& service : config_.services) {
        auto state = cloud_.catalog.IsEnabled(service);
        if (state.IsErr()) {
            return Failure(steps::kEnableServices, state.Error(), start);
        }
        auto resource = Observed(ResourceKind::Service, service,
                                 state.Value() ? ExistenceState::Present
                                               : ExistenceState::Absent);
        if (resource.state == ExistenceState::Present) {
            continue;
        }

        LogInfo("provision", "Enabling " + service);
        auto enable = cloud_.catalog.Enable(service);
        if (enable.IsErr()) {
            return Failure(steps::kEnableServices, enable.Error(), start);
        }
        ++enabled;
    }

    if (enabled == 0) {
        return Done(steps::kEnableServices, StepOutcome::AlreadyPresent,
                    "all " + std::to_string(config_.services.size()) +
                        " services already enabled",
                    start);
    }
    return Done(steps::kEnableServices, StepOutcome::Created,
                "enabled " + std::to_string(enabled) + " of " +
                    std::to_string(config_.services.size()) + " services",
                start);
}

// ---------------------------------------------------------------------------
// Step 2: service identity.
// ---------------------------------------------------------------------------
StepResult IdempotentProvisioner::CreateServiceAccount() {
    auto start = Clock::now();
    identity_created_ = false;
    const auto email = config_.ServiceAccountEmail();

    auto state = cloud_.identities.Describe(email);
    if (state.IsErr()) {
        return Failure(steps::kCreateServiceAccount, state.Error(), start);
    }
    if (Observed(ResourceKind::Identity, email, state.Value()).state ==
        ExistenceState::Present) {
        return Done(steps::kCreateServiceAccount, StepOutcome::AlreadyPresent,
                    email + " already exists", start);
    }

    auto created = cloud_.identities.Create(config_.service_account,
                                            kServiceAccountDisplayName);
    if (created.IsErr()) {
        return Failure(steps::kCreateServiceAccount, created.Error(), start);
    }
    identity_created_ = true;
    return Done(steps::kCreateServiceAccount, StepOutcome::Created,
                "created " + email, start);
}

// ---------------------------------------------------------------------------
// Step 3: wait until the identity is visible to the policy service.
// ---------------------------------------------------------------------------
StepResult IdempotentProvisioner::VerifyPropagation() {
    auto start = Clock::now();
    const auto email = config_.ServiceAccountEmail();

    if (identity_created_ && config_.propagation_settle.count() > 0) {
        LogInfo("provision", "Waiting for " + email + " to propagate...");
        sleep_(config_.propagation_settle);
    }

    auto outcome = RetryUntil(
        config_.propagation, sleep_,
        [&](int attempt) -> Result<bool, Error> {
            LogDebug("provision", "Checking " + email + " (attempt " +
                                      std::to_string(attempt) + " of " +
                                      std::to_string(config_.propagation.max_attempts) +
                                      ")");
            auto state = cloud_.identities.Describe(email);
            if (state.IsErr()) {
                return Result<bool, Error>::Err(state.Error());
            }
            return Result<bool, Error>::Ok(state.Value() == ExistenceState::Present);
        });

    if (outcome.IsErr()) {
        return Failure(steps::kVerifyPropagation, outcome.Error(), start);
    }
    if (!outcome.Value().satisfied) {
        return Failure(
            steps::kVerifyPropagation,
            Error{"VerifyPropagation", email,
                  "Service account not visible after " +
                      std::to_string(outcome.Value().attempts) + " attempts",
                  std::nullopt, ErrorCategory::PropagationTimeout,
                  "Run vsearch-deploy again; completed steps are skipped."},
            start);
    }

    const auto attempts = std::to_string(outcome.Value().attempts);
    if (identity_created_) {
        return Done(steps::kVerifyPropagation, StepOutcome::Created,
                    email + " visible after " + attempts + " attempt(s)", start);
    }
    return Done(steps::kVerifyPropagation, StepOutcome::AlreadyPresent,
                email + " visible", start);
}

// ---------------------------------------------------------------------------
// Step 4: role binding. Read the policy first; only grant if missing.
// ---------------------------------------------------------------------------
StepResult IdempotentProvisioner::GrantRole() {
    auto start = Clock::now();
    const auto member = config_.ServiceAccountMember();

    auto policy = cloud_.policies.GetPolicy(config_.project);
    if (policy.IsErr()) {
        return Failure(steps::kGrantRole, policy.Error(), start);
    }

    auto check = CheckBinding(policy.Value(), config_.role, member);
    if (check.path == PolicyCheckPath::TextFallback) {
        LogWarn("provision", "Role check used the text fallback");
    }
    auto binding = Observed(ResourceKind::RoleBinding, config_.role + " " + member,
                            check.present ? ExistenceState::Present
                                          : ExistenceState::Absent);
    if (binding.state == ExistenceState::Present) {
        return Done(steps::kGrantRole, StepOutcome::AlreadyPresent,
                    config_.role + " already granted", start);
    }

    LogInfo("provision", "Granting " + config_.role + " to " + member);
    auto granted = cloud_.policies.AddBinding(config_.project, member, config_.role);
    if (granted.IsErr()) {
        return Failure(steps::kGrantRole, granted.Error(), start);
    }
    return Done(steps::kGrantRole, StepOutcome::Created,
                "granted " + config_.role, start);
}

// ---------------------------------------------------------------------------
// Step 5: image registry.
// ---------------------------------------------------------------------------
StepResult IdempotentProvisioner::CreateRepository() {
    auto start = Clock::now();

    auto state = cloud_.artifacts.Describe(config_.repository, config_.region);
    if (state.IsErr()) {
        return Failure(steps::kCreateRepository, state.Error(), start);
    }
    if (Observed(ResourceKind::Registry, config_.repository + "@" + config_.region,
                 state.Value()).state == ExistenceState::Present) {
        return Done(steps::kCreateRepository, StepOutcome::AlreadyPresent,
                    config_.repository + " already exists", start);
    }

    auto created = cloud_.artifacts.Create(config_.repository, config_.region);
    if (created.IsErr()) {
        return Failure(steps::kCreateRepository, created.Error(), start);
    }
    return Done(steps::kCreateRepository, StepOutcome::Created,
                "created " + config_.repository + " in " + config_.region, start);
}

} // namespace vsearch_deploy

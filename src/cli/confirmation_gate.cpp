#include <vsearch_deploy/cli/confirmation_gate.hpp>

#include <vsearch_deploy/core/log.hpp>

#include <string>

namespace vsearch_deploy {

namespace {

std::string Join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

ConfirmationGate::ConfirmationGate(const DeploymentConfig& config,
                                   const IEnvironment& env,
                                   std::istream& in,
                                   std::ostream& out)
    : config_(config), env_(env), in_(in), out_(out) {}

std::vector<std::string> ConfirmationGate::PlannedActions() const {
    return {
        "Enable services: " + Join(config_.services, ", "),
        "Create service account: " + config_.ServiceAccountEmail(),
        "Wait until the service account is visible",
        "Grant " + config_.role + " to the service account",
        "Create Artifact Registry repository: " + config_.repository +
            " (" + config_.region + ")",
        "Build " + config_.ImageTag() + " and deploy " +
            config_.app_name.Value() + " to Cloud Run (" + config_.region + ")",
    };
}

Result<void, Error> ConfirmationGate::Confirm() {
    if (config_.skip_confirmation) {
        LogDebug("gate", "Confirmation skipped");
        return Result<void, Error>::Ok();
    }
    if (auto signal = DetectNonInteractiveContext(env_)) {
        LogInfo("gate", "Running non-interactively (" + *signal +
                            " is set); skipping confirmation");
        return Result<void, Error>::Ok();
    }

    out_ << "The following actions will be performed in project "
         << config_.project.Value() << ":\n";
    int n = 1;
    for (const auto& action : PlannedActions()) {
        out_ << "  " << n++ << ". " << action << "\n";
    }
    out_ << "Do you want to continue? (y/N) " << std::flush;
    prompt_issued_ = true;

    std::string answer;
    if (!std::getline(in_, answer)) {
        answer.clear();
    }
    out_ << "\n";

    answer = Trim(answer);
    if (answer == "y" || answer == "Y") {
        return Result<void, Error>::Ok();
    }

    LogInfo("gate", "Deployment cancelled by operator");
    return Result<void, Error>::Err(Error{
        "Confirm", "", "Deployment cancelled.", std::nullopt,
        ErrorCategory::ConfirmationDeclined, std::nullopt});
}

} // namespace vsearch_deploy

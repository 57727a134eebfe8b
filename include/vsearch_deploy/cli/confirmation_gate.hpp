#pragma once

#include <vsearch_deploy/config/app_config.hpp>
#include <vsearch_deploy/core/environment.hpp>
#include <vsearch_deploy/core/result.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// ConfirmationGate — asks the operator before anything is changed.
//
// No prompt is issued when skip_confirmation is set or when the environment
// marks the run as automated (CLOUD_SHELL, CI). Otherwise the planned actions
// are listed and a single 'y' or 'Y' is required; any other answer, including
// end of input, is a ConfirmationDeclined error.
// ---------------------------------------------------------------------------
class ConfirmationGate {
public:
    ConfirmationGate(const DeploymentConfig& config,
                     const IEnvironment& env,
                     std::istream& in = std::cin,
                     std::ostream& out = std::cerr);

    [[nodiscard]] Result<void, Error> Confirm();

    // True once the question has been put to the operator.
    [[nodiscard]] bool PromptIssued() const noexcept { return prompt_issued_; }

    // One line per planned action, in execution order.
    [[nodiscard]] std::vector<std::string> PlannedActions() const;

private:
    const DeploymentConfig& config_;
    const IEnvironment& env_;
    std::istream& in_;
    std::ostream& out_;
    bool prompt_issued_ = false;
};

} // namespace vsearch_deploy

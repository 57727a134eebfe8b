#pragma once

#include <vsearch_deploy/cli/output_formatter.hpp>
#include <vsearch_deploy/workflow/deploy_workflow.hpp>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// ResultReporter — final word of a run. Prints the step table and either the
// service address or the failing step, and decides the process exit code.
// Never rolls anything back.
// ---------------------------------------------------------------------------
class ResultReporter {
public:
    explicit ResultReporter(const OutputFormatter& fmt) : fmt_(fmt) {}

    // Report a completed workflow. Returns the exit code.
    [[nodiscard]] int Report(const DeployResult& result) const;

    // Report a failure before the workflow started (config, preflight,
    // confirmation). Returns the exit code.
    [[nodiscard]] int ReportError(const Error& error) const;

private:
    void PrintSteps(const DeployResult& result) const;

    const OutputFormatter& fmt_;
};

} // namespace vsearch_deploy

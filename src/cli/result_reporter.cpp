#include <vsearch_deploy/cli/result_reporter.hpp>

#include <vsearch_deploy/core/log.hpp>

#include <nlohmann/json.hpp>

namespace vsearch_deploy {

namespace {

std::string FormatDuration(std::chrono::milliseconds d) {
    if (d.count() < 1000) {
        return std::to_string(d.count()) + "ms";
    }
    const auto tenths = d.count() / 100;
    return std::to_string(tenths / 10) + "." + std::to_string(tenths % 10) + "s";
}

nlohmann::json ToJson(const DeployResult& result) {
    nlohmann::json j;
    j["success"] = result.success;
    j["summary"] = result.summary;
    j["duration_ms"] = result.total_duration.count();

    auto steps = nlohmann::json::array();
    for (const auto& s : result.steps) {
        steps.push_back({{"step", s.step_name},
                         {"outcome", StepOutcomeName(s.outcome)},
                         {"message", s.message},
                         {"duration_ms", s.duration.count()}});
    }
    j["steps"] = std::move(steps);

    if (result.service_url) {
        j["service_url"] = *result.service_url;
    }
    if (result.failure) {
        j["error"] = nlohmann::json::parse(result.failure->ToJson()).at("error");
    }
    return j;
}

} // anonymous namespace

void ResultReporter::PrintSteps(const DeployResult& result) const {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(result.steps.size());
    for (const auto& s : result.steps) {
        rows.push_back({s.step_name, StepOutcomeName(s.outcome), s.message,
                        FormatDuration(s.duration)});
    }
    fmt_.PrintTable({"Step", "Outcome", "Details", "Time"}, rows);
}

int ResultReporter::Report(const DeployResult& result) const {
    if (fmt_.IsJsonMode()) {
        fmt_.PrintJson(ToJson(result).dump());
        if (result.success) return 0;
        return result.failure ? result.failure->ExitCode() : 99;
    }

    PrintSteps(result);

    if (result.success && result.service_url) {
        LogInfo("report", "Deployment complete");
        fmt_.PrintSuccess("Your application is available at: " + *result.service_url);
        return 0;
    }

    const auto* failed = result.FailedStep();
    if (failed != nullptr && failed->error) {
        LogError("report", "Step '" + failed->step_name + "' failed");
        fmt_.PrintError(*failed->error);
        return failed->error->ExitCode();
    }

    // A successful run always carries an address; anything else is a bug.
    Error internal{"Report", "", "Run ended without an address or a failed step",
                   std::nullopt, ErrorCategory::Internal, std::nullopt};
    fmt_.PrintError(internal);
    return internal.ExitCode();
}

int ResultReporter::ReportError(const Error& error) const {
    if (error.IsCancellation()) {
        fmt_.PrintNotice(error.message);
        return error.ExitCode();
    }
    fmt_.PrintError(error);
    return error.ExitCode();
}

} // namespace vsearch_deploy

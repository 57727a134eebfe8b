#include <vsearch_deploy/cli/deploy_command.hpp>

#include <vsearch_deploy/cli/confirmation_gate.hpp>
#include <vsearch_deploy/cli/output_formatter.hpp>
#include <vsearch_deploy/cli/result_reporter.hpp>
#include <vsearch_deploy/cloud/gcloud_provider.hpp>
#include <vsearch_deploy/core/log.hpp>
#include <vsearch_deploy/workflow/deploy_workflow.hpp>
#include <vsearch_deploy/workflow/preflight.hpp>

namespace vsearch_deploy {

int RunDeploy(const CliArgs& args, const DeployContext& ctx) {
    // Flags > environment > YAML file > defaults.
    auto merged = MergeLayers(args.layer, LoadFromEnvironment(ctx.env));
    if (args.config_path) {
        auto file_layer = LoadFromYaml(*args.config_path);
        if (file_layer.IsErr()) {
            OutputFormatter fmt(merged.json_output.value_or(false), ctx.color,
                                ctx.out, ctx.err);
            return ResultReporter(fmt).ReportError(file_layer.Error());
        }
        merged = MergeLayers(merged, file_layer.Value());
    }

    auto resolved = ResolveConfig(merged, ctx.env);
    if (resolved.IsErr()) {
        OutputFormatter fmt(merged.json_output.value_or(false), ctx.color,
                            ctx.out, ctx.err);
        return ResultReporter(fmt).ReportError(resolved.Error());
    }

    const auto& output = resolved.Value().output;
    if (ctx.setup_logging) {
        ctx.setup_logging(output);
    }
    OutputFormatter fmt(output.json_output, ctx.color, ctx.out, ctx.err);
    ResultReporter reporter(fmt);

    const auto& config = resolved.Value().deployment;
    LogInfo("config", "Project " + config.project.Value() + ", region " +
                          config.region + ", application " +
                          config.app_name.Value());
    if (resolved.Value().non_interactive_signal) {
        LogInfo("config", *resolved.Value().non_interactive_signal +
                              " is set; running without confirmation");
    }

    PreflightChecker preflight(ctx.runner, {GcloudRequirement(ctx.running_as_root)});
    auto tools = preflight.Run();
    if (tools.IsErr()) {
        return reporter.ReportError(tools.Error());
    }

    ConfirmationGate gate(config, ctx.env, ctx.in, ctx.err);
    auto confirmed = gate.Confirm();
    if (confirmed.IsErr()) {
        return reporter.ReportError(confirmed.Error());
    }

    GcloudProvider provider(ctx.runner, config.project);
    DeployWorkflow workflow(provider.Services(), config, ctx.sleep);
    return reporter.Report(workflow.Execute());
}

} // namespace vsearch_deploy

#include <vsearch_deploy/cli/deploy_command.hpp>
#include <vsearch_deploy/cli/output_formatter.hpp>
#include <vsearch_deploy/cli/result_reporter.hpp>
#include <vsearch_deploy/config/config_loader.hpp>
#include <vsearch_deploy/core/log.hpp>
#include <vsearch_deploy/core/process.hpp>
#include <vsearch_deploy/core/terminal.hpp>
#include <vsearch_deploy/core/version.hpp>

#include <iostream>
#include <memory>
#include <string>

#include <unistd.h>

namespace {

using namespace vsearch_deploy;

constexpr int kExitSuccess = 0;

void InitLogging(const OutputOptions& options, bool use_color) {
    auto level = LogLevel::Info;
    if (options.verbose) {
        level = LogLevel::Debug;
    } else if (options.quiet) {
        level = LogLevel::Warn;
    }

    std::unique_ptr<ILogSink> console;
    if (options.json_output) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        console = std::make_unique<ColorConsoleSink>(use_color);
    }

    if (!options.log_file) {
        InitGlobalLogger(std::move(console), level);
        return;
    }

    auto file = std::make_unique<FileSink>(*options.log_file);
    const bool opened = file->IsOpen();
    InitGlobalLogger(std::make_unique<TeeSink>(std::move(console), std::move(file)),
                     level);
    if (!opened) {
        LogWarn("config", "Cannot open log file " + *options.log_file +
                              "; logging to the console only");
    }
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace vsearch_deploy;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        OutputFormatter fmt(false, !NoColorEnvSet() && IsStderrTty());
        return ResultReporter(fmt).ReportError(cli.Error());
    }
    const auto& args = cli.Value();

    if (args.show_help) {
        std::cout << CliUsage();
        return kExitSuccess;
    }
    if (args.show_version) {
        std::cout << "vsearch-deploy " << kVersion << "\n";
        return kExitSuccess;
    }

    const bool no_color = args.force_no_color || NoColorEnvSet();
    const bool log_color = !no_color && (args.force_color || IsStderrTty());

    ProcessEnvironment env;
    ProcessCommandRunner runner;
    DeployContext ctx{env, runner, std::cin, std::cout, std::cerr};
    ctx.color = !no_color && (args.force_color || IsStdoutTty());
    ctx.running_as_root = geteuid() == 0;
    ctx.setup_logging = [log_color](const OutputOptions& options) {
        InitLogging(options, log_color);
    };
    return RunDeploy(args, ctx);
}

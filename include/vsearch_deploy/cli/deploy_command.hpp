#pragma once

#include <vsearch_deploy/config/app_config.hpp>
#include <vsearch_deploy/config/config_loader.hpp>
#include <vsearch_deploy/core/environment.hpp>
#include <vsearch_deploy/core/process.hpp>
#include <vsearch_deploy/core/retry.hpp>

#include <functional>
#include <iostream>

namespace vsearch_deploy {

// Installs the process-wide logger once the output options are validated.
using LoggingSetupFn = std::function<void(const OutputOptions& options)>;

// ---------------------------------------------------------------------------
// DeployContext — everything RunDeploy talks to besides the parsed flags.
//
// Production code passes the process environment, a ProcessCommandRunner and
// the standard streams; tests pass fakes and string streams.
// ---------------------------------------------------------------------------
struct DeployContext {
    const IEnvironment& env;
    ICommandRunner& runner;
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
    bool color = false;
    bool running_as_root = false;
    LoggingSetupFn setup_logging;
    SleepFn sleep = ThreadSleep();
};

// ---------------------------------------------------------------------------
// RunDeploy — the whole deployment run after flag parsing.
//
// Order: config layers and validation, tool preflight, confirmation, then the
// provisioning and deploy workflow. No command is run and no tool is looked up
// before the configuration is valid, and nothing reaches gcloud before the
// operator confirmed.
//
// Returns the process exit code.
// ---------------------------------------------------------------------------
int RunDeploy(const CliArgs& args, const DeployContext& ctx);

} // namespace vsearch_deploy

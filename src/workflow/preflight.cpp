#include <vsearch_deploy/workflow/preflight.hpp>

#include <vsearch_deploy/core/log.hpp>

namespace vsearch_deploy {

namespace {

std::vector<std::string> Elevated(bool running_as_root,
                                  std::vector<std::string> argv) {
    if (!running_as_root) {
        argv.insert(argv.begin(), "sudo");
    }
    return argv;
}

} // anonymous namespace

ToolRequirement GcloudRequirement(bool running_as_root) {
    ToolRequirement req;
    req.name = "gcloud";
    req.installers.push_back(InstallerCommand{
        "apt-get",
        {Elevated(running_as_root, {"apt-get", "update"}),
         Elevated(running_as_root, {"apt-get", "install", "-y", "google-cloud-cli"})}});
    req.installers.push_back(InstallerCommand{
        "yum",
        {Elevated(running_as_root, {"yum", "install", "-y", "google-cloud-cli"})}});
    req.installers.push_back(InstallerCommand{
        "brew",
        {{"brew", "install", "--cask", "google-cloud-sdk"}}});
    return req;
}

PreflightChecker::PreflightChecker(ICommandRunner& runner,
                                   std::vector<ToolRequirement> tools)
    : runner_(runner), tools_(std::move(tools)) {}

Result<void, Error> PreflightChecker::Run() {
    for (const auto& tool : tools_) {
        auto ensured = Ensure(tool);
        if (ensured.IsErr()) {
            return ensured;
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> PreflightChecker::Ensure(const ToolRequirement& tool) {
    if (runner_.IsAvailable(tool.name)) {
        LogDebug("preflight", tool.name + " found");
        return Result<void, Error>::Ok();
    }

    LogInfo("preflight", tool.name + " is not installed. Attempting to install...");
    for (const auto& installer : tool.installers) {
        if (!runner_.IsAvailable(installer.manager)) {
            continue;
        }
        if (TryInstaller(installer) && runner_.IsAvailable(tool.name)) {
            LogInfo("preflight", tool.name + " installed with " + installer.manager);
            return Result<void, Error>::Ok();
        }
        LogWarn("preflight", "Installing " + tool.name + " with " +
                                 installer.manager + " did not succeed");
    }

    return Result<void, Error>::Err(Error{
        "Preflight", tool.name,
        "Could not install " + tool.name +
            ". Please install it manually and try again.",
        std::nullopt, ErrorCategory::ToolMissing,
        "Make sure '" + tool.name + "' is on PATH, then re-run."});
}

bool PreflightChecker::TryInstaller(const InstallerCommand& installer) {
    for (const auto& argv : installer.commands) {
        auto result = runner_.Run(argv);
        if (result.IsErr()) {
            LogWarn("preflight", result.Error().ToString());
            return false;
        }
        if (!result.Value().Succeeded()) {
            LogDebug("preflight", FormatCommand(argv) + " exited with " +
                                      std::to_string(result.Value().exit_code));
            return false;
        }
    }
    return true;
}

} // namespace vsearch_deploy

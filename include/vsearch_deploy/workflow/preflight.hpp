#pragma once

#include <vsearch_deploy/core/process.hpp>
#include <vsearch_deploy/core/result.hpp>

#include <string>
#include <vector>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// InstallerCommand — one way of installing a missing tool. `manager` must be
// on PATH for the installer to be tried; `commands` run in order and all of
// them must exit 0.
// ---------------------------------------------------------------------------
struct InstallerCommand {
    std::string manager;
    std::vector<std::vector<std::string>> commands;
};

struct ToolRequirement {
    std::string name;
    std::vector<InstallerCommand> installers;
};

// The gcloud CLI with the apt-get, yum and brew installers. Package-manager
// commands go through sudo unless the process already runs as root.
ToolRequirement GcloudRequirement(bool running_as_root);

// ---------------------------------------------------------------------------
// PreflightChecker — makes sure every required tool is available before the
// first remote call.
//
// A missing tool is installed with the first installer whose package manager
// is present; the tool only counts as installed if it is found afterwards.
// ---------------------------------------------------------------------------
class PreflightChecker {
public:
    PreflightChecker(ICommandRunner& runner, std::vector<ToolRequirement> tools);

    [[nodiscard]] Result<void, Error> Run();

private:
    Result<void, Error> Ensure(const ToolRequirement& tool);
    bool TryInstaller(const InstallerCommand& installer);

    ICommandRunner& runner_;
    std::vector<ToolRequirement> tools_;
};

} // namespace vsearch_deploy

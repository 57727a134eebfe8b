#pragma once

#include <vsearch_deploy/cloud/i_cloud_provider.hpp>
#include <vsearch_deploy/core/process.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// GcloudProvider — realises every provider collaborator by invoking the
// gcloud CLI through an ICommandRunner.
//
// Features:
//   - every call is scoped with --project; nothing depends on the CLI's
//     active configuration
//   - describe calls map NOT_FOUND to ExistenceState::Absent; any other
//     failure is an Err carrying the tool's stderr
//   - mutating calls run with --quiet so the CLI never prompts
//
// Takes ownership of nothing — the runner must outlive this object.
// ---------------------------------------------------------------------------
class GcloudProvider : public IServiceCatalog,
                       public IIdentityStore,
                       public IPolicyStore,
                       public IArtifactStore,
                       public IBuilder,
                       public IHoster {
public:
    GcloudProvider(ICommandRunner& runner, const ProjectId& project,
                   std::string gcloud = "gcloud");

    GcloudProvider(const GcloudProvider&) = delete;
    GcloudProvider& operator=(const GcloudProvider&) = delete;

    [[nodiscard]] CloudServices Services();

    // -- IServiceCatalog -----------------------------------------------------

    [[nodiscard]] Result<bool, Error> IsEnabled(std::string_view service) override;
    [[nodiscard]] Result<void, Error> Enable(std::string_view service) override;

    // -- IIdentityStore ------------------------------------------------------

    [[nodiscard]] Result<ExistenceState, Error> Describe(
        std::string_view email) override;
    [[nodiscard]] Result<void, Error> Create(
        const ServiceAccountName& name, std::string_view display_name) override;

    // -- IPolicyStore --------------------------------------------------------

    [[nodiscard]] Result<PolicyDocument, Error> GetPolicy(
        const ProjectId& project) override;
    [[nodiscard]] Result<void, Error> AddBinding(
        const ProjectId& project, std::string_view member,
        std::string_view role) override;

    // -- IArtifactStore ------------------------------------------------------

    [[nodiscard]] Result<ExistenceState, Error> Describe(
        std::string_view repository, std::string_view location) override;
    [[nodiscard]] Result<void, Error> Create(
        std::string_view repository, std::string_view location) override;

    // -- IBuilder ------------------------------------------------------------

    [[nodiscard]] Result<void, Error> Build(
        std::string_view source_dir, std::string_view tag) override;

    // -- IHoster -------------------------------------------------------------

    [[nodiscard]] Result<void, Error> Deploy(const DeploySpec& spec) override;
    [[nodiscard]] Result<std::string, Error> GetAddress(
        std::string_view service, std::string_view region) override;

private:
    std::vector<std::string> Command(std::initializer_list<std::string_view> args) const;

    Result<CommandOutput, Error> Execute(const std::vector<std::string>& argv);

    // Runs a describe command and maps the outcome onto ExistenceState.
    Result<ExistenceState, Error> DescribeResource(
        const std::string& operation, const std::string& target,
        const std::vector<std::string>& argv);

    // Runs a mutating command; a non-zero exit becomes an Err of `category`.
    Result<void, Error> Mutate(const std::string& operation,
                               const std::string& target,
                               ErrorCategory category,
                               const std::vector<std::string>& argv);

    ICommandRunner& runner_;
    ProjectId project_;
    std::string gcloud_;
};

// True if gcloud's stderr says the described resource does not exist: the
// NOT_FOUND status or the "does not exist" wording. A plain "not found", as
// in "Project [x] not found", is not enough.
bool IsNotFoundDiagnostic(std::string_view diagnostic);

} // namespace vsearch_deploy

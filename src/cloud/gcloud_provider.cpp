#include <vsearch_deploy/cloud/gcloud_provider.hpp>

#include <vsearch_deploy/core/log.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace vsearch_deploy {

namespace {

std::string TrimWhitespace(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

// Render the runtime variables for --set-env-vars. gcloud splits the list on
// ','; when a value contains one, switch to its "^|^" custom delimiter form.
std::string FormatEnvVars(
    const std::vector<std::pair<std::string, std::string>>& env) {
    bool needs_custom = false;
    for (const auto& [key, value] : env) {
        if (value.find(',') != std::string::npos) {
            needs_custom = true;
        }
    }
    const char* sep = needs_custom ? "|" : ",";

    std::string out = needs_custom ? "^|^" : "";
    for (size_t i = 0; i < env.size(); ++i) {
        if (i > 0) out += sep;
        out += env[i].first + "=" + env[i].second;
    }
    return out;
}

} // anonymous namespace

bool IsNotFoundDiagnostic(std::string_view diagnostic) {
    return diagnostic.find("NOT_FOUND") != std::string_view::npos ||
           diagnostic.find("does not exist") != std::string_view::npos;
}

GcloudProvider::GcloudProvider(ICommandRunner& runner, const ProjectId& project,
                               std::string gcloud)
    : runner_(runner), project_(project), gcloud_(std::move(gcloud)) {}

CloudServices GcloudProvider::Services() {
    return CloudServices{*this, *this, *this, *this, *this, *this};
}

std::vector<std::string> GcloudProvider::Command(
    std::initializer_list<std::string_view> args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 3);
    argv.push_back(gcloud_);
    for (auto a : args) {
        argv.emplace_back(a);
    }
    argv.push_back("--project");
    argv.push_back(project_.Value());
    return argv;
}

Result<CommandOutput, Error> GcloudProvider::Execute(
    const std::vector<std::string>& argv) {
    LogDebug("gcloud", FormatCommand(argv));
    return runner_.Run(argv);
}

Result<ExistenceState, Error> GcloudProvider::DescribeResource(
    const std::string& operation, const std::string& target,
    const std::vector<std::string>& argv) {
    auto result = Execute(argv);
    if (result.IsErr()) {
        return Result<ExistenceState, Error>::Err(std::move(result).Error());
    }
    const auto& output = result.Value();
    if (output.Succeeded()) {
        return Result<ExistenceState, Error>::Ok(ExistenceState::Present);
    }
    if (IsNotFoundDiagnostic(output.err)) {
        return Result<ExistenceState, Error>::Ok(ExistenceState::Absent);
    }
    return Result<ExistenceState, Error>::Err(Error::FromCommandFailure(
        operation, target, ErrorCategory::ResourceCreation,
        output.exit_code, output.err));
}

Result<void, Error> GcloudProvider::Mutate(const std::string& operation,
                                           const std::string& target,
                                           ErrorCategory category,
                                           const std::vector<std::string>& argv) {
    auto result = Execute(argv);
    if (result.IsErr()) {
        return Result<void, Error>::Err(std::move(result).Error());
    }
    const auto& output = result.Value();
    if (!output.Succeeded()) {
        return Result<void, Error>::Err(Error::FromCommandFailure(
            operation, target, category, output.exit_code, output.err));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// IServiceCatalog
// ---------------------------------------------------------------------------

Result<bool, Error> GcloudProvider::IsEnabled(std::string_view service) {
    const std::string filter = "name:" + std::string(service);
    auto result = Execute(Command({"services", "list", "--enabled",
                                   "--filter", filter,
                                   "--format", "value(config.name)"}));
    if (result.IsErr()) {
        return Result<bool, Error>::Err(std::move(result).Error());
    }
    const auto& output = result.Value();
    if (!output.Succeeded()) {
        return Result<bool, Error>::Err(Error::FromCommandFailure(
            "IsServiceEnabled", std::string(service),
            ErrorCategory::ResourceCreation, output.exit_code, output.err));
    }

    // The filter is a substring match; only an exact name (or a fully
    // qualified ".../services/<name>") counts.
    std::istringstream lines(output.out);
    std::string line;
    while (std::getline(lines, line)) {
        auto name = TrimWhitespace(line);
        if (name == service) {
            return Result<bool, Error>::Ok(true);
        }
        if (name.size() > service.size() &&
            name.compare(name.size() - service.size(), service.size(), service) == 0 &&
            name[name.size() - service.size() - 1] == '/') {
            return Result<bool, Error>::Ok(true);
        }
    }
    return Result<bool, Error>::Ok(false);
}

Result<void, Error> GcloudProvider::Enable(std::string_view service) {
    return Mutate("EnableService", std::string(service),
                  ErrorCategory::ResourceCreation,
                  Command({"services", "enable", service}));
}

// ---------------------------------------------------------------------------
// IIdentityStore
// ---------------------------------------------------------------------------

Result<ExistenceState, Error> GcloudProvider::Describe(std::string_view email) {
    return DescribeResource("DescribeServiceAccount", std::string(email),
                            Command({"iam", "service-accounts", "describe",
                                     email, "--format", "json"}));
}

Result<void, Error> GcloudProvider::Create(const ServiceAccountName& name,
                                           std::string_view display_name) {
    return Mutate("CreateServiceAccount", name.Value(),
                  ErrorCategory::ResourceCreation,
                  Command({"iam", "service-accounts", "create", name.Value(),
                           "--display-name", display_name}));
}

// ---------------------------------------------------------------------------
// IPolicyStore
// ---------------------------------------------------------------------------

Result<PolicyDocument, Error> GcloudProvider::GetPolicy(const ProjectId& project) {
    std::vector<std::string> argv{gcloud_, "projects", "get-iam-policy",
                                  project.Value(), "--format", "json"};
    auto result = Execute(argv);
    if (result.IsErr()) {
        return Result<PolicyDocument, Error>::Err(std::move(result).Error());
    }
    const auto& output = result.Value();
    if (!output.Succeeded()) {
        return Result<PolicyDocument, Error>::Err(Error::FromCommandFailure(
            "GetIamPolicy", project.Value(), ErrorCategory::PermissionGrant,
            output.exit_code, output.err));
    }

    PolicyDocument doc;
    doc.raw = output.out;
    doc.format = nlohmann::json::accept(output.out) ? PolicyFormat::Json
                                                    : PolicyFormat::Text;
    if (doc.format == PolicyFormat::Text) {
        LogWarn("gcloud", "get-iam-policy did not return JSON; keeping the raw text");
    }
    return Result<PolicyDocument, Error>::Ok(std::move(doc));
}

Result<void, Error> GcloudProvider::AddBinding(const ProjectId& project,
                                               std::string_view member,
                                               std::string_view role) {
    std::vector<std::string> argv{gcloud_, "projects", "add-iam-policy-binding",
                                  project.Value(),
                                  "--member", std::string(member),
                                  "--role", std::string(role),
                                  "--condition", "None", "--quiet"};
    return Mutate("AddIamPolicyBinding", std::string(member),
                  ErrorCategory::PermissionGrant, argv);
}

// ---------------------------------------------------------------------------
// IArtifactStore
// ---------------------------------------------------------------------------

Result<ExistenceState, Error> GcloudProvider::Describe(std::string_view repository,
                                                       std::string_view location) {
    return DescribeResource("DescribeRepository", std::string(repository),
                            Command({"artifacts", "repositories", "describe",
                                     repository, "--location", location}));
}

Result<void, Error> GcloudProvider::Create(std::string_view repository,
                                           std::string_view location) {
    return Mutate("CreateRepository", std::string(repository),
                  ErrorCategory::ResourceCreation,
                  Command({"artifacts", "repositories", "create", repository,
                           "--repository-format", "docker",
                           "--location", location}));
}

// ---------------------------------------------------------------------------
// IBuilder
// ---------------------------------------------------------------------------

Result<void, Error> GcloudProvider::Build(std::string_view source_dir,
                                          std::string_view tag) {
    return Mutate("BuildImage", std::string(tag), ErrorCategory::Build,
                  Command({"builds", "submit", source_dir,
                           "--tag", tag, "--quiet"}));
}

// ---------------------------------------------------------------------------
// IHoster
// ---------------------------------------------------------------------------

Result<void, Error> GcloudProvider::Deploy(const DeploySpec& spec) {
    std::vector<std::string> argv{gcloud_, "run", "deploy", spec.service,
                                  "--image", spec.image,
                                  "--platform", "managed",
                                  "--region", spec.region};
    argv.push_back(spec.allow_unauthenticated ? "--allow-unauthenticated"
                                              : "--no-allow-unauthenticated");
    argv.push_back("--service-account");
    argv.push_back(spec.identity);
    if (!spec.env.empty()) {
        argv.push_back("--set-env-vars");
        argv.push_back(FormatEnvVars(spec.env));
    }
    argv.push_back("--project");
    argv.push_back(project_.Value());
    argv.push_back("--quiet");
    return Mutate("DeployService", spec.service, ErrorCategory::Deploy, argv);
}

Result<std::string, Error> GcloudProvider::GetAddress(std::string_view service,
                                                      std::string_view region) {
    auto result = Execute(Command({"run", "services", "describe", service,
                                   "--region", region,
                                   "--format", "value(status.url)"}));
    if (result.IsErr()) {
        return Result<std::string, Error>::Err(std::move(result).Error());
    }
    const auto& output = result.Value();
    if (!output.Succeeded()) {
        return Result<std::string, Error>::Err(Error::FromCommandFailure(
            "DescribeService", std::string(service), ErrorCategory::Deploy,
            output.exit_code, output.err));
    }
    return Result<std::string, Error>::Ok(TrimWhitespace(output.out));
}

} // namespace vsearch_deploy

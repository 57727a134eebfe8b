#include <vsearch_deploy/config/config_loader.hpp>

#include <vsearch_deploy/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <exception>
#include <sstream>

namespace vsearch_deploy {

namespace {

Error MakeConfigError(ErrorCategory category, const std::string& message,
                      std::optional<std::string> hint = std::nullopt) {
    return Error{"ConfigLoader", "", message, std::nullopt, category,
                 std::move(hint)};
}

Error MissingField(const std::string& env_var, const std::string& flag) {
    return MakeConfigError(
        ErrorCategory::MissingConfig,
        env_var + " is not set",
        "Set it with: export " + env_var + "=<value>, or pass " + flag);
}

void DefineArguments(argparse::ArgumentParser& program) {
    program.add_argument("--skip-confirmation")
        .help("Do not ask for confirmation before provisioning")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--project")
        .help("Cloud project id (env: PROJECT_ID)");
    program.add_argument("--datastore")
        .help("Search data store id (env: DATA_STORE_ID)");
    program.add_argument("--region")
        .help("Region for the registry and the service (env: REGION)");
    program.add_argument("--location")
        .help("Search location passed to the application (env: LOCATION)");
    program.add_argument("--app-name")
        .help("Name of the hosted service (env: APP_NAME)");
    program.add_argument("--service-account")
        .help("Service account name, default <app-name>-sa (env: SERVICE_ACCOUNT_NAME)");
    program.add_argument("--repository")
        .help("Container registry repository (env: REPOSITORY_NAME)");
    program.add_argument("--source-dir")
        .help("Directory holding the application sources (env: SOURCE_DIR)");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Also append log lines to this file");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-h", "--help")
        .help("Show this help and exit")
        .default_value(false)
        .implicit_value(true);
}

template <typename T>
std::optional<T> Pick(const std::optional<T>& higher, const std::optional<T>& lower) {
    return higher.has_value() ? higher : lower;
}

std::optional<std::string> ReadString(const YAML::Node& node, const char* key) {
    if (!node[key]) return std::nullopt;
    return node[key].as<std::string>();
}

std::optional<int> ReadInt(const YAML::Node& node, const char* key) {
    if (!node[key]) return std::nullopt;
    return node[key].as<int>();
}

std::optional<bool> ReadBool(const YAML::Node& node, const char* key) {
    if (!node[key]) return std::nullopt;
    return node[key].as<bool>();
}

} // anonymous namespace

std::vector<std::string> DefaultServices() {
    return {
        "run.googleapis.com",
        "artifactregistry.googleapis.com",
        "discoveryengine.googleapis.com",
    };
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliArgs, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("vsearch-deploy", kVersion,
                                     argparse::default_arguments::none);
    DefineArguments(program);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliArgs, Error>::Err(MakeConfigError(
            ErrorCategory::Usage, e.what(),
            std::string("Run 'vsearch-deploy --help' for the list of flags")));
    }

    CliArgs args;
    auto& layer = args.layer;

    if (program.get<bool>("--skip-confirmation")) {
        layer.skip_confirmation = true;
    }
    layer.project = program.present("--project");
    layer.datastore = program.present("--datastore");
    layer.region = program.present("--region");
    layer.location = program.present("--location");
    layer.app_name = program.present("--app-name");
    layer.service_account = program.present("--service-account");
    layer.repository = program.present("--repository");
    layer.source_dir = program.present("--source-dir");
    layer.log_file = program.present("--log-file");

    if (program.get<bool>("--json")) {
        layer.json_output = true;
    }
    if (program.get<bool>("--verbose")) {
        layer.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        layer.quiet = true;
    }

    args.config_path = program.present("--config");
    args.show_help = program.get<bool>("--help");
    args.show_version = program.get<bool>("--version");
    args.force_color = program.get<bool>("--color");
    args.force_no_color = program.get<bool>("--no-color");

    return Result<CliArgs, Error>::Ok(std::move(args));
}

std::string CliUsage() {
    argparse::ArgumentParser program("vsearch-deploy", kVersion,
                                     argparse::default_arguments::none);
    program.add_description(
        "Provision and deploy the search application to a managed container "
        "host. Safe to re-run: existing resources are detected and kept.");
    DefineArguments(program);

    std::ostringstream oss;
    oss << program;
    return oss.str();
}

// ---------------------------------------------------------------------------
// LoadFromEnvironment
// ---------------------------------------------------------------------------
ConfigLayer LoadFromEnvironment(const IEnvironment& env) {
    ConfigLayer layer;
    layer.project = GetNonEmpty(env, "PROJECT_ID");
    layer.datastore = GetNonEmpty(env, "DATA_STORE_ID");
    layer.region = GetNonEmpty(env, "REGION");
    layer.location = GetNonEmpty(env, "LOCATION");
    layer.app_name = GetNonEmpty(env, "APP_NAME");
    layer.service_account = GetNonEmpty(env, "SERVICE_ACCOUNT_NAME");
    layer.repository = GetNonEmpty(env, "REPOSITORY_NAME");
    layer.source_dir = GetNonEmpty(env, "SOURCE_DIR");

    if (auto skip = GetNonEmpty(env, "SKIP_CONFIRMATION")) {
        layer.skip_confirmation = IsTruthy(*skip);
    }
    return layer;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ConfigLayer, Error> LoadFromYaml(std::string_view file_path) {
    ConfigLayer layer;
    try {
        auto root = YAML::LoadFile(std::string(file_path));

        layer.project = ReadString(root, "project");
        layer.datastore = ReadString(root, "datastore");
        layer.region = ReadString(root, "region");
        layer.location = ReadString(root, "location");
        layer.app_name = ReadString(root, "app_name");
        layer.service_account = ReadString(root, "service_account");
        layer.repository = ReadString(root, "repository");
        layer.source_dir = ReadString(root, "source_dir");
        layer.skip_confirmation = ReadBool(root, "skip_confirmation");
        layer.role = ReadString(root, "role");

        if (root["services"]) {
            if (!root["services"].IsSequence()) {
                return Result<ConfigLayer, Error>::Err(MakeConfigError(
                    ErrorCategory::InvalidConfig,
                    "'services' must be a list of service names"));
            }
            std::vector<std::string> services;
            for (const auto& svc : root["services"]) {
                services.push_back(svc.as<std::string>());
            }
            layer.services = std::move(services);
        }

        if (const auto& prop = root["propagation"]) {
            layer.propagation_attempts = ReadInt(prop, "max_attempts");
            layer.propagation_delay_seconds = ReadInt(prop, "delay_seconds");
            layer.propagation_settle_seconds = ReadInt(prop, "settle_seconds");
        }

        layer.log_file = ReadString(root, "log_file");
        layer.json_output = ReadBool(root, "json_output");
        layer.verbose = ReadBool(root, "verbose");
        layer.quiet = ReadBool(root, "quiet");
    } catch (const YAML::Exception& e) {
        return Result<ConfigLayer, Error>::Err(MakeConfigError(
            ErrorCategory::InvalidConfig,
            "Failed to parse YAML file " + std::string(file_path) + ": " + e.what()));
    }
    return Result<ConfigLayer, Error>::Ok(std::move(layer));
}

// ---------------------------------------------------------------------------
// MergeLayers
// ---------------------------------------------------------------------------
ConfigLayer MergeLayers(const ConfigLayer& higher, const ConfigLayer& lower) {
    ConfigLayer merged;
    merged.project = Pick(higher.project, lower.project);
    merged.datastore = Pick(higher.datastore, lower.datastore);
    merged.region = Pick(higher.region, lower.region);
    merged.location = Pick(higher.location, lower.location);
    merged.app_name = Pick(higher.app_name, lower.app_name);
    merged.service_account = Pick(higher.service_account, lower.service_account);
    merged.repository = Pick(higher.repository, lower.repository);
    merged.source_dir = Pick(higher.source_dir, lower.source_dir);
    merged.skip_confirmation = Pick(higher.skip_confirmation, lower.skip_confirmation);
    merged.services = Pick(higher.services, lower.services);
    merged.role = Pick(higher.role, lower.role);
    merged.propagation_attempts =
        Pick(higher.propagation_attempts, lower.propagation_attempts);
    merged.propagation_delay_seconds =
        Pick(higher.propagation_delay_seconds, lower.propagation_delay_seconds);
    merged.propagation_settle_seconds =
        Pick(higher.propagation_settle_seconds, lower.propagation_settle_seconds);
    merged.log_file = Pick(higher.log_file, lower.log_file);
    merged.json_output = Pick(higher.json_output, lower.json_output);
    merged.verbose = Pick(higher.verbose, lower.verbose);
    merged.quiet = Pick(higher.quiet, lower.quiet);
    return merged;
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<ResolvedConfig, Error> ResolveConfig(const ConfigLayer& merged,
                                            const IEnvironment& env) {
    using R = Result<ResolvedConfig, Error>;

    // Required fields first, in a fixed order, before any format checks.
    if (!merged.project.has_value() || merged.project->empty()) {
        return R::Err(MissingField("PROJECT_ID", "--project"));
    }
    if (!merged.datastore.has_value() || merged.datastore->empty()) {
        return R::Err(MissingField("DATA_STORE_ID", "--datastore"));
    }

    auto project = ProjectId::Create(*merged.project);
    if (project.IsErr()) {
        return R::Err(MakeConfigError(ErrorCategory::InvalidConfig,
                                      "Invalid project id: " + project.Error()));
    }

    auto app_name = ServiceName::Create(merged.app_name.value_or(kDefaultAppName));
    if (app_name.IsErr()) {
        return R::Err(MakeConfigError(ErrorCategory::InvalidConfig,
                                      "Invalid application name: " + app_name.Error()));
    }

    auto account = ServiceAccountName::Create(merged.service_account.value_or(
        app_name.Value().Value() + kServiceAccountSuffix));
    if (account.IsErr()) {
        return R::Err(MakeConfigError(
            ErrorCategory::InvalidConfig,
            "Invalid service account name: " + account.Error(),
            std::string("Pass --service-account with 6 to 30 characters")));
    }

    auto region = merged.region.value_or(kDefaultRegion);
    auto location = merged.location.value_or(kDefaultLocation);
    auto repository = merged.repository.value_or(kDefaultRepository);
    auto source_dir = merged.source_dir.value_or(kDefaultSourceDir);
    if (region.empty() || location.empty() || repository.empty() ||
        source_dir.empty()) {
        return R::Err(MakeConfigError(
            ErrorCategory::InvalidConfig,
            "region, location, repository and source directory must not be empty"));
    }

    auto services = merged.services.value_or(DefaultServices());
    if (services.empty()) {
        return R::Err(MakeConfigError(ErrorCategory::InvalidConfig,
                                      "At least one service must be listed"));
    }
    auto role = merged.role.value_or(kDefaultRole);
    if (role.empty()) {
        return R::Err(MakeConfigError(ErrorCategory::InvalidConfig,
                                      "Role must not be empty"));
    }

    const int attempts = merged.propagation_attempts.value_or(3);
    const int delay = merged.propagation_delay_seconds.value_or(10);
    const int settle = merged.propagation_settle_seconds.value_or(15);
    if (attempts < 1) {
        return R::Err(MakeConfigError(
            ErrorCategory::InvalidConfig,
            "propagation.max_attempts must be at least 1, got " +
                std::to_string(attempts)));
    }
    if (delay < 0 || settle < 0) {
        return R::Err(MakeConfigError(ErrorCategory::InvalidConfig,
                                      "propagation delays must not be negative"));
    }

    OutputOptions output;
    output.log_file = merged.log_file;
    output.json_output = merged.json_output.value_or(false);
    output.verbose = merged.verbose.value_or(false);
    output.quiet = merged.quiet.value_or(false);
    if (output.verbose && output.quiet) {
        return R::Err(MakeConfigError(ErrorCategory::Usage,
                                      "Cannot use both --verbose and --quiet"));
    }

    auto signal = DetectNonInteractiveContext(env);
    bool skip = merged.skip_confirmation.value_or(false) || signal.has_value();

    DeploymentConfig deployment{
        std::move(project).Value(),
        std::move(region),
        std::move(location),
        std::move(app_name).Value(),
        std::move(account).Value(),
        std::move(repository),
        *merged.datastore,
        std::move(source_dir),
        skip,
        std::move(services),
        std::move(role),
        RetryPolicy::Fixed(attempts, std::chrono::seconds(delay)),
        std::chrono::seconds(settle),
    };

    return R::Ok(ResolvedConfig{std::move(deployment), std::move(output),
                                std::move(signal)});
}

// ---------------------------------------------------------------------------
// DeploymentConfig
// ---------------------------------------------------------------------------
std::string DeploymentConfig::ServiceAccountEmail() const {
    return service_account.Email(project);
}

std::string DeploymentConfig::ServiceAccountMember() const {
    return "serviceAccount:" + ServiceAccountEmail();
}

std::string DeploymentConfig::ImageTag() const {
    return region + "-docker.pkg.dev/" + project.Value() + "/" + repository +
           "/" + app_name.Value();
}

std::vector<std::pair<std::string, std::string>> DeploymentConfig::RuntimeEnv() const {
    return {
        {"PROJECT_ID", project.Value()},
        {"LOCATION", location},
        {"DATA_STORE_ID", datastore},
    };
}

} // namespace vsearch_deploy

#pragma once

#include <vsearch_deploy/core/retry.hpp>
#include <vsearch_deploy/core/types.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vsearch_deploy {

constexpr const char* kDefaultRegion = "us-central1";
constexpr const char* kDefaultLocation = "global";
constexpr const char* kDefaultAppName = "vertex-search-app";
constexpr const char* kDefaultRepository = "chainlit-apps";
constexpr const char* kDefaultSourceDir = ".";
constexpr const char* kDefaultRole = "roles/discoveryengine.admin";
constexpr const char* kServiceAccountSuffix = "-sa";

// Platform APIs the deployed application depends on.
std::vector<std::string> DefaultServices();

// ---------------------------------------------------------------------------
// ConfigLayer — one configuration source (flags, environment, or YAML file).
// Unset fields fall through to the next layer.
// ---------------------------------------------------------------------------
struct ConfigLayer {
    std::optional<std::string> project;
    std::optional<std::string> datastore;
    std::optional<std::string> region;
    std::optional<std::string> location;
    std::optional<std::string> app_name;
    std::optional<std::string> service_account;
    std::optional<std::string> repository;
    std::optional<std::string> source_dir;
    std::optional<bool> skip_confirmation;

    std::optional<std::vector<std::string>> services;
    std::optional<std::string> role;
    std::optional<int> propagation_attempts;
    std::optional<int> propagation_delay_seconds;
    std::optional<int> propagation_settle_seconds;

    std::optional<std::string> log_file;
    std::optional<bool> json_output;
    std::optional<bool> verbose;
    std::optional<bool> quiet;
};

// ---------------------------------------------------------------------------
// DeploymentConfig — everything one run needs to know about the target.
//
// Built once by ResolveConfig and passed by const reference to every
// component; nothing modifies it after resolution.
// ---------------------------------------------------------------------------
struct DeploymentConfig {
    ProjectId project;
    std::string region;
    std::string location;
    ServiceName app_name;
    ServiceAccountName service_account;
    std::string repository;
    std::string datastore;
    std::string source_dir;
    bool skip_confirmation = false;

    std::vector<std::string> services;
    std::string role;
    RetryPolicy propagation;
    std::chrono::milliseconds propagation_settle{15000};

    [[nodiscard]] std::string ServiceAccountEmail() const;

    // "serviceAccount:<email>", the policy member form of the identity.
    [[nodiscard]] std::string ServiceAccountMember() const;

    // <region>-docker.pkg.dev/<project>/<repository>/<app>
    [[nodiscard]] std::string ImageTag() const;

    // The three start-up values of the application image.
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> RuntimeEnv() const;
};

// ---------------------------------------------------------------------------
// OutputOptions — how the run reports progress and results.
// ---------------------------------------------------------------------------
struct OutputOptions {
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
};

struct ResolvedConfig {
    DeploymentConfig deployment;
    OutputOptions output;
    // Name of the environment variable that marked the run non-interactive.
    std::optional<std::string> non_interactive_signal;
};

} // namespace vsearch_deploy

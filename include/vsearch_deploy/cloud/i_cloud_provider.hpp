#pragma once

#include <vsearch_deploy/core/result.hpp>
#include <vsearch_deploy/core/types.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// Provider collaborators.
//
// The provisioning steps depend only on these interfaces. Every describe-style
// call queries the provider afresh; implementations must not cache remote
// state. Methods return Result<T, Error> and never throw on expected failures.
// An absent resource is a successful describe returning ExistenceState::Absent,
// not an Err.
// ---------------------------------------------------------------------------

class IServiceCatalog {
public:
    virtual ~IServiceCatalog() = default;

    [[nodiscard]] virtual Result<bool, Error> IsEnabled(std::string_view service) = 0;
    [[nodiscard]] virtual Result<void, Error> Enable(std::string_view service) = 0;
};

class IIdentityStore {
public:
    virtual ~IIdentityStore() = default;

    [[nodiscard]] virtual Result<ExistenceState, Error> Describe(
        std::string_view email) = 0;
    [[nodiscard]] virtual Result<void, Error> Create(
        const ServiceAccountName& name, std::string_view display_name) = 0;
};

// ---------------------------------------------------------------------------
// PolicyDocument — the access policy as returned by the provider. `Json` is
// parsed structurally; `Text` is only searchable line by line.
// ---------------------------------------------------------------------------
enum class PolicyFormat {
    Json,
    Text,
};

struct PolicyDocument {
    PolicyFormat format = PolicyFormat::Json;
    std::string raw;
};

class IPolicyStore {
public:
    virtual ~IPolicyStore() = default;

    [[nodiscard]] virtual Result<PolicyDocument, Error> GetPolicy(
        const ProjectId& project) = 0;
    [[nodiscard]] virtual Result<void, Error> AddBinding(
        const ProjectId& project, std::string_view member, std::string_view role) = 0;
};

class IArtifactStore {
public:
    virtual ~IArtifactStore() = default;

    [[nodiscard]] virtual Result<ExistenceState, Error> Describe(
        std::string_view repository, std::string_view location) = 0;
    [[nodiscard]] virtual Result<void, Error> Create(
        std::string_view repository, std::string_view location) = 0;
};

class IBuilder {
public:
    virtual ~IBuilder() = default;

    // Build the image from `source_dir` and push it under `tag`.
    [[nodiscard]] virtual Result<void, Error> Build(
        std::string_view source_dir, std::string_view tag) = 0;
};

// ---------------------------------------------------------------------------
// DeploySpec — what the hosting target is asked to run.
// ---------------------------------------------------------------------------
struct DeploySpec {
    std::string service;
    std::string image;
    std::string identity;
    std::string region;
    std::vector<std::pair<std::string, std::string>> env;
    bool allow_unauthenticated = true;
};

class IHoster {
public:
    virtual ~IHoster() = default;

    [[nodiscard]] virtual Result<void, Error> Deploy(const DeploySpec& spec) = 0;
    [[nodiscard]] virtual Result<std::string, Error> GetAddress(
        std::string_view service, std::string_view region) = 0;
};

// ---------------------------------------------------------------------------
// CloudServices — the set of collaborators one run talks to. References must
// outlive every component that holds this struct.
// ---------------------------------------------------------------------------
struct CloudServices {
    IServiceCatalog& catalog;
    IIdentityStore& identities;
    IPolicyStore& policies;
    IArtifactStore& artifacts;
    IBuilder& builder;
    IHoster& hoster;
};

} // namespace vsearch_deploy

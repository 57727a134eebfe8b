#pragma once

#include <vsearch_deploy/core/result.hpp>

#include <string>
#include <string_view>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// ProjectId — validated cloud project identifier.
//
// Rules:
//   - at most 30 characters
//   - lowercase ASCII letters, digits and hyphens
//   - starts with a letter, does not end with a hyphen
// ---------------------------------------------------------------------------
class ProjectId {
public:
    static Result<ProjectId, std::string> Create(std::string_view id);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ProjectId& other) const { return value_ == other.value_; }
    bool operator!=(const ProjectId& other) const { return value_ != other.value_; }

private:
    explicit ProjectId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// ServiceAccountName — the account id part of a service account email.
// Same alphabet as ProjectId, 6 to 30 characters.
// ---------------------------------------------------------------------------
class ServiceAccountName {
public:
    static Result<ServiceAccountName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    // <name>@<project>.iam.gserviceaccount.com
    [[nodiscard]] std::string Email(const ProjectId& project) const;

    bool operator==(const ServiceAccountName& other) const { return value_ == other.value_; }
    bool operator!=(const ServiceAccountName& other) const { return value_ != other.value_; }

private:
    explicit ServiceAccountName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// ServiceName — name of the hosted service (at most 49 characters, lowercase
// letters, digits and hyphens, starting with a letter).
// ---------------------------------------------------------------------------
class ServiceName {
public:
    static Result<ServiceName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ServiceName& other) const { return value_ == other.value_; }
    bool operator!=(const ServiceName& other) const { return value_ != other.value_; }

private:
    explicit ServiceName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// ProvisionedResource — a remote object the orchestrator may need to create.
//
// `state` is filled from a fresh describe call at the start of every step and
// is never carried over from an earlier step or an earlier run.
// ---------------------------------------------------------------------------
enum class ResourceKind {
    Service,
    Identity,
    RoleBinding,
    Registry,
    BuildArtifact,
    HostedService,
};

enum class ExistenceState {
    Unknown,
    Absent,
    Present,
};

struct ProvisionedResource {
    ResourceKind kind = ResourceKind::Service;
    std::string identifier;
    ExistenceState state = ExistenceState::Unknown;
};

[[nodiscard]] const char* ResourceKindName(ResourceKind kind);
[[nodiscard]] const char* ExistenceStateName(ExistenceState state);

} // namespace vsearch_deploy

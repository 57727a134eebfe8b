#include <vsearch_deploy/core/types.hpp>

#include <algorithm>
#include <optional>

namespace vsearch_deploy {

namespace {

bool IsLowerAlnumOrHyphen(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

// Shared rule set of project ids, account ids and service names.
std::optional<std::string> CheckDnsLabel(std::string_view what,
                                         std::string_view value,
                                         size_t min_len, size_t max_len) {
    const std::string name(what);
    if (value.empty()) {
        return name + " must not be empty";
    }
    if (value.size() < min_len || value.size() > max_len) {
        return name + " must be " + std::to_string(min_len) + " to " +
               std::to_string(max_len) + " characters, got " +
               std::to_string(value.size());
    }
    if (!std::all_of(value.begin(), value.end(), IsLowerAlnumOrHyphen)) {
        return name + " must contain only lowercase letters, digits and hyphens";
    }
    if (value.front() < 'a' || value.front() > 'z') {
        return name + " must start with a lowercase letter";
    }
    if (value.back() == '-') {
        return name + " must not end with a hyphen";
    }
    return std::nullopt;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ProjectId
// ---------------------------------------------------------------------------
Result<ProjectId, std::string> ProjectId::Create(std::string_view id) {
    if (auto problem = CheckDnsLabel("Project id", id, 1, 30)) {
        return Result<ProjectId, std::string>::Err(*problem);
    }
    return Result<ProjectId, std::string>::Ok(ProjectId(std::string(id)));
}

// ---------------------------------------------------------------------------
// ServiceAccountName
// ---------------------------------------------------------------------------
Result<ServiceAccountName, std::string> ServiceAccountName::Create(
    std::string_view name) {
    if (auto problem = CheckDnsLabel("Service account name", name, 6, 30)) {
        return Result<ServiceAccountName, std::string>::Err(*problem);
    }
    return Result<ServiceAccountName, std::string>::Ok(
        ServiceAccountName(std::string(name)));
}

std::string ServiceAccountName::Email(const ProjectId& project) const {
    return value_ + "@" + project.Value() + ".iam.gserviceaccount.com";
}

// ---------------------------------------------------------------------------
// ServiceName
// ---------------------------------------------------------------------------
Result<ServiceName, std::string> ServiceName::Create(std::string_view name) {
    if (auto problem = CheckDnsLabel("Application name", name, 1, 49)) {
        return Result<ServiceName, std::string>::Err(*problem);
    }
    return Result<ServiceName, std::string>::Ok(ServiceName(std::string(name)));
}

const char* ResourceKindName(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Service:       return "service";
        case ResourceKind::Identity:      return "identity";
        case ResourceKind::RoleBinding:   return "role-binding";
        case ResourceKind::Registry:      return "registry";
        case ResourceKind::BuildArtifact: return "build-artifact";
        case ResourceKind::HostedService: return "hosted-service";
    }
    return "unknown";
}

const char* ExistenceStateName(ExistenceState state) {
    switch (state) {
        case ExistenceState::Unknown: return "unknown";
        case ExistenceState::Absent:  return "absent";
        case ExistenceState::Present: return "present";
    }
    return "unknown";
}

} // namespace vsearch_deploy

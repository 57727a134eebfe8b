#include <catch2/catch_test_macros.hpp>

#include <vsearch_deploy/core/types.hpp>

#include <string>

using namespace vsearch_deploy;

// ===========================================================================
// ProjectId
// ===========================================================================

TEST_CASE("ProjectId: valid ids", "[types][ProjectId]") {
    SECTION("typical id") {
        auto r = ProjectId::Create("my-search-project-42");
        REQUIRE(r.IsOk());
        CHECK(r.Value().Value() == "my-search-project-42");
    }
    SECTION("short id") {
        CHECK(ProjectId::Create("p1").IsOk());
    }
    SECTION("max 30 chars") {
        CHECK(ProjectId::Create("a" + std::string(29, 'b')).IsOk());
    }
}

TEST_CASE("ProjectId: invalid ids", "[types][ProjectId]") {
    SECTION("empty") {
        CHECK(ProjectId::Create("").IsErr());
    }
    SECTION("too long") {
        CHECK(ProjectId::Create("a" + std::string(30, 'b')).IsErr());
    }
    SECTION("uppercase") {
        auto r = ProjectId::Create("MyProject");
        REQUIRE(r.IsErr());
        CHECK(r.Error().find("lowercase") != std::string::npos);
    }
    SECTION("starts with a digit") {
        CHECK(ProjectId::Create("1project").IsErr());
    }
    SECTION("trailing hyphen") {
        CHECK(ProjectId::Create("project-").IsErr());
    }
    SECTION("underscore") {
        CHECK(ProjectId::Create("my_project").IsErr());
    }
}

TEST_CASE("ProjectId: equality", "[types][ProjectId]") {
    auto a = ProjectId::Create("project-a").Value();
    auto b = ProjectId::Create("project-a").Value();
    auto c = ProjectId::Create("project-c").Value();
    CHECK(a == b);
    CHECK(a != c);
}

// ===========================================================================
// ServiceAccountName
// ===========================================================================

TEST_CASE("ServiceAccountName: length limits", "[types][ServiceAccountName]") {
    CHECK(ServiceAccountName::Create("vertex-search-app-sa").IsOk());
    CHECK(ServiceAccountName::Create("abcdef").IsOk());
    CHECK(ServiceAccountName::Create("abcde").IsErr());
    CHECK(ServiceAccountName::Create("a" + std::string(30, 'b')).IsErr());
}

TEST_CASE("ServiceAccountName: email", "[types][ServiceAccountName]") {
    auto sa = ServiceAccountName::Create("vertex-search-app-sa").Value();
    auto project = ProjectId::Create("p1").Value();
    CHECK(sa.Email(project) == "vertex-search-app-sa@p1.iam.gserviceaccount.com");
}

// ===========================================================================
// ServiceName
// ===========================================================================

TEST_CASE("ServiceName: valid and invalid", "[types][ServiceName]") {
    CHECK(ServiceName::Create("vertex-search-app").IsOk());
    CHECK(ServiceName::Create("a").IsOk());
    CHECK(ServiceName::Create("a" + std::string(48, 'b')).IsOk());
    CHECK(ServiceName::Create("a" + std::string(49, 'b')).IsErr());
    CHECK(ServiceName::Create("-app").IsErr());
    CHECK(ServiceName::Create("App").IsErr());
}

// ===========================================================================
// ResourceKind
// ===========================================================================

TEST_CASE("ResourceKindName: stable names", "[types]") {
    CHECK(std::string(ResourceKindName(ResourceKind::Service)) == "service");
    CHECK(std::string(ResourceKindName(ResourceKind::Identity)) == "identity");
    CHECK(std::string(ResourceKindName(ResourceKind::RoleBinding)) == "role-binding");
    CHECK(std::string(ResourceKindName(ResourceKind::Registry)) == "registry");
    CHECK(std::string(ResourceKindName(ResourceKind::BuildArtifact)) == "build-artifact");
    CHECK(std::string(ResourceKindName(ResourceKind::HostedService)) == "hosted-service");
}

TEST_CASE("ProvisionedResource: state starts unknown", "[types]") {
    ProvisionedResource r;
    r.kind = ResourceKind::Registry;
    r.identifier = "chainlit-apps";
    CHECK(r.state == ExistenceState::Unknown);
}

TEST_CASE("ExistenceStateName: stable names", "[types]") {
    CHECK(std::string(ExistenceStateName(ExistenceState::Unknown)) == "unknown");
    CHECK(std::string(ExistenceStateName(ExistenceState::Absent)) == "absent");
    CHECK(std::string(ExistenceStateName(ExistenceState::Present)) == "present");
}

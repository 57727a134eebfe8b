#include <catch2/catch_test_macros.hpp>

#include <vsearch_deploy/workflow/deploy_workflow.hpp>
#include "../../test/mocks/fake_cloud.hpp"
#include "../../test/mocks/test_config.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace vsearch_deploy;
using namespace vsearch_deploy::testing;
using std::chrono::milliseconds;

// ===========================================================================
// End to end against the in-memory provider
// ===========================================================================

TEST_CASE("DeployWorkflow: fresh project deploys and reports the address",
          "[workflow][deploy]") {
    FakeCloud cloud("p1");
    auto config = MakeTestConfig("p1", "d1");
    std::vector<milliseconds> sleeps;
    DeployWorkflow workflow(cloud.Services(), config, RecordingSleep(sleeps));

    auto result = workflow.Execute();

    REQUIRE(result.success);
    REQUIRE(result.steps.size() == 7);
    CHECK(result.steps[0].step_name == steps::kEnableServices);
    CHECK(result.steps[5].step_name == steps::kBuild);
    CHECK(result.steps[6].step_name == steps::kDeploy);
    CHECK(result.FailedStep() == nullptr);
    CHECK_FALSE(result.failure.has_value());
    CHECK(result.summary == "7 created, 0 already present");

    REQUIRE(result.service_url.has_value());
    CHECK(result.service_url->rfind("https://", 0) == 0);

    REQUIRE(cloud.services.count("vertex-search-app") == 1);
    const auto& deployed = cloud.services["vertex-search-app"];
    CHECK(deployed.identity == "vertex-search-app-sa@p1.iam.gserviceaccount.com");
    CHECK(deployed.image == "us-central1-docker.pkg.dev/p1/chainlit-apps/vertex-search-app");
}

TEST_CASE("DeployWorkflow: re-run provisions nothing and deploys again",
          "[workflow][deploy]") {
    FakeCloud cloud;
    auto config = MakeTestConfig();
    std::vector<milliseconds> sleeps;

    {
        DeployWorkflow first(cloud.Services(), config, RecordingSleep(sleeps));
        REQUIRE(first.Execute().success);
    }
    const auto identities = cloud.CountCalls("CreateIdentity ");
    const auto grants = cloud.CountCalls("AddBinding ");
    const auto repos = cloud.CountCalls("CreateRepository ");

    DeployWorkflow second(cloud.Services(), config, RecordingSleep(sleeps));
    auto result = second.Execute();

    REQUIRE(result.success);
    CHECK(result.summary == "2 created, 5 already present");
    CHECK(cloud.CountCalls("CreateIdentity ") == identities);
    CHECK(cloud.CountCalls("AddBinding ") == grants);
    CHECK(cloud.CountCalls("CreateRepository ") == repos);
    CHECK(cloud.CountCalls("Build ") == 2);
    CHECK(cloud.CountCalls("Deploy ") == 2);
}

TEST_CASE("DeployWorkflow: propagation timeout stops before the build",
          "[workflow][deploy]") {
    FakeCloud cloud;
    cloud.identity_never_visible = true;
    auto config = MakeTestConfig();
    std::vector<milliseconds> sleeps;
    DeployWorkflow workflow(cloud.Services(), config, RecordingSleep(sleeps));

    auto result = workflow.Execute();

    CHECK_FALSE(result.success);
    REQUIRE(result.FailedStep() != nullptr);
    CHECK(result.FailedStep()->step_name == steps::kVerifyPropagation);
    REQUIRE(result.failure.has_value());
    CHECK(result.failure->ExitCode() == 5);
    CHECK(result.summary.rfind("verify-propagation failed: ", 0) == 0);
    CHECK_FALSE(result.service_url.has_value());
    CHECK(cloud.CountCalls("Build ") == 0);
}

TEST_CASE("DeployWorkflow: build failure reports the build step", "[workflow][deploy]") {
    FakeCloud cloud;
    cloud.build_error = Error{"BuildImage", "tag", "Dockerfile not found", std::nullopt,
                              ErrorCategory::Build, std::nullopt};
    auto config = MakeTestConfig();
    std::vector<milliseconds> sleeps;
    DeployWorkflow workflow(cloud.Services(), config, RecordingSleep(sleeps));

    auto result = workflow.Execute();

    CHECK_FALSE(result.success);
    REQUIRE(result.steps.size() == 6);
    CHECK(result.summary == "build failed: Dockerfile not found");
    CHECK(result.failure->category == ErrorCategory::Build);
    CHECK(cloud.CountCalls("Deploy ") == 0);
}

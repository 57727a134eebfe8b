#include <catch2/catch_test_macros.hpp>

#include <vsearch_deploy/workflow/preflight.hpp>
#include "../../test/mocks/mock_command_runner.hpp"

#include <string>
#include <vector>

using namespace vsearch_deploy;
using namespace vsearch_deploy::testing;

namespace {
using Argv = std::vector<std::string>;
} // anonymous namespace

// ===========================================================================
// GcloudRequirement
// ===========================================================================

TEST_CASE("GcloudRequirement: installers use sudo unless root", "[workflow][preflight]") {
    auto as_user = GcloudRequirement(false);
    CHECK(as_user.name == "gcloud");
    REQUIRE(as_user.installers.size() == 3);
    CHECK(as_user.installers[0].manager == "apt-get");
    REQUIRE(as_user.installers[0].commands.size() == 2);
    CHECK(as_user.installers[0].commands[0] == Argv{"sudo", "apt-get", "update"});
    CHECK(as_user.installers[0].commands[1] ==
          Argv{"sudo", "apt-get", "install", "-y", "google-cloud-cli"});
    CHECK(as_user.installers[1].commands[0] ==
          Argv{"sudo", "yum", "install", "-y", "google-cloud-cli"});
    CHECK(as_user.installers[2].commands[0] ==
          Argv{"brew", "install", "--cask", "google-cloud-sdk"});

    auto as_root = GcloudRequirement(true);
    CHECK(as_root.installers[0].commands[0] == Argv{"apt-get", "update"});
    CHECK(as_root.installers[1].commands[0].front() == "yum");
}

// ===========================================================================
// PreflightChecker
// ===========================================================================

TEST_CASE("Preflight: tool present runs nothing", "[workflow][preflight]") {
    MockCommandRunner runner;
    runner.SetAvailable("gcloud");
    PreflightChecker checker(runner, {GcloudRequirement(true)});

    CHECK(checker.Run().IsOk());
    CHECK(runner.RunCallCount() == 0);
    CHECK(runner.AvailabilityQueries() == std::vector<std::string>{"gcloud"});
}

TEST_CASE("Preflight: installs with the first available manager", "[workflow][preflight]") {
    MockCommandRunner runner;
    runner.SetAvailable("yum");
    runner.EnqueueOutput(0, "Complete!\n");
    runner.OnRun([&runner](const std::vector<std::string>&) {
        runner.SetAvailable("gcloud");
    });
    PreflightChecker checker(runner, {GcloudRequirement(true)});

    CHECK(checker.Run().IsOk());
    REQUIRE(runner.RunCallCount() == 1);
    CHECK(runner.RunCalls()[0] == Argv{"yum", "install", "-y", "google-cloud-cli"});
}

TEST_CASE("Preflight: apt-get updates before installing", "[workflow][preflight]") {
    MockCommandRunner runner;
    runner.SetAvailable("apt-get");
    runner.EnqueueOutput(0, "");
    runner.EnqueueOutput(0, "");
    runner.OnRun([&runner](const std::vector<std::string>& argv) {
        if (argv.size() > 2 && argv[2] == "install") {
            runner.SetAvailable("gcloud");
        }
    });
    PreflightChecker checker(runner, {GcloudRequirement(false)});

    CHECK(checker.Run().IsOk());
    REQUIRE(runner.RunCallCount() == 2);
    CHECK(runner.RunCalls()[0] == Argv{"sudo", "apt-get", "update"});
    CHECK(runner.RunCalls()[1] ==
          Argv{"sudo", "apt-get", "install", "-y", "google-cloud-cli"});
}

TEST_CASE("Preflight: failed installer falls through to the next", "[workflow][preflight]") {
    MockCommandRunner runner;
    runner.SetAvailable("apt-get");
    runner.SetAvailable("brew");
    runner.EnqueueOutput(100, "", "E: Unable to locate package google-cloud-cli\n");
    runner.EnqueueOutput(0, "");
    runner.OnRun([&runner](const std::vector<std::string>& argv) {
        if (argv.front() == "brew") {
            runner.SetAvailable("gcloud");
        }
    });
    PreflightChecker checker(runner, {GcloudRequirement(true)});

    CHECK(checker.Run().IsOk());
    REQUIRE(runner.RunCallCount() == 2);
    CHECK(runner.RunCalls()[0] == Argv{"apt-get", "update"});
    CHECK(runner.RunCalls()[1].front() == "brew");
}

TEST_CASE("Preflight: no package manager is a tool error", "[workflow][preflight]") {
    MockCommandRunner runner;
    PreflightChecker checker(runner, {GcloudRequirement(true)});

    auto result = checker.Run();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ToolMissing);
    CHECK(result.Error().ExitCode() == 4);
    CHECK(result.Error().target == "gcloud");
    CHECK(result.Error().message ==
          "Could not install gcloud. Please install it manually and try again.");
    CHECK(runner.RunCallCount() == 0);
}

TEST_CASE("Preflight: install that exits 0 but leaves no tool fails", "[workflow][preflight]") {
    MockCommandRunner runner;
    runner.SetAvailable("yum");
    runner.EnqueueOutput(0, "");
    PreflightChecker checker(runner, {GcloudRequirement(true)});

    auto result = checker.Run();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ToolMissing);
}

TEST_CASE("Preflight: stops at the first missing tool", "[workflow][preflight]") {
    MockCommandRunner runner;
    runner.SetAvailable("gcloud");
    ToolRequirement docker{"docker", {}};
    ToolRequirement jq{"jq", {}};
    PreflightChecker checker(runner, {GcloudRequirement(true), docker, jq});

    auto result = checker.Run();
    REQUIRE(result.IsErr());
    CHECK(result.Error().target == "docker");
    CHECK(runner.AvailabilityQueries() == std::vector<std::string>{"gcloud", "docker"});
}

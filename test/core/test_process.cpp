#include <catch2/catch_test_macros.hpp>

#include <vsearch_deploy/core/process.hpp>
#include "../../test/mocks/fake_environment.hpp"

#include <string>
#include <vector>

using namespace vsearch_deploy;
using namespace vsearch_deploy::testing;

// These tests start real processes through /bin/sh.

TEST_CASE("ProcessCommandRunner: captures stdout and exit code", "[process]") {
    ProcessCommandRunner runner;
    auto r = runner.Run({"sh", "-c", "echo hello"});
    REQUIRE(r.IsOk());
    CHECK(r.Value().Succeeded());
    CHECK(r.Value().out == "hello\n");
    CHECK(r.Value().err.empty());
}

TEST_CASE("ProcessCommandRunner: keeps stderr separate", "[process]") {
    ProcessCommandRunner runner;
    auto r = runner.Run({"sh", "-c", "echo out; echo 'ERROR: boom' >&2; exit 3"});
    REQUIRE(r.IsOk());
    CHECK(r.Value().exit_code == 3);
    CHECK(r.Value().out == "out\n");
    CHECK(r.Value().err == "ERROR: boom\n");
}

TEST_CASE("ProcessCommandRunner: arguments are not shell-expanded", "[process]") {
    ProcessCommandRunner runner;
    auto r = runner.Run({"sh", "-c", "printf '%s' \"$1\"", "sh", "a b; $HOME"});
    REQUIRE(r.IsOk());
    CHECK(r.Value().out == "a b; $HOME");
}

TEST_CASE("ProcessCommandRunner: large output on both pipes", "[process]") {
    ProcessCommandRunner runner;
    auto r = runner.Run({"sh", "-c",
                         "i=0; while [ $i -lt 2000 ]; do "
                         "echo 0123456789012345678901234567890123456789; "
                         "echo 0123456789012345678901234567890123456789 >&2; "
                         "i=$((i+1)); done"});
    REQUIRE(r.IsOk());
    CHECK(r.Value().out.size() == 2000u * 41u);
    CHECK(r.Value().err.size() == 2000u * 41u);
}

TEST_CASE("ProcessCommandRunner: missing program exits 127", "[process]") {
    ProcessCommandRunner runner;
    auto r = runner.Run({"vsearch-deploy-no-such-program"});
    REQUIRE(r.IsOk());
    CHECK(r.Value().exit_code == 127);
    CHECK(r.Value().err.find("cannot execute") != std::string::npos);
}

TEST_CASE("ProcessCommandRunner: empty argv is an error", "[process]") {
    ProcessCommandRunner runner;
    auto r = runner.Run({});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Internal);
}

TEST_CASE("ProcessCommandRunner: IsAvailable", "[process]") {
    ProcessCommandRunner runner;
    CHECK(runner.IsAvailable("sh"));
    CHECK_FALSE(runner.IsAvailable("vsearch-deploy-no-such-program"));
}

TEST_CASE("FindOnPath: searches the given PATH only", "[process]") {
    FakeEnvironment env{{"PATH", "/nonexistent:/bin:/usr/bin"}};
    auto sh = FindOnPath("sh", env);
    REQUIRE(sh.has_value());
    CHECK(sh->find("/sh") != std::string::npos);

    FakeEnvironment empty;
    CHECK_FALSE(FindOnPath("sh", empty).has_value());
    CHECK_FALSE(FindOnPath("", env).has_value());
}

TEST_CASE("FindOnPath: explicit paths are checked directly", "[process]") {
    FakeEnvironment env;
    CHECK(FindOnPath("/bin/sh", env).has_value());
    CHECK_FALSE(FindOnPath("/bin/vsearch-deploy-no-such-program", env).has_value());
}

TEST_CASE("FormatCommand: quotes arguments with spaces", "[process]") {
    std::vector<std::string> argv{"gcloud", "iam", "service-accounts", "create",
                                  "app-sa", "--display-name",
                                  "Vertex Search App Service Account"};
    CHECK(FormatCommand(argv) ==
          "gcloud iam service-accounts create app-sa --display-name "
          "\"Vertex Search App Service Account\"");
    CHECK(FormatCommand({"a", ""}) == "a \"\"");
}

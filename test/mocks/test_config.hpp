#pragma once

#include <vsearch_deploy/config/config_loader.hpp>

#include "fake_environment.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

namespace vsearch_deploy {
namespace testing {

// A resolved configuration with the given required values and every other
// field at its default. `settle_seconds` defaults to 0 so retry tests only see
// the retry delays.
inline DeploymentConfig MakeTestConfig(const std::string& project = "p1",
                                       const std::string& datastore = "d1",
                                       int settle_seconds = 0) {
    ConfigLayer layer;
    layer.project = project;
    layer.datastore = datastore;
    layer.propagation_settle_seconds = settle_seconds;
    FakeEnvironment env;
    auto resolved = ResolveConfig(layer, env);
    if (resolved.IsErr()) {
        throw std::runtime_error("MakeTestConfig: " + resolved.Error().ToString());
    }
    return resolved.Value().deployment;
}

// Sleep function that records the requested waits instead of blocking.
inline SleepFn RecordingSleep(std::vector<std::chrono::milliseconds>& sleeps) {
    return [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); };
}

} // namespace testing
} // namespace vsearch_deploy

#pragma once

#include <vsearch_deploy/config/app_config.hpp>
#include <vsearch_deploy/core/environment.hpp>
#include <vsearch_deploy/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// CliArgs — the parsed command line. Flags that configure the deployment land
// in `layer`; the rest steer the program itself.
// ---------------------------------------------------------------------------
struct CliArgs {
    ConfigLayer layer;
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
    bool force_color = false;
    bool force_no_color = false;
};

// Parse command-line flags. Any unrecognized argument, positional or not, is
// an Error of category Usage.
Result<CliArgs, Error> LoadFromCli(int argc, const char* const* argv);

// Help text listing every flag.
std::string CliUsage();

// Read PROJECT_ID, DATA_STORE_ID, REGION, ... Empty variables count as unset.
ConfigLayer LoadFromEnvironment(const IEnvironment& env);

// Parse a YAML config file into a layer.
Result<ConfigLayer, Error> LoadFromYaml(std::string_view file_path);

// Field-wise merge: values set in `higher` win over those in `lower`.
ConfigLayer MergeLayers(const ConfigLayer& higher, const ConfigLayer& lower);

// Apply defaults, validate, and build the run's configuration. Fails with
// MissingConfig naming the first absent required field (project before
// datastore), or InvalidConfig for malformed values. Reads only `env`.
Result<ResolvedConfig, Error> ResolveConfig(const ConfigLayer& merged,
                                            const IEnvironment& env);

} // namespace vsearch_deploy

#pragma once

#include <toolserve/config/server_config.hpp>
#include <toolserve/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace toolserve {

// Parse a YAML config file into a ServerConfig.
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path);

// Parsed command line: the overrides plus the -c/--config path, if any.
struct CliOptions {
    ServerConfig config;
    std::optional<std::string> config_path;
    bool force_color = false;
    bool force_no_color = false;
};

// Parse CLI arguments. Flags that are not given leave the defaults in place.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: values in cli_overrides that differ from the defaults
// replace those in yaml_base.
ServerConfig MergeConfigs(const ServerConfig& yaml_base,
                          const ServerConfig& cli_overrides);

// Validate that values are sane before the server starts.
Result<void, Error> ValidateConfig(const ServerConfig& config);

} // namespace toolserve

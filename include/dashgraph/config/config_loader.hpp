#pragma once

#include <dashgraph/config/app_config.hpp>
#include <dashgraph/core/result.hpp>

#include <string_view>

namespace dashgraph {

// Parse a YAML config file into an AppConfig. Missing keys keep defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse command-line flags into an AppConfig. When -c/--config is given the
// file is loaded first and the flags are merged over it.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge command-line values over a base config: every value present in
// cli_overrides wins, even one equal to the default.
AppConfig MergeConfigs(const AppConfig& yaml_base, const ConfigOverrides& cli_overrides);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Parse "console" or "json".
Result<LogFormat, Error> ParseLogFormat(std::string_view text);

// Build the sink described by `config` and install it as the global logger.
Result<void, Error> InitLogging(const LogConfig& config);

} // namespace dashgraph

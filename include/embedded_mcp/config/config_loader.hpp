#pragma once

#include <embedded_mcp/config/app_config.hpp>
#include <embedded_mcp/core/result.hpp>

#include <string_view>

namespace embedded_mcp {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. Options not given keep their
// defaults.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// cli_overrides take precedence wherever they differ from the defaults.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Port range, positive timeouts, sane thread count, verbose/quiet exclusive.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace embedded_mcp

#pragma once

#include <ea_mcp/config/app_config.hpp>
#include <ea_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace ea_mcp {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. Only flags actually given differ
// from the defaults.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Resolve path_env: if the repository path is empty and the named
// environment variable is set, use its value as the path.
Result<AppConfig, Error> ResolveRepositoryPathEnv(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace ea_mcp

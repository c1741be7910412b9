#pragma once

#include <docmcp/config/app_config.hpp>
#include <docmcp/core/result.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docmcp {

// Values given on the command line or in the environment. Unset fields
// leave the underlying configuration untouched.
struct ConfigOverrides {
    std::optional<std::string> server_command;
    std::vector<std::string> server_args;
    std::optional<std::string> server_cwd;
    std::optional<int> timeout_seconds;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> model;
    std::optional<std::string> api_key;
    std::optional<std::string> base_url;
    std::optional<int> worker_count;
    std::optional<std::string> log_level;
    bool json_logs = false;
};

enum class Command { Serve, Api, Tools, Call };

const char* CommandName(Command command);
Result<Command, Error> ParseCommand(std::string_view text);

// Everything parsed from argv.
struct CliOptions {
    Command command = Command::Api;
    std::optional<std::string> config_file;
    ConfigOverrides overrides;
    // `call` only.
    std::optional<std::string> tool_name;
    std::optional<std::string> content;
    std::optional<std::string> arguments_json;
};

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Read COHERE_API_KEY, COHERE_MODEL, COHERE_BASE_URL, API_HOST, API_PORT,
// DOCMCP_SERVER_CMD and DOCMCP_LOG_LEVEL.
using EnvLookup = std::function<const char*(const char*)>;
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& lookup);

// Parse CLI arguments (the command word included).
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply overrides on top of `base`.
AppConfig MergeConfigs(const AppConfig& base, const ConfigOverrides& overrides);

// YAML (when given) < environment < command line. A launch command left
// unset defaults to running `self_executable serve`.
Result<AppConfig, Error> ResolveConfig(const CliOptions& cli,
                                       const EnvLookup& lookup,
                                       const std::string& self_executable);

// Check values are usable for `command`.
Result<void, Error> ValidateConfig(const AppConfig& config, Command command);

} // namespace docmcp

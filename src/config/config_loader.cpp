#include <docmcp/config/config_loader.hpp>

#include <docmcp/core/log.hpp>
#include <docmcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <limits>

namespace docmcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return MakeError(ErrorCategory::Config, "ConfigLoader", message);
}

Result<uint16_t, Error> ParsePort(const std::string& text, const std::string& source) {
    try {
        std::size_t used = 0;
        const long value = std::stol(text, &used);
        if (used == text.size() && value >= 0 &&
            value <= std::numeric_limits<uint16_t>::max()) {
            return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(value));
        }
    } catch (const std::exception&) {
        // reported below
    }
    return Result<uint16_t, Error>::Err(
        MakeConfigError("Invalid port in " + source + ": '" + text + "'"));
}

} // anonymous namespace

const char* CommandName(Command command) {
    switch (command) {
        case Command::Serve: return "serve";
        case Command::Api:   return "api";
        case Command::Tools: return "tools";
        case Command::Call:  return "call";
    }
    return "unknown";
}

Result<Command, Error> ParseCommand(std::string_view text) {
    if (text == "serve") return Result<Command, Error>::Ok(Command::Serve);
    if (text == "api")   return Result<Command, Error>::Ok(Command::Api);
    if (text == "tools") return Result<Command, Error>::Ok(Command::Tools);
    if (text == "call")  return Result<Command, Error>::Ok(Command::Call);
    return Result<Command, Error>::Err(MakeConfigError(
        "Unknown command '" + std::string(text) + "' (expected serve, api, tools or call)"));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        // -- Tool host launch --
        if (const auto server = root["server"]) {
            if (server["command"]) {
                config.launch.executable = server["command"].as<std::string>();
            }
            if (server["args"]) {
                for (const auto& arg : server["args"]) {
                    config.launch.args.push_back(arg.as<std::string>());
                }
            }
            if (server["cwd"]) {
                config.launch.working_directory = server["cwd"].as<std::string>();
            }
            if (server["name"]) {
                config.server_name = server["name"].as<std::string>();
            }
            if (server["workers"]) {
                config.worker_count = server["workers"].as<int>();
            }
        }

        // -- Session --
        if (const auto session = root["session"]) {
            if (session["timeout"]) {
                config.session.request_timeout =
                    std::chrono::seconds(session["timeout"].as<int>());
            }
            if (session["connect_timeout"]) {
                config.session.connect_timeout =
                    std::chrono::seconds(session["connect_timeout"].as<int>());
            }
            if (session["shutdown_grace_ms"]) {
                config.session.shutdown_grace =
                    std::chrono::milliseconds(session["shutdown_grace_ms"].as<int>());
            }
            if (session["malformed_line_threshold"]) {
                config.session.malformed_line_threshold =
                    session["malformed_line_threshold"].as<int>();
            }
        }

        // -- REST API --
        if (const auto api = root["api"]) {
            if (api["host"]) {
                config.api.host = api["host"].as<std::string>();
            }
            if (api["port"]) {
                config.api.port = api["port"].as<uint16_t>();
            }
        }

        // -- Text service --
        if (const auto text = root["cohere"]) {
            if (text["api_key"]) {
                config.text_service.api_key = text["api_key"].as<std::string>();
            }
            if (text["model"]) {
                config.text_service.model = text["model"].as<std::string>();
            }
            if (text["base_url"]) {
                config.text_service.base_url = text["base_url"].as<std::string>();
            }
            if (text["timeout"]) {
                config.text_service.timeout = std::chrono::seconds(text["timeout"].as<int>());
            }
        }

        if (root["recipients"]) {
            config.recipients.clear();
            for (const auto& name : root["recipients"]) {
                config.recipients.push_back(name.as<std::string>());
            }
        }

        // -- Logging --
        if (root["log_level"]) {
            config.log_level = root["log_level"].as<std::string>();
        }
        if (root["json_logs"]) {
            config.json_logs = root["json_logs"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " + e.what()));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& lookup) {
    ConfigOverrides overrides;
    auto get = [&lookup](const char* name) -> std::optional<std::string> {
        const char* value = lookup(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };

    overrides.api_key = get("COHERE_API_KEY");
    overrides.model = get("COHERE_MODEL");
    overrides.base_url = get("COHERE_BASE_URL");
    overrides.host = get("API_HOST");
    overrides.server_command = get("DOCMCP_SERVER_CMD");
    overrides.log_level = get("DOCMCP_LOG_LEVEL");
    if (auto port = get("API_PORT")) {
        auto parsed = ParsePort(*port, "API_PORT");
        if (parsed.IsErr()) {
            return Result<ConfigOverrides, Error>::Err(std::move(parsed).Error());
        }
        overrides.port = parsed.Value();
    }
    return Result<ConfigOverrides, Error>::Ok(std::move(overrides));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("docmcp", kVersion);

    program.add_argument("command")
        .help("serve | api | tools | call");
    program.add_argument("tool")
        .help("Tool to run (call only)")
        .nargs(argparse::nargs_pattern::optional);

    // Configuration
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");

    // Tool host launch
    program.add_argument("--server-cmd")
        .help("Tool host executable (default: this binary with 'serve')");
    program.add_argument("--server-arg")
        .help("Argument for the tool host (repeatable)")
        .append();
    program.add_argument("--server-cwd")
        .help("Working directory for the tool host");
    program.add_argument("--timeout")
        .help("Request timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--workers")
        .help("Tool host worker threads")
        .scan<'i', int>();

    // REST API
    program.add_argument("--host")
        .help("REST API bind address");
    program.add_argument("--port")
        .help("REST API port (0 picks a free port)")
        .scan<'i', int>();

    // Text service
    program.add_argument("--model")
        .help("Cohere model");
    program.add_argument("--api-key")
        .help("Cohere API key");

    // call
    program.add_argument("--content")
        .help("Document content (call)");
    program.add_argument("--args")
        .help("Tool arguments as a JSON object (call)");

    // Output
    program.add_argument("--json-logs")
        .help("Write logs to stderr as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose output (-vv for debug)")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    auto command = ParseCommand(program.get<std::string>("command"));
    if (command.IsErr()) {
        return Result<CliOptions, Error>::Err(std::move(command).Error());
    }
    cli.command = command.Value();

    if (auto val = program.present("--config")) {
        cli.config_file = *val;
    }
    if (auto val = program.present("tool")) {
        cli.tool_name = *val;
    }
    if (auto val = program.present("--content")) {
        cli.content = *val;
    }
    if (auto val = program.present("--args")) {
        cli.arguments_json = *val;
    }

    auto& overrides = cli.overrides;
    if (auto val = program.present("--server-cmd")) {
        overrides.server_command = *val;
    }
    if (auto val = program.present<std::vector<std::string>>("--server-arg")) {
        overrides.server_args = *val;
    }
    if (auto val = program.present("--server-cwd")) {
        overrides.server_cwd = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        overrides.timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--workers")) {
        overrides.worker_count = *val;
    }
    if (auto val = program.present("--host")) {
        overrides.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        if (*val < 0 || *val > std::numeric_limits<uint16_t>::max()) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --port: " + std::to_string(*val)));
        }
        overrides.port = static_cast<uint16_t>(*val);
    }
    if (auto val = program.present("--model")) {
        overrides.model = *val;
    }
    if (auto val = program.present("--api-key")) {
        overrides.api_key = *val;
    }
    if (program.get<bool>("-vv")) {
        overrides.log_level = "debug";
    } else if (program.get<bool>("--verbose")) {
        overrides.log_level = "info";
    }
    overrides.json_logs = program.get<bool>("--json-logs");

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const ConfigOverrides& overrides) {
    AppConfig merged = base;

    if (overrides.server_command) {
        merged.launch.executable = *overrides.server_command;
        // A new command does not inherit the old command's arguments.
        merged.launch.args = overrides.server_args;
    } else if (!overrides.server_args.empty()) {
        merged.launch.args = overrides.server_args;
    }
    if (overrides.server_cwd) {
        merged.launch.working_directory = overrides.server_cwd;
    }
    if (overrides.timeout_seconds) {
        merged.session.request_timeout = std::chrono::seconds(*overrides.timeout_seconds);
    }
    if (overrides.host) {
        merged.api.host = *overrides.host;
    }
    if (overrides.port) {
        merged.api.port = *overrides.port;
    }
    if (overrides.model) {
        merged.text_service.model = *overrides.model;
    }
    if (overrides.api_key) {
        merged.text_service.api_key = *overrides.api_key;
    }
    if (overrides.base_url) {
        merged.text_service.base_url = *overrides.base_url;
    }
    if (overrides.worker_count) {
        merged.worker_count = *overrides.worker_count;
    }
    if (overrides.log_level) {
        merged.log_level = *overrides.log_level;
    }
    if (overrides.json_logs) {
        merged.json_logs = true;
    }
    return merged;
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(const CliOptions& cli, const EnvLookup& lookup,
                                       const std::string& self_executable) {
    AppConfig config;
    if (cli.config_file) {
        auto loaded = LoadFromYaml(*cli.config_file);
        if (loaded.IsErr()) {
            return loaded;
        }
        config = std::move(loaded).Value();
    }

    auto env = LoadFromEnv(lookup);
    if (env.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(env).Error());
    }
    config = MergeConfigs(config, env.Value());
    config = MergeConfigs(config, cli.overrides);

    if (config.launch.executable.empty()) {
        config.launch.executable = self_executable;
        config.launch.args = {"serve"};
        if (cli.config_file) {
            config.launch.args.push_back("--config");
            config.launch.args.push_back(*cli.config_file);
        }
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config, Command command) {
    auto fail = [](const std::string& message) {
        return Result<void, Error>::Err(MakeConfigError(message));
    };

    auto level = ParseLogLevel(config.log_level);
    if (level.IsErr()) {
        return fail(level.Error().message);
    }
    if (config.session.request_timeout.count() <= 0) {
        return fail("Request timeout must be positive");
    }
    if (config.session.connect_timeout.count() <= 0) {
        return fail("Connect timeout must be positive");
    }
    if (config.session.malformed_line_threshold < 1) {
        return fail("malformed_line_threshold must be at least 1");
    }

    if (command == Command::Serve) {
        if (config.text_service.api_key.empty()) {
            return fail("COHERE_API_KEY is not set (environment, --api-key or cohere.api_key)");
        }
        if (config.text_service.model.empty()) {
            return fail("Missing required field: cohere model");
        }
        if (config.recipients.empty()) {
            return fail("Recipient list must not be empty");
        }
        if (config.worker_count < 0) {
            return fail("workers must not be negative");
        }
        return Result<void, Error>::Ok();
    }

    if (config.launch.executable.empty()) {
        return fail("Missing required field: server command");
    }
    if (command == Command::Api && config.api.host.empty()) {
        return fail("Missing required field: api host");
    }
    return Result<void, Error>::Ok();
}

} // namespace docmcp

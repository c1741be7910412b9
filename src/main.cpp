#include <docmcp/api/rest_facade.hpp>
#include <docmcp/client/session.hpp>
#include <docmcp/config/config_loader.hpp>
#include <docmcp/core/log.hpp>
#include <docmcp/core/terminal.hpp>
#include <docmcp/core/version.hpp>
#include <docmcp/server/document_tools.hpp>
#include <docmcp/server/mcp_server.hpp>
#include <docmcp/server/text_client.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include <signal.h>

namespace {

using namespace docmcp;

constexpr int kExitSuccess = 0;
constexpr int kExitToolError = 1;

std::function<void(int)> shutdown_handler;
std::atomic_flag is_terminating = ATOMIC_FLAG_INIT;

void SignalHandler(int signo) {
    if (is_terminating.test_and_set()) {
        // Second signal: give up on a graceful stop.
        std::_Exit(128 + signo);
    }
    if (shutdown_handler) {
        shutdown_handler(signo);
    }
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = SignalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

const char* EnvLookupDefault(const char* name) {
    return std::getenv(name);
}

std::string SelfExecutable(const char* argv0) {
    std::error_code ec;
    auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return argv0;
    }
    return path.string();
}

void InitLogging(const AppConfig& config) {
    auto level = ParseLogLevel(config.log_level).ValueOr(LogLevel::Warn);
    if (config.json_logs) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
    } else {
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(UseColorLogs()), level);
    }
}

int Fail(const Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson().dump() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
    return error.ExitCode();
}

// ---------------------------------------------------------------------------
// serve: tool host on stdin/stdout
// ---------------------------------------------------------------------------
int RunServe(const AppConfig& config) {
    CohereTextClient text_client(config.text_service);

    ToolRegistry registry;
    auto registered = RegisterDocumentTools(registry, text_client, config.recipients);
    if (registered.IsErr()) {
        return Fail(registered.Error(), config.json_logs);
    }

    LogInfo("main", "Starting tool host " + config.server_name + " v" + kVersion +
                        " (model " + config.text_service.model + ")");
    McpServerOptions options;
    options.name = config.server_name;
    options.version = kVersion;
    options.worker_count = config.worker_count;

    // Blocks until EOF on stdin.
    McpServer server(std::move(registry), options, std::cin, std::cout);
    server.Run();
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// Client commands
// ---------------------------------------------------------------------------
Result<std::unique_ptr<Session>, Error> OpenSession(const AppConfig& config) {
    auto session = MakeStdioSession(config.launch, config.session);
    auto connected = session->Connect();
    if (connected.IsErr()) {
        return Result<std::unique_ptr<Session>, Error>::Err(std::move(connected).Error());
    }
    return Result<std::unique_ptr<Session>, Error>::Ok(std::move(session));
}

int RunApi(const AppConfig& config) {
    auto opened = OpenSession(config);
    if (opened.IsErr()) {
        return Fail(opened.Error(), config.json_logs);
    }
    auto session = std::move(opened).Value();

    RestFacade facade(*session, config.api, config.session.request_timeout);
    shutdown_handler = [&facade](int) { facade.Stop(); };
    InstallSignalHandlers();

    auto served = facade.Serve();
    shutdown_handler = nullptr;
    session->Close();
    if (served.IsErr()) {
        return Fail(served.Error(), config.json_logs);
    }
    return kExitSuccess;
}

int RunTools(const AppConfig& config) {
    auto opened = OpenSession(config);
    if (opened.IsErr()) {
        return Fail(opened.Error(), config.json_logs);
    }
    auto session = std::move(opened).Value();

    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : session->Tools()) {
        tools.push_back(ToolDefinitionToJson(tool));
    }
    std::cout << nlohmann::json{{"server", session->ServerInfo()}, {"tools", tools}}.dump(2)
              << "\n";
    session->Close();
    return kExitSuccess;
}

int RunCall(const AppConfig& config, const CliOptions& cli) {
    if (!cli.tool_name) {
        return Fail(MakeError(ErrorCategory::Config, "Call", "Missing tool name for 'call'"),
                    config.json_logs);
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (cli.arguments_json) {
        try {
            arguments = nlohmann::json::parse(*cli.arguments_json);
        } catch (const nlohmann::json::exception& e) {
            return Fail(MakeError(ErrorCategory::Config, "Call",
                                  std::string("--args is not valid JSON: ") + e.what()),
                        config.json_logs);
        }
        if (!arguments.is_object()) {
            return Fail(MakeError(ErrorCategory::Config, "Call", "--args must be a JSON object"),
                        config.json_logs);
        }
    }
    if (cli.content) {
        arguments["content"] = *cli.content;
    }

    auto opened = OpenSession(config);
    if (opened.IsErr()) {
        return Fail(opened.Error(), config.json_logs);
    }
    auto session = std::move(opened).Value();

    auto called = session->CallTool(*cli.tool_name, arguments);
    session->Close();
    if (called.IsErr()) {
        return Fail(called.Error(), config.json_logs);
    }
    const auto& result = called.Value();
    std::cout << ToolResultToJson(result).dump(2) << "\n";
    return result.is_error ? kExitToolError : kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    // Until the configuration is known, warnings go to stderr in color.
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(UseColorLogs()), LogLevel::Warn);

    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        return Fail(cli_result.Error(), false);
    }
    const auto cli = std::move(cli_result).Value();

    auto resolved = ResolveConfig(cli, EnvLookupDefault, SelfExecutable(argv[0]));
    if (resolved.IsErr()) {
        return Fail(resolved.Error(), cli.overrides.json_logs);
    }
    const auto config = std::move(resolved).Value();

    auto valid = ValidateConfig(config, cli.command);
    if (valid.IsErr()) {
        return Fail(valid.Error(), config.json_logs);
    }
    InitLogging(config);
    LogDebug("main", std::string("Command: ") + CommandName(cli.command));

    switch (cli.command) {
        case Command::Serve: return RunServe(config);
        case Command::Api:   return RunApi(config);
        case Command::Tools: return RunTools(config);
        case Command::Call:  return RunCall(config, cli);
    }
    return kExitSuccess;
}

#include <docmcp/api/rest_facade.hpp>

#include <docmcp/core/log.hpp>
#include <docmcp/core/version.hpp>
#include <docmcp/server/document_tools.hpp>

#include <httplib.h>

#include <functional>
#include <thread>

namespace docmcp {

namespace {

constexpr const char* kComponent = "api";
constexpr const char* kJsonType = "application/json";

ApiReply Reply(int status, nlohmann::json body) {
    return ApiReply{status, std::move(body)};
}

// Parses {"content": "<non-empty string>"}; anything else is a 422.
Result<std::string, ApiReply> ParseDocumentRequest(const std::string& request_body) {
    using R = Result<std::string, ApiReply>;
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(request_body);
    } catch (const nlohmann::json::exception& e) {
        return R::Err(Reply(422, {{"detail", std::string("Request body is not valid JSON: ") +
                                                 e.what()}}));
    }
    if (!parsed.is_object()) {
        return R::Err(Reply(422, {{"detail", "Request body must be a JSON object"}}));
    }
    if (!parsed.contains("content") || !parsed["content"].is_string()) {
        return R::Err(Reply(422, {{"detail", "Field 'content' is required and must be a string"}}));
    }
    auto content = parsed["content"].get<std::string>();
    if (content.empty()) {
        return R::Err(Reply(422, {{"detail", "Field 'content' must not be empty"}}));
    }
    return R::Ok(std::move(content));
}

ApiReply FailureReply(const std::string& what, const Error& error) {
    const int status = HttpStatusFor(error);
    std::string detail = "Failed to " + what + ": " + error.message;
    if (status == 503) {
        detail += ". The tool host is unavailable; retry after it reconnects";
    }
    LogError(kComponent, detail);
    return Reply(status, {{"detail", detail}, {"error", error.CategoryName()}});
}

// The tool answers with one text block holding a JSON object.
Result<nlohmann::json, std::string> ParseToolAnswer(const ToolResult& result) {
    using R = Result<nlohmann::json, std::string>;
    const auto text = result.Text();
    try {
        auto parsed = nlohmann::json::parse(text);
        if (parsed.is_object()) {
            return R::Ok(std::move(parsed));
        }
    } catch (const nlohmann::json::exception&) {
        // fall through
    }
    return R::Err(text);
}

// Runs one document tool and shapes its answer with `shape`.
ApiReply RunDocumentTool(IToolSession& session,
                         std::optional<std::chrono::milliseconds> timeout,
                         const std::string& tool, const std::string& what,
                         const std::string& request_body,
                         const std::function<nlohmann::json(const nlohmann::json&,
                                                            const std::string&)>& shape) {
    auto content = ParseDocumentRequest(request_body);
    if (content.IsErr()) {
        return content.Error();
    }

    LogInfo(kComponent, "Processing " + tool + " request");
    auto called = session.CallTool(tool, {{"content", content.Value()}}, timeout);
    if (called.IsErr()) {
        return FailureReply(what, called.Error());
    }

    const auto& result = called.Value();
    auto answer = ParseToolAnswer(result);
    if (result.is_error) {
        std::string message = answer.IsOk() && answer.Value().contains("error") &&
                                      answer.Value()["error"].is_string()
                                  ? answer.Value()["error"].get<std::string>()
                                  : result.Text();
        LogError(kComponent, tool + " reported an error: " + message);
        return Reply(500, {{"detail", "Failed to " + what + ": " + message},
                           {"error", message}});
    }
    if (answer.IsErr()) {
        return Reply(500, {{"detail", "Failed to " + what + ": tool returned unreadable output"},
                           {"error", answer.Error()}});
    }
    return Reply(200, shape(answer.Value(), content.Value()));
}

std::string StringField(const nlohmann::json& object, const char* key,
                        const std::string& fallback) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return fallback;
}

void Send(httplib::Response& res, const ApiReply& reply) {
    res.status = reply.status;
    res.set_content(reply.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    kJsonType);
}

} // anonymous namespace

int HttpStatusFor(const Error& error) {
    if (error.IsTransportFailure()) {
        return 503;
    }
    switch (error.category) {
        case ErrorCategory::InvalidParams:  return 400;
        case ErrorCategory::UnknownTool:
        case ErrorCategory::MethodNotFound: return 404;
        case ErrorCategory::Timeout:        return 504;
        default:                            return 500;
    }
}

RestFacade::RestFacade(IToolSession& session, ApiConfig config,
                       std::optional<std::chrono::milliseconds> call_timeout)
    : session_(session),
      config_(std::move(config)),
      call_timeout_(call_timeout),
      server_(std::make_unique<httplib::Server>()) {}

RestFacade::~RestFacade() {
    Stop();
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------
ApiReply RestFacade::HandleRoot() const {
    return Reply(200, {
        {"name", "MCP Document Processing API"},
        {"version", kVersion},
        {"endpoints",
         {{"health", "/health"},
          {"tools", "/tools"},
          {"recipients", "/api/recipients"},
          {"improve", "/api/improve"}}},
    });
}

ApiReply RestFacade::HandleHealth() const {
    const bool connected = session_.State() == ConnectionState::Connected;
    nlohmann::json names = nlohmann::json::array();
    if (connected) {
        for (const auto& tool : session_.Tools()) {
            names.push_back(tool.name);
        }
    }
    return Reply(200, {
        {"status", connected ? "healthy" : "unhealthy"},
        {"mcp_connected", connected},
        {"available_tools", names},
    });
}

ApiReply RestFacade::HandleTools() const {
    const auto state = session_.State();
    if (state != ConnectionState::Connected) {
        return Reply(503, {{"detail", std::string("Failed to list tools: session is ") +
                                          ConnectionStateName(state) +
                                          "; retry after the tool host reconnects"},
                           {"error", "not_connected"}});
    }
    nlohmann::json tools = nlohmann::json::object();
    for (const auto& tool : session_.Tools()) {
        tools[tool.name] = {{"description", tool.description},
                            {"inputSchema", tool.input_schema}};
    }
    return Reply(200, tools);
}

ApiReply RestFacade::HandleRecipients(const std::string& request_body) {
    return RunDocumentTool(
        session_, call_timeout_, kRecipientToolName, "get recipient suggestions", request_body,
        [](const nlohmann::json& answer, const std::string&) {
            nlohmann::json recipients = nlohmann::json::array();
            if (answer.contains("recipients") && answer["recipients"].is_array()) {
                for (const auto& r : answer["recipients"]) {
                    if (r.is_string()) {
                        recipients.push_back(r);
                    }
                }
            }
            return nlohmann::json{{"recipients", recipients},
                                  {"reasoning", StringField(answer, "reasoning", "")},
                                  {"error", nullptr}};
        });
}

ApiReply RestFacade::HandleImprove(const std::string& request_body) {
    return RunDocumentTool(
        session_, call_timeout_, kImproveToolName, "improve document", request_body,
        [](const nlohmann::json& answer, const std::string& original) {
            return nlohmann::json{
                {"improved_content", StringField(answer, "improved_content", original)},
                {"changes_summary", StringField(answer, "changes_summary", "")},
                {"error", nullptr}};
        });
}

// ---------------------------------------------------------------------------
// HTTP wiring
// ---------------------------------------------------------------------------
void RestFacade::Mount(httplib::Server& server) {
    server.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        Send(res, HandleRoot());
    });
    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        Send(res, HandleHealth());
    });
    server.Get("/tools", [this](const httplib::Request&, httplib::Response& res) {
        Send(res, HandleTools());
    });
    server.Post("/api/recipients", [this](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleRecipients(req.body));
    });
    server.Post("/api/improve", [this](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleImprove(req.body));
    });
    server.set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string message = "unknown error";
            try {
                if (ep) {
                    std::rethrow_exception(ep);
                }
            } catch (const std::exception& e) {
                message = e.what();
            }
            LogError(kComponent, "Unhandled exception on " + req.path + ": " + message);
            Send(res, Reply(500, {{"detail", "An unexpected error occurred"},
                                  {"error", message}}));
        });
    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LogDebug(kComponent, req.method + " " + req.path + " -> " + std::to_string(res.status));
    });
}

Result<void, Error> RestFacade::Serve() {
    Mount(*server_);

    int port = 0;
    if (config_.port == 0) {
        port = server_->bind_to_any_port(config_.host);
    } else if (server_->bind_to_port(config_.host, config_.port)) {
        port = config_.port;
    } else {
        port = -1;
    }
    if (port <= 0) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Config, "Serve",
            "Cannot bind " + config_.host + ":" + std::to_string(config_.port)));
    }
    bound_port_ = port;
    LogInfo(kComponent, "Listening on " + config_.host + ":" + std::to_string(port));

    if (!server_->listen_after_bind()) {
        return Result<void, Error>::Err(MakeError(ErrorCategory::Internal, "Serve",
                                                  "HTTP server stopped unexpectedly"));
    }
    LogInfo(kComponent, "HTTP server stopped");
    return Result<void, Error>::Ok();
}

void RestFacade::Stop() {
    server_->stop();
}

void RestFacade::WaitUntilReady() const {
    while (!server_->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
}

} // namespace docmcp

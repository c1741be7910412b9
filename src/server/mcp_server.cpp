#include <docmcp/server/mcp_server.hpp>

#include <docmcp/core/log.hpp>
#include <docmcp/core/version.hpp>
#include <docmcp/protocol/message_codec.hpp>

#include <string>
#include <utility>

namespace docmcp {

namespace {

constexpr const char* kComponent = "mcp";

nlohmann::json RawError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}},
    };
}

// Echo the id of an envelope we could not decode, if it has a usable one.
nlohmann::json UsableId(const nlohmann::json& message) {
    if (message.is_object() && message.contains("id")) {
        const auto& id = message["id"];
        if (id.is_number_integer() || id.is_string()) {
            return id;
        }
    }
    return nullptr;
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry, McpServerOptions options,
                     std::istream& in, std::ostream& out)
    : registry_(std::move(registry)), options_(std::move(options)), in_(in), out_(out) {}

McpServer::~McpServer() {
    StopWorkers();
}

// ---------------------------------------------------------------------------
// Loop
// ---------------------------------------------------------------------------
void McpServer::Run() {
    StartWorkers();
    LogInfo(kComponent, "Serving " + std::to_string(registry_.Tools().size()) +
                            " tool(s) as '" + options_.name + "'");

    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            LogWarn(kComponent, std::string("Unparseable line: ") + e.what());
            WriteLine(RawError(nullptr, rpc_code::kParseError, "Parse error"));
            continue;
        }

        auto decoded = MessageFromJson(parsed);
        if (decoded.IsErr()) {
            WriteLine(RawError(UsableId(parsed), rpc_code::kInvalidRequest,
                               "Invalid request: " + decoded.Error().message));
            continue;
        }

        const auto& message = decoded.Value();
        const auto* request = std::get_if<Request>(&message);
        if (request != nullptr && request->method == method::kToolsCall && !workers_.empty()) {
            bool queued = false;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                if (queue_.size() < options_.max_queued_calls) {
                    queue_.push_back(*request);
                    queued = true;
                }
            }
            if (queued) {
                queue_cv_.notify_one();
            } else {
                LogWarn(kComponent, "Call queue full, rejecting " + IdToString(request->id));
                WriteLine(MessageToJson(MakeErrorResponse(request->id, rpc_code::kInternalError,
                                                          "Server busy")));
            }
            continue;
        }

        if (auto reply = Dispatch(message)) {
            WriteLine(*reply);
        }
    }

    StopWorkers();
    LogInfo(kComponent, "Input closed, shutting down");
}

std::optional<nlohmann::json> McpServer::HandleMessage(const nlohmann::json& message) {
    auto decoded = MessageFromJson(message);
    if (decoded.IsErr()) {
        return RawError(UsableId(message), rpc_code::kInvalidRequest,
                        "Invalid request: " + decoded.Error().message);
    }
    return Dispatch(decoded.Value());
}

std::optional<nlohmann::json> McpServer::Dispatch(const Message& message) {
    if (const auto* request = std::get_if<Request>(&message)) {
        return MessageToJson(HandleRequest(*request));
    }
    if (const auto* notification = std::get_if<Notification>(&message)) {
        if (notification->method == method::kInitialized) {
            LogDebug(kComponent, "Client finished initialization");
        } else {
            LogDebug(kComponent, "Ignoring notification '" + notification->method + "'");
        }
        return std::nullopt;
    }
    LogDebug(kComponent, "Ignoring response for " + IdToString(std::get<Response>(message).id));
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Methods
// ---------------------------------------------------------------------------
Message McpServer::HandleRequest(const Request& request) {
    if (request.method == method::kInitialize) {
        return HandleInitialize(request);
    }
    if (request.method == method::kToolsList) {
        return HandleToolsList(request);
    }
    if (request.method == method::kToolsCall) {
        return HandleToolsCall(request);
    }
    if (request.method == method::kPing) {
        return MakeResult(request.id, nlohmann::json::object());
    }
    return MakeErrorResponse(request.id, rpc_code::kMethodNotFound,
                             "Method not found: " + request.method);
}

Message McpServer::HandleInitialize(const Request& request) {
    initialized_ = true;
    if (request.params.is_object() && request.params.contains("clientInfo")) {
        LogInfo(kComponent, "Client connected: " + request.params["clientInfo"].dump());
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {{"tools", nlohmann::json::object()}};
    result["serverInfo"] = {{"name", options_.name}, {"version", options_.version}};
    return MakeResult(request.id, result);
}

Message McpServer::HandleToolsList(const Request& request) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& definition : registry_.Tools()) {
        tools.push_back(ToolDefinitionToJson(definition));
    }
    return MakeResult(request.id, {{"tools", tools}});
}

Message McpServer::HandleToolsCall(const Request& request) {
    const auto& params = request.params;
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeErrorResponse(request.id, rpc_code::kInvalidParams,
                                 "Missing 'name' parameter");
    }
    ToolInvocation invocation;
    invocation.tool_name = params["name"].get<std::string>();
    if (!initialized_) {
        LogDebug(kComponent, "tools/call before initialize: " + invocation.tool_name);
    }
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return MakeErrorResponse(request.id, rpc_code::kInvalidParams,
                                     "'arguments' must be an object");
        }
        invocation.arguments = params["arguments"];
    }

    LogDebug(kComponent, "tools/call " + invocation.tool_name + " (id " +
                             IdToString(request.id) + ")");
    auto dispatched = registry_.Dispatch(invocation);
    if (dispatched.IsErr()) {
        const auto& error = dispatched.Error();
        return MakeErrorResponse(request.id, error.WireCode(), error.message, error.data);
    }
    return MakeResult(request.id, ToolResultToJson(dispatched.Value()));
}

// ---------------------------------------------------------------------------
// Output and workers
// ---------------------------------------------------------------------------
void McpServer::WriteLine(const nlohmann::json& value) {
    const auto line =
        value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << line;
    out_.flush();
}

void McpServer::StartWorkers() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!workers_.empty()) {
        return;
    }
    draining_ = false;
    for (int i = 0; i < options_.worker_count; ++i) {
        workers_.emplace_back(&McpServer::WorkerLoop, this);
    }
}

void McpServer::StopWorkers() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        draining_ = true;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void McpServer::WorkerLoop() {
    for (;;) {
        Request request;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || draining_; });
            if (queue_.empty()) {
                return;  // draining and nothing left
            }
            request = std::move(queue_.front());
            queue_.pop_front();
        }
        WriteLine(MessageToJson(HandleToolsCall(request)));
    }
}

} // namespace docmcp

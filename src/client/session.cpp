#include <docmcp/client/session.hpp>

#include <docmcp/client/child_process_transport.hpp>
#include <docmcp/core/log.hpp>
#include <docmcp/core/version.hpp>

#include <future>
#include <utility>

namespace docmcp {

namespace {

constexpr const char* kComponent = "session";

Error NotConnectedError(const std::string& op, ConnectionState state) {
    return MakeError(ErrorCategory::NotConnected, op,
                     std::string("Session is not connected (state: ") +
                         ConnectionStateName(state) + ")");
}

} // anonymous namespace

const char* ConnectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Closing:      return "closing";
        case ConnectionState::Closed:       return "closed";
    }
    return "unknown";
}

Session::Session(std::unique_ptr<ITransport> transport, SessionConfig config)
    : transport_(std::move(transport)), config_(config) {}

Session::~Session() {
    Close();
}

// ---------------------------------------------------------------------------
// Connect
// ---------------------------------------------------------------------------
Result<void, Error> Session::Connect() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        const auto current = state_.load();
        if (current == ConnectionState::Closed || current == ConnectionState::Closing) {
            return Result<void, Error>::Err(NotConnectedError("Connect", current));
        }
        if (current != ConnectionState::Disconnected) {
            return Result<void, Error>::Err(MakeError(
                ErrorCategory::Connect, "Connect",
                std::string("Session is already ") + ConnectionStateName(current)));
        }
        state_ = ConnectionState::Connecting;
        channel_lost_ = false;
        {
            std::lock_guard<std::mutex> info_lock(info_mutex_);
            last_error_.reset();
        }

        auto started = transport_->Start();
        if (started.IsErr()) {
            state_ = ConnectionState::Disconnected;
            LogError(kComponent, started.Error().message);
            return started;
        }
        pump_ = std::make_unique<ResponsePump>(
            *transport_, pending_, config_.malformed_line_threshold,
            [this](const Error& reason) { OnPumpStopped(reason); });
        pump_->Start();
    }

    auto handshake = Handshake();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (handshake.IsOk() && state_.load() == ConnectionState::Connecting &&
        !channel_lost_.load()) {
        state_ = ConnectionState::Connected;
        LogInfo(kComponent, "Connected, " + std::to_string(Tools().size()) +
                                " tool(s) available");
        return Result<void, Error>::Ok();
    }

    std::string cause = handshake.IsErr() ? handshake.Error().message
                                          : std::string("Session closed during connect");
    if (state_.load() == ConnectionState::Connecting) {
        pending_.CancelAll(MakeError(ErrorCategory::ConnectionClosed, "Connect",
                                     "Connect aborted"));
        TeardownLocked();
        state_ = ConnectionState::Disconnected;
    }
    auto error = MakeError(ErrorCategory::Connect, "Connect",
                           "Handshake with tool host failed: " + cause);
    {
        std::lock_guard<std::mutex> info_lock(info_mutex_);
        last_error_ = error;
    }
    LogError(kComponent, error.message);
    return Result<void, Error>::Err(std::move(error));
}

Result<void, Error> Session::Handshake() {
    const nlohmann::json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "docmcp"}, {"version", kVersion}}},
    };
    auto initialized = RoundTrip(method::kInitialize, params, config_.connect_timeout);
    if (initialized.IsErr()) {
        return Result<void, Error>::Err(std::move(initialized).Error());
    }
    const auto& result = initialized.Value();
    if (result.is_object()) {
        if (result.contains("protocolVersion") && result["protocolVersion"].is_string() &&
            result["protocolVersion"].get<std::string>() != kProtocolVersion) {
            LogWarn(kComponent, "Tool host speaks protocol " +
                                    result["protocolVersion"].get<std::string>() +
                                    ", expected " + kProtocolVersion);
        }
        std::lock_guard<std::mutex> lock(info_mutex_);
        server_info_ = result.value("serverInfo", nlohmann::json::object());
    }

    auto notified = transport_->Send(MakeNotification(method::kInitialized));
    if (notified.IsErr()) {
        return notified;
    }

    auto tools = Discover(config_.connect_timeout);
    if (tools.IsErr()) {
        return Result<void, Error>::Err(std::move(tools).Error());
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------
Result<std::vector<ToolDefinition>, Error> Session::ListTools() {
    const auto current = state_.load();
    if (current != ConnectionState::Connected) {
        return Result<std::vector<ToolDefinition>, Error>::Err(
            NotConnectedError("ListTools", current));
    }
    return Discover(config_.request_timeout);
}

Result<std::vector<ToolDefinition>, Error> Session::Discover(
    std::chrono::milliseconds timeout) {
    using R = Result<std::vector<ToolDefinition>, Error>;
    auto listed = RoundTrip(method::kToolsList, nlohmann::json::object(), timeout);
    if (listed.IsErr()) {
        return R::Err(std::move(listed).Error());
    }
    auto tools = ToolListFromJson(listed.Value());
    if (tools.IsErr()) {
        return tools;
    }
    std::lock_guard<std::mutex> lock(info_mutex_);
    tools_ = tools.Value();
    return tools;
}

Result<ToolResult, Error> Session::CallTool(const std::string& name,
                                            const nlohmann::json& arguments,
                                            std::optional<std::chrono::milliseconds> timeout) {
    using R = Result<ToolResult, Error>;
    const auto current = state_.load();
    if (current != ConnectionState::Connected) {
        return R::Err(NotConnectedError("CallTool", current));
    }
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        bool known = false;
        for (const auto& tool : tools_) {
            if (tool.name == name) {
                known = true;
                break;
            }
        }
        if (!known) {
            return R::Err(MakeError(ErrorCategory::UnknownTool, "CallTool",
                                    "Unknown tool: " + name));
        }
    }

    const nlohmann::json params = {{"name", name}, {"arguments", arguments}};
    auto called = RoundTrip(method::kToolsCall, params,
                            timeout.value_or(config_.request_timeout));
    if (called.IsErr()) {
        return R::Err(std::move(called).Error());
    }
    return ToolResultFromJson(called.Value());
}

Result<nlohmann::json, Error> Session::RoundTrip(const std::string& method_name,
                                                 const nlohmann::json& params,
                                                 std::chrono::milliseconds timeout) {
    using R = Result<nlohmann::json, Error>;
    const RequestId id = next_id_.fetch_add(1);
    const auto deadline = PendingRequests::Clock::now() + timeout;

    auto registered = pending_.Register(id, deadline);
    if (registered.IsErr()) {
        return R::Err(std::move(registered).Error());
    }
    auto future = std::move(registered).Value();

    // Close() or the pump may have drained the table just before Register().
    if (!AcceptingRequests()) {
        pending_.Cancel(id, NotConnectedError(method_name, state_.load()));
        return future.get();
    }

    auto sent = transport_->Send(MakeRequest(id, method_name, params));
    if (sent.IsErr()) {
        pending_.Cancel(id, std::move(sent).Error());
        return future.get();
    }

    if (future.wait_until(deadline) == std::future_status::timeout) {
        // A resolution racing the deadline wins; the cancel is then a no-op.
        if (pending_.Cancel(id, MakeError(ErrorCategory::Timeout, method_name,
                                          "No response to request " + IdToString(id) +
                                              " within " +
                                              std::to_string(timeout.count()) + " ms"))) {
            LogWarn(kComponent, "Request " + IdToString(id) + " (" + method_name +
                                    ") timed out");
        }
    }
    return future.get();
}

bool Session::AcceptingRequests() const {
    const auto current = state_.load();
    return !channel_lost_.load() && (current == ConnectionState::Connecting ||
                                     current == ConnectionState::Connected);
}

// ---------------------------------------------------------------------------
// Shutdown
// ---------------------------------------------------------------------------
void Session::OnPumpStopped(const Error& reason) {
    channel_lost_ = true;
    auto expected = ConnectionState::Connected;
    const bool was_connected =
        state_.compare_exchange_strong(expected, ConnectionState::Closed);
    if (was_connected || expected == ConnectionState::Connecting) {
        std::lock_guard<std::mutex> lock(info_mutex_);
        last_error_ = reason;
    }
    if (was_connected) {
        LogWarn(kComponent, "Connection lost: " + reason.message);
    }
}

void Session::Close() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    const auto current = state_.load();
    if (current == ConnectionState::Closed && !pump_) {
        return;
    }
    if (current != ConnectionState::Closed) {
        state_ = ConnectionState::Closing;
    }

    const auto reason = MakeError(ErrorCategory::ConnectionClosed, "Close", "Session closed");
    pending_.CancelAll(reason);
    TeardownLocked();
    pending_.CancelAll(reason);

    state_ = ConnectionState::Closed;
    if (current != ConnectionState::Disconnected && current != ConnectionState::Closed) {
        LogInfo(kComponent, "Closed");
    }
}

void Session::TeardownLocked() {
    transport_->Stop();
    if (pump_) {
        pump_->Join();
        retired_orphans_ += pump_->OrphanCount();
        pump_.reset();
    }
    if (auto code = transport_->ExitCode()) {
        LogDebug(kComponent, "Tool host exited with status " + std::to_string(*code));
    }
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
std::size_t Session::OrphanCount() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return retired_orphans_ + (pump_ ? pump_->OrphanCount() : 0);
}

ConnectionState Session::State() const {
    return state_.load();
}

std::vector<ToolDefinition> Session::Tools() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return tools_;
}

std::optional<Error> Session::LastError() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return last_error_;
}

nlohmann::json Session::ServerInfo() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return server_info_;
}

std::unique_ptr<Session> MakeStdioSession(ServerLaunchConfig launch, SessionConfig config) {
    auto transport =
        std::make_unique<ChildProcessTransport>(std::move(launch), config.shutdown_grace);
    return std::make_unique<Session>(std::move(transport), config);
}

} // namespace docmcp

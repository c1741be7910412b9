#pragma once

#include <docmcp/client/pending_requests.hpp>
#include <docmcp/client/response_pump.hpp>
#include <docmcp/client/tool_session.hpp>
#include <docmcp/client/transport.hpp>
#include <docmcp/config/app_config.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace docmcp {

// ---------------------------------------------------------------------------
// Session: one client connection to a tool host.
//
// Owns the transport, the correlation table and the response pump. Any
// number of threads may call ListTools()/CallTool() concurrently; each call
// blocks only its own caller. Connect() and Close() are serialized.
//
//   Disconnected -> Connecting -> Connected -> Closing -> Closed
//
// A Connecting session whose handshake fails goes back to Disconnected. A
// lost transport moves a Connected session straight to Closed.
// ---------------------------------------------------------------------------
class Session : public IToolSession {
public:
    Session(std::unique_ptr<ITransport> transport, SessionConfig config);
    ~Session() override;

    // Launch the transport, run the initialize handshake and discover tools.
    // Fails with Launch when the tool host could not be started and with
    // Connect for any later failure.
    [[nodiscard]] Result<void, Error> Connect();

    // Fail every pending call with ConnectionClosed and stop the tool host.
    // Idempotent.
    void Close();

    [[nodiscard]] ConnectionState State() const override;
    [[nodiscard]] std::vector<ToolDefinition> Tools() const override;
    [[nodiscard]] Result<std::vector<ToolDefinition>, Error> ListTools() override;
    [[nodiscard]] Result<ToolResult, Error> CallTool(
        const std::string& name,
        const nlohmann::json& arguments,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;

    // Reason the connection ended, if it ended abnormally.
    [[nodiscard]] std::optional<Error> LastError() const;

    // `serverInfo` reported by the tool host during initialize.
    [[nodiscard]] nlohmann::json ServerInfo() const;

    [[nodiscard]] std::size_t PendingCount() const { return pending_.Size(); }

    // Responses that matched no pending call (late replies to timed out or
    // cancelled calls), over the life of the session.
    [[nodiscard]] std::size_t OrphanCount() const;

private:
    Result<nlohmann::json, Error> RoundTrip(const std::string& method,
                                            const nlohmann::json& params,
                                            std::chrono::milliseconds timeout);
    Result<void, Error> Handshake();
    Result<std::vector<ToolDefinition>, Error> Discover(std::chrono::milliseconds timeout);
    bool AcceptingRequests() const;
    void OnPumpStopped(const Error& reason);
    // Stop the transport and join the pump. Caller holds lifecycle_mutex_.
    void TeardownLocked();

    std::unique_ptr<ITransport> transport_;
    SessionConfig config_;
    PendingRequests pending_;
    std::unique_ptr<ResponsePump> pump_;

    mutable std::mutex lifecycle_mutex_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<bool> channel_lost_{false};
    std::atomic<int64_t> next_id_{1};
    // Orphans counted by pumps that have already been torn down.
    std::size_t retired_orphans_ = 0;

    mutable std::mutex info_mutex_;
    std::vector<ToolDefinition> tools_;
    nlohmann::json server_info_ = nlohmann::json::object();
    std::optional<Error> last_error_;
};

// Session over a freshly spawned tool host process.
std::unique_ptr<Session> MakeStdioSession(ServerLaunchConfig launch, SessionConfig config);

} // namespace docmcp

#pragma once

#include <docmcp/client/tool_session.hpp>
#include <docmcp/config/app_config.hpp>
#include <docmcp/core/result.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace httplib {
class Server;
} // namespace httplib

namespace docmcp {

// A handler's answer: HTTP status and JSON body.
struct ApiReply {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();
};

// HTTP status for a failed CallTool/ListTools.
int HttpStatusFor(const Error& error);

// ---------------------------------------------------------------------------
// RestFacade: HTTP/JSON front end for the document tools.
//
//   GET  /                 API info
//   GET  /health           connection status and tool names
//   GET  /tools            discovered tools
//   POST /api/recipients   {content} -> get_recipient_suggestion
//   POST /api/improve      {content} -> improve_document
//
// The session is borrowed and must outlive the façade. Handle*() are plain
// request -> reply functions; Mount() wires them into an httplib::Server.
// ---------------------------------------------------------------------------
class RestFacade {
public:
    explicit RestFacade(IToolSession& session,
                        ApiConfig config = {},
                        std::optional<std::chrono::milliseconds> call_timeout = std::nullopt);
    ~RestFacade();

    RestFacade(const RestFacade&) = delete;
    RestFacade& operator=(const RestFacade&) = delete;

    [[nodiscard]] ApiReply HandleRoot() const;
    [[nodiscard]] ApiReply HandleHealth() const;
    [[nodiscard]] ApiReply HandleTools() const;
    [[nodiscard]] ApiReply HandleRecipients(const std::string& request_body);
    [[nodiscard]] ApiReply HandleImprove(const std::string& request_body);

    void Mount(httplib::Server& server);

    // Bind to config.host:config.port (0 picks a free port) and serve until
    // Stop(). Fails with Config when the address cannot be bound.
    [[nodiscard]] Result<void, Error> Serve();
    void Stop();

    // Port actually bound by Serve(); 0 before binding.
    [[nodiscard]] int BoundPort() const noexcept { return bound_port_.load(); }

    // Block until Serve() is accepting connections.
    void WaitUntilReady() const;

private:
    IToolSession& session_;
    ApiConfig config_;
    std::optional<std::chrono::milliseconds> call_timeout_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<int> bound_port_{0};
};

} // namespace docmcp

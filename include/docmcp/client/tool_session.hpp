#pragma once

#include <docmcp/core/result.hpp>
#include <docmcp/protocol/tool_types.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docmcp {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Closing,
    Closed,
};

const char* ConnectionStateName(ConnectionState state);

// ---------------------------------------------------------------------------
// IToolSession: what the REST façade needs from a tool host connection.
//
// Abstract so the façade can be tested with a hand-written fake and no child
// process.
// ---------------------------------------------------------------------------
class IToolSession {
public:
    virtual ~IToolSession() = default;

    IToolSession(const IToolSession&) = delete;
    IToolSession& operator=(const IToolSession&) = delete;
    IToolSession(IToolSession&&) = delete;
    IToolSession& operator=(IToolSession&&) = delete;

    [[nodiscard]] virtual ConnectionState State() const = 0;

    // Tools discovered during the last successful ListTools/Connect.
    [[nodiscard]] virtual std::vector<ToolDefinition> Tools() const = 0;

    [[nodiscard]] virtual Result<std::vector<ToolDefinition>, Error> ListTools() = 0;

    // `timeout` overrides the session's default request timeout.
    [[nodiscard]] virtual Result<ToolResult, Error> CallTool(
        const std::string& name,
        const nlohmann::json& arguments,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;

protected:
    IToolSession() = default;
};

} // namespace docmcp

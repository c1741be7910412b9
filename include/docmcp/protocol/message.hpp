#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace docmcp {

// ---------------------------------------------------------------------------
// RequestId: caller-assigned correlation identifier (integer or string).
// ---------------------------------------------------------------------------
using RequestId = std::variant<int64_t, std::string>;

std::string IdToString(const RequestId& id);

nlohmann::json IdToJson(const RequestId& id);

// ---------------------------------------------------------------------------
// RpcError: the "error" member of a JSON-RPC response.
// ---------------------------------------------------------------------------
struct RpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message &&
               data == other.data;
    }
    bool operator!=(const RpcError& other) const { return !(*this == other); }
};

struct Request {
    RequestId id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    bool operator==(const Request& other) const {
        return id == other.id && method == other.method &&
               params == other.params;
    }
    bool operator!=(const Request& other) const { return !(*this == other); }
};

// A response carries either a result or an error, never both.
struct Response {
    RequestId id;
    std::variant<nlohmann::json, RpcError> payload;

    [[nodiscard]] bool IsError() const noexcept { return payload.index() == 1; }
    [[nodiscard]] const nlohmann::json& ResultPayload() const { return std::get<0>(payload); }
    [[nodiscard]] const RpcError& ErrorPayload() const { return std::get<1>(payload); }

    bool operator==(const Response& other) const {
        return id == other.id && payload == other.payload;
    }
    bool operator!=(const Response& other) const { return !(*this == other); }
};

struct Notification {
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    bool operator==(const Notification& other) const {
        return method == other.method && params == other.params;
    }
    bool operator!=(const Notification& other) const { return !(*this == other); }
};

using Message = std::variant<Request, Response, Notification>;

// -- Constructors -----------------------------------------------------------

Message MakeRequest(RequestId id, std::string method,
                    nlohmann::json params = nlohmann::json::object());

Message MakeResult(RequestId id, nlohmann::json result);

Message MakeErrorResponse(RequestId id, int code, std::string message,
                          std::optional<nlohmann::json> data = std::nullopt);

Message MakeNotification(std::string method,
                         nlohmann::json params = nlohmann::json::object());

// Method names on the wire.
namespace method {
constexpr const char* kInitialize  = "initialize";
constexpr const char* kInitialized = "notifications/initialized";
constexpr const char* kToolsList   = "tools/list";
constexpr const char* kToolsCall   = "tools/call";
constexpr const char* kPing        = "ping";
} // namespace method

} // namespace docmcp

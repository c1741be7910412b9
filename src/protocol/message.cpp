#include <docmcp/protocol/message.hpp>

#include <utility>

namespace docmcp {

std::string IdToString(const RequestId& id) {
    if (std::holds_alternative<int64_t>(id)) {
        return std::to_string(std::get<int64_t>(id));
    }
    return "\"" + std::get<std::string>(id) + "\"";
}

nlohmann::json IdToJson(const RequestId& id) {
    if (std::holds_alternative<int64_t>(id)) {
        return std::get<int64_t>(id);
    }
    return std::get<std::string>(id);
}

Message MakeRequest(RequestId id, std::string method, nlohmann::json params) {
    return Request{std::move(id), std::move(method), std::move(params)};
}

Message MakeResult(RequestId id, nlohmann::json result) {
    return Response{std::move(id),
                    std::variant<nlohmann::json, RpcError>(
                        std::in_place_index<0>, std::move(result))};
}

Message MakeErrorResponse(RequestId id, int code, std::string message,
                          std::optional<nlohmann::json> data) {
    return Response{std::move(id),
                    std::variant<nlohmann::json, RpcError>(
                        std::in_place_index<1>,
                        RpcError{code, std::move(message), std::move(data)})};
}

Message MakeNotification(std::string method, nlohmann::json params) {
    return Notification{std::move(method), std::move(params)};
}

} // namespace docmcp

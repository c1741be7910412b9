#include <docmcp/core/result.hpp>

#include <sstream>

namespace docmcp {

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Launch:           return "launch";
        case ErrorCategory::TransportClosed:  return "transport_closed";
        case ErrorCategory::ConnectionLost:   return "connection_lost";
        case ErrorCategory::MalformedMessage: return "malformed_message";
        case ErrorCategory::InvalidRequest:   return "invalid_request";
        case ErrorCategory::MethodNotFound:   return "method_not_found";
        case ErrorCategory::InvalidParams:    return "invalid_params";
        case ErrorCategory::DuplicateId:      return "duplicate_id";
        case ErrorCategory::ToolFailure:      return "tool_failure";
        case ErrorCategory::NotConnected:     return "not_connected";
        case ErrorCategory::UnknownTool:      return "unknown_tool";
        case ErrorCategory::Timeout:          return "timeout";
        case ErrorCategory::ConnectionClosed: return "connection_closed";
        case ErrorCategory::Cancelled:        return "cancelled";
        case ErrorCategory::Connect:          return "connect";
        case ErrorCategory::Upstream:         return "upstream";
        case ErrorCategory::Config:           return "config";
        case ErrorCategory::Internal:         return "internal";
    }
    return "internal";
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::ToolFailure:      return 1;
        case ErrorCategory::Config:           return 2;
        case ErrorCategory::Launch:           return 3;
        case ErrorCategory::Connect:          return 4;
        case ErrorCategory::TransportClosed:
        case ErrorCategory::ConnectionLost:
        case ErrorCategory::ConnectionClosed:
        case ErrorCategory::NotConnected:     return 5;
        case ErrorCategory::MalformedMessage:
        case ErrorCategory::InvalidRequest:
        case ErrorCategory::MethodNotFound:
        case ErrorCategory::InvalidParams:
        case ErrorCategory::DuplicateId:      return 6;
        case ErrorCategory::UnknownTool:      return 7;
        case ErrorCategory::Upstream:         return 8;
        case ErrorCategory::Timeout:
        case ErrorCategory::Cancelled:        return 10;
        case ErrorCategory::Internal:         return 99;
    }
    return 99;
}

int Error::WireCode() const {
    if (rpc_code.has_value()) {
        return *rpc_code;
    }
    switch (category) {
        case ErrorCategory::MalformedMessage: return rpc_code::kParseError;
        case ErrorCategory::InvalidRequest:
        case ErrorCategory::DuplicateId:      return rpc_code::kInvalidRequest;
        case ErrorCategory::MethodNotFound:
        case ErrorCategory::UnknownTool:      return rpc_code::kMethodNotFound;
        case ErrorCategory::InvalidParams:    return rpc_code::kInvalidParams;
        default:                              return rpc_code::kInternalError;
    }
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (rpc_code.has_value()) {
        oss << " (rpc " << *rpc_code << ")";
    }
    oss << ": " << message;
    return oss.str();
}

nlohmann::json Error::ToJson() const {
    nlohmann::json inner = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (rpc_code.has_value()) {
        inner["code"] = *rpc_code;
    }
    if (data.has_value()) {
        inner["data"] = *data;
    }
    return {{"error", inner}};
}

Error MakeError(ErrorCategory category, std::string operation,
                std::string message) {
    return Error{std::move(operation), std::move(message), category,
                 std::nullopt, std::nullopt};
}

Error ErrorFromRpc(int code, const std::string& message,
                   const std::optional<nlohmann::json>& data) {
    ErrorCategory category = ErrorCategory::Internal;
    switch (code) {
        case rpc_code::kParseError:     category = ErrorCategory::MalformedMessage; break;
        case rpc_code::kInvalidRequest: category = ErrorCategory::InvalidRequest;   break;
        case rpc_code::kMethodNotFound: category = ErrorCategory::MethodNotFound;   break;
        case rpc_code::kInvalidParams:  category = ErrorCategory::InvalidParams;    break;
        default: break;
    }
    return Error{"RemoteCall", message, category, code, data};
}

} // namespace docmcp

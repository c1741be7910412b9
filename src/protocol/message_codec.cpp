#include <docmcp/protocol/message_codec.hpp>

#include <cstdint>
#include <limits>
#include <utility>

namespace docmcp {

namespace {

constexpr const char* kJsonRpcVersion = "2.0";

Error MakeMalformed(const std::string& message) {
    Error err = MakeError(ErrorCategory::MalformedMessage, "DecodeMessage", message);
    err.rpc_code = rpc_code::kParseError;
    return err;
}

Result<RequestId, Error> ParseId(const nlohmann::json& id) {
    if (id.is_number_unsigned() &&
        id.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return Result<RequestId, Error>::Err(MakeMalformed("'id' is out of range"));
    }
    if (id.is_number_integer()) {
        return Result<RequestId, Error>::Ok(RequestId{id.get<int64_t>()});
    }
    if (id.is_string()) {
        return Result<RequestId, Error>::Ok(RequestId{id.get<std::string>()});
    }
    return Result<RequestId, Error>::Err(
        MakeMalformed("'id' must be an integer or a string, got " +
                      std::string(id.type_name())));
}

bool FitsInt(const nlohmann::json& number) {
    if (number.is_number_unsigned()) {
        return number.get<uint64_t>() <=
               static_cast<uint64_t>(std::numeric_limits<int>::max());
    }
    const auto value = number.get<int64_t>();
    return value >= std::numeric_limits<int>::min() &&
           value <= std::numeric_limits<int>::max();
}

nlohmann::json ParamsOrEmpty(const nlohmann::json& object) {
    auto it = object.find("params");
    if (it == object.end() || it->is_null()) {
        return nlohmann::json::object();
    }
    return *it;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------
nlohmann::json MessageToJson(const Message& message) {
    nlohmann::json out = {{"jsonrpc", kJsonRpcVersion}};

    if (const auto* request = std::get_if<Request>(&message)) {
        out["id"] = IdToJson(request->id);
        out["method"] = request->method;
        out["params"] = request->params;
    } else if (const auto* response = std::get_if<Response>(&message)) {
        out["id"] = IdToJson(response->id);
        if (response->IsError()) {
            const auto& error = response->ErrorPayload();
            nlohmann::json error_json = {
                {"code", error.code},
                {"message", error.message},
            };
            if (error.data.has_value()) {
                error_json["data"] = *error.data;
            }
            out["error"] = std::move(error_json);
        } else {
            out["result"] = response->ResultPayload();
        }
    } else {
        const auto& notification = std::get<Notification>(message);
        out["method"] = notification.method;
        out["params"] = notification.params;
    }
    return out;
}

std::string EncodeMessage(const Message& message) {
    // Invalid UTF-8 in tool output is replaced instead of throwing, which
    // keeps encoding total.
    auto line = MessageToJson(message).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------
Result<Message, Error> MessageFromJson(const nlohmann::json& value) {
    if (!value.is_object()) {
        return Result<Message, Error>::Err(
            MakeMalformed("Message must be a JSON object"));
    }

    auto version = value.find("jsonrpc");
    if (version == value.end() || !version->is_string() ||
        version->get<std::string>() != kJsonRpcVersion) {
        return Result<Message, Error>::Err(
            MakeMalformed("Missing or unsupported 'jsonrpc' version"));
    }

    auto method = value.find("method");
    auto id = value.find("id");

    // -- Request / Notification ----------------------------------------------
    if (method != value.end()) {
        if (!method->is_string()) {
            return Result<Message, Error>::Err(
                MakeMalformed("'method' must be a string"));
        }
        auto params = ParamsOrEmpty(value);
        if (!params.is_object() && !params.is_array()) {
            return Result<Message, Error>::Err(
                MakeMalformed("'params' must be an object or an array"));
        }
        if (id == value.end()) {
            return Result<Message, Error>::Ok(
                Notification{method->get<std::string>(), std::move(params)});
        }
        auto parsed_id = ParseId(*id);
        if (parsed_id.IsErr()) {
            return Result<Message, Error>::Err(std::move(parsed_id).Error());
        }
        return Result<Message, Error>::Ok(
            Request{std::move(parsed_id).Value(), method->get<std::string>(),
                    std::move(params)});
    }

    // -- Response -------------------------------------------------------------
    if (id == value.end() || id->is_null()) {
        return Result<Message, Error>::Err(
            MakeMalformed("Response without a usable 'id'"));
    }
    auto parsed_id = ParseId(*id);
    if (parsed_id.IsErr()) {
        return Result<Message, Error>::Err(std::move(parsed_id).Error());
    }

    const bool has_result = value.contains("result");
    const bool has_error = value.contains("error");
    if (has_result == has_error) {
        return Result<Message, Error>::Err(MakeMalformed(
            "Response must carry exactly one of 'result' or 'error'"));
    }

    if (has_result) {
        return Result<Message, Error>::Ok(
            MakeResult(std::move(parsed_id).Value(), value["result"]));
    }

    const auto& error = value["error"];
    if (!error.is_object() ||
        !error.contains("code") || !error["code"].is_number_integer() ||
        !error.contains("message") || !error["message"].is_string()) {
        return Result<Message, Error>::Err(MakeMalformed(
            "'error' must be an object with integer 'code' and string 'message'"));
    }
    if (!FitsInt(error["code"])) {
        return Result<Message, Error>::Err(MakeMalformed("'error.code' is out of range"));
    }
    std::optional<nlohmann::json> data;
    if (error.contains("data")) {
        data = error["data"];
    }
    return Result<Message, Error>::Ok(MakeErrorResponse(
        std::move(parsed_id).Value(), error["code"].get<int>(),
        error["message"].get<std::string>(), std::move(data)));
}

Result<Message, Error> DecodeMessage(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return Result<Message, Error>::Err(MakeMalformed("Empty line"));
    }

    nlohmann::json value;
    try {
        value = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Result<Message, Error>::Err(
            MakeMalformed(std::string("JSON parse error: ") + e.what()));
    }
    return MessageFromJson(value);
}

} // namespace docmcp

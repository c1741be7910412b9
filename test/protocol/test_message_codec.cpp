#include <catch2/catch_test_macros.hpp>

#include <docmcp/protocol/message_codec.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

using namespace docmcp;

// ===========================================================================
// Encoding
// ===========================================================================

TEST_CASE("EncodeMessage: one compact line per message", "[protocol][codec]") {
    auto line = EncodeMessage(MakeRequest(RequestId{int64_t{1}}, "tools/call",
                                          {{"name", "improve_document"},
                                           {"arguments", {{"content", "a\nb"}}}}));
    REQUIRE(line.back() == '\n');
    CHECK(line.find('\n') == line.size() - 1);

    auto j = nlohmann::json::parse(line);
    CHECK(j["jsonrpc"] == "2.0");
    CHECK(j["id"] == 1);
    CHECK(j["method"] == "tools/call");
    CHECK(j["params"]["arguments"]["content"] == "a\nb");
}

TEST_CASE("EncodeMessage: error response carries code, message and data", "[protocol][codec]") {
    auto line = EncodeMessage(MakeErrorResponse(RequestId{std::string("abc")}, -32602,
                                                "bad", nlohmann::json{{"path", "x"}}));
    auto j = nlohmann::json::parse(line);
    CHECK(j["id"] == "abc");
    CHECK(j["error"]["code"] == -32602);
    CHECK(j["error"]["message"] == "bad");
    CHECK(j["error"]["data"]["path"] == "x");
    CHECK_FALSE(j.contains("result"));
}

TEST_CASE("EncodeMessage: notification has no id", "[protocol][codec]") {
    auto j = nlohmann::json::parse(EncodeMessage(MakeNotification(method::kInitialized)));
    CHECK_FALSE(j.contains("id"));
    CHECK(j["method"] == "notifications/initialized");
}

TEST_CASE("EncodeMessage: invalid UTF-8 is replaced, not thrown", "[protocol][codec]") {
    std::string line;
    REQUIRE_NOTHROW(line = EncodeMessage(
                        MakeResult(RequestId{int64_t{2}}, {{"text", std::string("x\xff")}})));
    CHECK(line.back() == '\n');
}

TEST_CASE("Codec: messages survive encode and decode", "[protocol][codec]") {
    const Message samples[] = {
        MakeRequest(RequestId{int64_t{7}}, "tools/list"),
        MakeRequest(RequestId{std::string("req-1")}, "ping", nlohmann::json::array({1, 2})),
        MakeResult(RequestId{int64_t{7}}, {{"tools", nlohmann::json::array()}}),
        MakeErrorResponse(RequestId{int64_t{8}}, -32601, "Method not found: x"),
        MakeNotification("notifications/progress", {{"p", 0.5}}),
    };
    for (const auto& message : samples) {
        auto decoded = DecodeMessage(EncodeMessage(message));
        REQUIRE(decoded.IsOk());
        CHECK(decoded.Value() == message);
    }
}

// ===========================================================================
// Decoding
// ===========================================================================

TEST_CASE("DecodeMessage: classifies request, response and notification", "[protocol][codec]") {
    auto request = DecodeMessage(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})");
    REQUIRE(request.IsOk());
    REQUIRE(std::holds_alternative<Request>(request.Value()));
    CHECK(std::get<Request>(request.Value()).params == nlohmann::json::object());

    auto response = DecodeMessage(R"({"jsonrpc":"2.0","id":"a","result":{"ok":true}})");
    REQUIRE(response.IsOk());
    const auto& r = std::get<Response>(response.Value());
    CHECK(r.id == RequestId{std::string("a")});
    CHECK_FALSE(r.IsError());
    CHECK(r.ResultPayload()["ok"] == true);

    auto notification = DecodeMessage(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    REQUIRE(notification.IsOk());
    CHECK(std::holds_alternative<Notification>(notification.Value()));
}

TEST_CASE("DecodeMessage: tolerates CRLF and null params", "[protocol][codec]") {
    auto decoded = DecodeMessage("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\",\"params\":null}\r\n");
    REQUIRE(decoded.IsOk());
    CHECK(std::get<Request>(decoded.Value()).params.is_object());
}

TEST_CASE("DecodeMessage: error response", "[protocol][codec]") {
    auto decoded = DecodeMessage(
        R"({"jsonrpc":"2.0","id":4,"error":{"code":-32602,"message":"bad","data":[1]}})");
    REQUIRE(decoded.IsOk());
    const auto& r = std::get<Response>(decoded.Value());
    REQUIRE(r.IsError());
    CHECK(r.ErrorPayload().code == -32602);
    CHECK(r.ErrorPayload().message == "bad");
    REQUIRE(r.ErrorPayload().data.has_value());
    CHECK((*r.ErrorPayload().data)[0] == 1);
}

TEST_CASE("DecodeMessage: malformed inputs", "[protocol][codec]") {
    const char* bad[] = {
        "",
        "not json",
        "[1,2,3]",
        R"({"id":1,"method":"ping"})",
        R"({"jsonrpc":"1.0","id":1,"method":"ping"})",
        R"({"jsonrpc":"2.0","id":1,"method":5})",
        R"({"jsonrpc":"2.0","id":1,"method":"x","params":"str"})",
        R"({"jsonrpc":"2.0","id":1.5,"method":"x"})",
        R"({"jsonrpc":"2.0","id":{},"method":"x"})",
        R"({"jsonrpc":"2.0","result":{}})",
        R"({"jsonrpc":"2.0","id":null,"result":{}})",
        R"({"jsonrpc":"2.0","id":1})",
        R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"m"}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"message":"m"}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":1}})",
    };
    for (const auto* line : bad) {
        INFO(line);
        auto decoded = DecodeMessage(line);
        REQUIRE(decoded.IsErr());
        CHECK(decoded.Error().category == ErrorCategory::MalformedMessage);
        CHECK(decoded.Error().rpc_code == rpc_code::kParseError);
    }
}

TEST_CASE("DecodeMessage: out-of-range numbers are rejected, not wrapped", "[protocol][codec]") {
    const char* bad[] = {
        R"({"jsonrpc":"2.0","id":18446744073709551615,"method":"ping"})",
        R"({"jsonrpc":"2.0","id":9223372036854775808,"result":{}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":4294967296,"message":"m"}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-2147483649,"message":"m"}})",
    };
    for (const auto* line : bad) {
        INFO(line);
        auto decoded = DecodeMessage(line);
        REQUIRE(decoded.IsErr());
        CHECK(decoded.Error().category == ErrorCategory::MalformedMessage);
    }

    auto largest = DecodeMessage(R"({"jsonrpc":"2.0","id":9223372036854775807,"method":"ping"})");
    REQUIRE(largest.IsOk());
    CHECK(std::get<Request>(largest.Value()).id ==
          RequestId{std::numeric_limits<int64_t>::max()});
}

// ===========================================================================
// Id helpers
// ===========================================================================

TEST_CASE("IdToString: string ids are quoted", "[protocol]") {
    CHECK(IdToString(RequestId{int64_t{42}}) == "42");
    CHECK(IdToString(RequestId{std::string("42")}) == "\"42\"");
}

TEST_CASE("RequestId: integer and string ids are distinct", "[protocol]") {
    CHECK(RequestId{int64_t{1}} != RequestId{std::string("1")});
}

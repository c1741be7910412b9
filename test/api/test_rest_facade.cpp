#include <catch2/catch_test_macros.hpp>

#include <docmcp/api/rest_facade.hpp>
#include <docmcp/server/document_tools.hpp>
#include "../../test/mocks/fake_tool_session.hpp"

#include <httplib.h>

#include <thread>

using namespace docmcp;
using namespace docmcp::testing;
using nlohmann::json;

namespace {

ToolDefinition DocumentTool(const std::string& name) {
    return ToolDefinition{name, "Document tool",
                          json{{"type", "object"},
                               {"properties", {{"content", {{"type", "string"}}}}},
                               {"required", json::array({"content"})}}};
}

void Connect(FakeToolSession& session) {
    session.SetState(ConnectionState::Connected);
    session.SetTools({DocumentTool(kRecipientToolName), DocumentTool(kImproveToolName)});
}

Result<ToolResult, Error> Answer(const json& body, bool is_error = false) {
    return Result<ToolResult, Error>::Ok(is_error ? ErrorResult(body.dump())
                                                  : TextResult(body.dump()));
}

Result<ToolResult, Error> Failure(ErrorCategory category, const std::string& message) {
    return Result<ToolResult, Error>::Err(MakeError(category, "CallTool", message));
}

} // anonymous namespace

// ===========================================================================
// Status mapping
// ===========================================================================

TEST_CASE("HttpStatusFor: maps error categories", "[api]") {
    CHECK(HttpStatusFor(MakeError(ErrorCategory::NotConnected, "", "")) == 503);
    CHECK(HttpStatusFor(MakeError(ErrorCategory::ConnectionLost, "", "")) == 503);
    CHECK(HttpStatusFor(MakeError(ErrorCategory::ConnectionClosed, "", "")) == 503);
    CHECK(HttpStatusFor(MakeError(ErrorCategory::InvalidParams, "", "")) == 400);
    CHECK(HttpStatusFor(MakeError(ErrorCategory::UnknownTool, "", "")) == 404);
    CHECK(HttpStatusFor(MakeError(ErrorCategory::Timeout, "", "")) == 504);
    CHECK(HttpStatusFor(MakeError(ErrorCategory::Internal, "", "")) == 500);
}

// ===========================================================================
// Info endpoints
// ===========================================================================

TEST_CASE("RestFacade: root lists the endpoints", "[api]") {
    FakeToolSession session;
    RestFacade facade(session);
    auto reply = facade.HandleRoot();
    CHECK(reply.status == 200);
    CHECK(reply.body["name"] == "MCP Document Processing API");
    CHECK(reply.body["endpoints"]["recipients"] == "/api/recipients");
    CHECK(reply.body["endpoints"]["improve"] == "/api/improve");
}

TEST_CASE("RestFacade: health reflects the session", "[api]") {
    FakeToolSession session;
    Connect(session);
    RestFacade facade(session);

    auto healthy = facade.HandleHealth();
    CHECK(healthy.status == 200);
    CHECK(healthy.body["status"] == "healthy");
    CHECK(healthy.body["mcp_connected"] == true);
    CHECK(healthy.body["available_tools"] ==
          json::array({kRecipientToolName, kImproveToolName}));

    session.SetState(ConnectionState::Closed);
    auto unhealthy = facade.HandleHealth();
    CHECK(unhealthy.status == 200);
    CHECK(unhealthy.body["status"] == "unhealthy");
    CHECK(unhealthy.body["mcp_connected"] == false);
    CHECK(unhealthy.body["available_tools"].empty());
}

TEST_CASE("RestFacade: tools maps names to descriptions and schemas", "[api]") {
    FakeToolSession session;
    Connect(session);
    RestFacade facade(session);

    auto reply = facade.HandleTools();
    CHECK(reply.status == 200);
    REQUIRE(reply.body.contains(kImproveToolName));
    CHECK(reply.body[kImproveToolName]["description"] == "Document tool");
    CHECK(reply.body[kImproveToolName]["inputSchema"]["type"] == "object");
}

TEST_CASE("RestFacade: tools is unavailable without a connection", "[api]") {
    FakeToolSession session;
    session.SetState(ConnectionState::Disconnected);
    RestFacade facade(session);
    auto reply = facade.HandleTools();
    CHECK(reply.status == 503);
    CHECK(reply.body["error"] == "not_connected");
}

// ===========================================================================
// Document endpoints
// ===========================================================================

TEST_CASE("RestFacade: recipients forwards the content and shapes the answer", "[api]") {
    FakeToolSession session;
    Connect(session);
    session.EnqueueCall(Answer({{"recipients", json::array({"Legal"})}, {"reasoning", "contract"}}));
    RestFacade facade(session, ApiConfig{}, std::chrono::milliseconds{1234});

    auto reply = facade.HandleRecipients(R"({"content": "NDA draft"})");
    CHECK(reply.status == 200);
    CHECK(reply.body["recipients"] == json::array({"Legal"}));
    CHECK(reply.body["reasoning"] == "contract");
    CHECK(reply.body["error"].is_null());

    auto calls = session.Calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].name == kRecipientToolName);
    CHECK(calls[0].arguments == json{{"content", "NDA draft"}});
    REQUIRE(calls[0].timeout.has_value());
    CHECK(calls[0].timeout->count() == 1234);
}

TEST_CASE("RestFacade: improve returns the improved content", "[api]") {
    FakeToolSession session;
    Connect(session);
    session.EnqueueCall(Answer({{"improved_content", "Better."}, {"changes_summary", "grammar"}}));
    RestFacade facade(session);

    auto reply = facade.HandleImprove(R"({"content": "bettr"})");
    CHECK(reply.status == 200);
    CHECK(reply.body["improved_content"] == "Better.");
    CHECK(reply.body["changes_summary"] == "grammar");
    CHECK(reply.body["error"].is_null());
}

TEST_CASE("RestFacade: improve falls back to the original content", "[api]") {
    FakeToolSession session;
    Connect(session);
    session.EnqueueCall(Answer({{"changes_summary", "nothing"}}));
    RestFacade facade(session);

    auto reply = facade.HandleImprove(R"({"content": "as is"})");
    CHECK(reply.status == 200);
    CHECK(reply.body["improved_content"] == "as is");
}

TEST_CASE("RestFacade: malformed request bodies are 422", "[api]") {
    FakeToolSession session;
    Connect(session);
    RestFacade facade(session);

    CHECK(facade.HandleRecipients("not json").status == 422);
    CHECK(facade.HandleRecipients("[]").status == 422);
    CHECK(facade.HandleRecipients(R"({"text": "x"})").status == 422);
    CHECK(facade.HandleImprove(R"({"content": 5})").status == 422);
    CHECK(facade.HandleImprove(R"({"content": ""})").status == 422);
    CHECK(session.Calls().empty());
}

TEST_CASE("RestFacade: tool-level errors are 500 with the tool's message", "[api]") {
    FakeToolSession session;
    Connect(session);
    session.EnqueueCall(Answer({{"recipients", json::array()},
                                {"reasoning", "Error occurred: quota"},
                                {"error", "quota"}},
                               true));
    RestFacade facade(session);

    auto reply = facade.HandleRecipients(R"({"content": "x"})");
    CHECK(reply.status == 500);
    CHECK(reply.body["error"] == "quota");
    CHECK(reply.body["detail"] == "Failed to get recipient suggestions: quota");
}

TEST_CASE("RestFacade: unreadable tool output is 500", "[api]") {
    FakeToolSession session;
    Connect(session);
    session.EnqueueCall(Result<ToolResult, Error>::Ok(TextResult("plain words")));
    RestFacade facade(session);

    auto reply = facade.HandleImprove(R"({"content": "x"})");
    CHECK(reply.status == 500);
    CHECK(reply.body["error"] == "plain words");
}

TEST_CASE("RestFacade: session failures map to HTTP statuses", "[api]") {
    FakeToolSession session;
    Connect(session);
    RestFacade facade(session);

    SECTION("timeout") {
        session.EnqueueCall(Failure(ErrorCategory::Timeout, "No response"));
        auto reply = facade.HandleImprove(R"({"content": "x"})");
        CHECK(reply.status == 504);
        CHECK(reply.body["error"] == "timeout");
    }

    SECTION("connection lost") {
        session.EnqueueCall(Failure(ErrorCategory::ConnectionLost, "pipe closed"));
        auto reply = facade.HandleRecipients(R"({"content": "x"})");
        CHECK(reply.status == 503);
        CHECK(reply.body["detail"].get<std::string>().find("retry") != std::string::npos);
    }

    SECTION("not connected") {
        session.SetState(ConnectionState::Closed);
        auto reply = facade.HandleRecipients(R"({"content": "x"})");
        CHECK(reply.status == 503);
    }

    SECTION("invalid params") {
        session.EnqueueCall(Failure(ErrorCategory::InvalidParams, "arguments.content: too short"));
        auto reply = facade.HandleImprove(R"({"content": "x"})");
        CHECK(reply.status == 400);
    }
}

// ===========================================================================
// HTTP round trip
// ===========================================================================

TEST_CASE("RestFacade: serves the routes over HTTP", "[api][http]") {
    FakeToolSession session;
    Connect(session);
    session.EnqueueCall(Answer({{"improved_content", "Done."}, {"changes_summary", "s"}}));

    ApiConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    RestFacade facade(session, config);

    auto served = Result<void, Error>::Ok();
    std::thread server([&] { served = facade.Serve(); });
    facade.WaitUntilReady();
    REQUIRE(facade.BoundPort() > 0);

    httplib::Client client("127.0.0.1", facade.BoundPort());

    auto health = client.Get("/health");
    REQUIRE(health);
    CHECK(health->status == 200);
    CHECK(health->get_header_value("Content-Type") == "application/json");
    CHECK(json::parse(health->body)["status"] == "healthy");

    auto improved = client.Post("/api/improve", R"({"content": "done"})", "application/json");
    REQUIRE(improved);
    CHECK(improved->status == 200);
    CHECK(json::parse(improved->body)["improved_content"] == "Done.");

    auto bad = client.Post("/api/recipients", "{", "application/json");
    REQUIRE(bad);
    CHECK(bad->status == 422);

    auto missing = client.Get("/nope");
    REQUIRE(missing);
    CHECK(missing->status == 404);

    facade.Stop();
    server.join();
    CHECK(served.IsOk());
}

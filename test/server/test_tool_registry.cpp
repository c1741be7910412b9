#include <catch2/catch_test_macros.hpp>

#include <docmcp/server/tool_registry.hpp>

#include <cctype>
#include <stdexcept>

using namespace docmcp;
using nlohmann::json;

namespace {

ToolDefinition Definition(const std::string& name) {
    return ToolDefinition{
        name, "Test tool",
        json{{"type", "object"},
             {"properties", {{"content", {{"type", "string"}, {"minLength", 1}}}}},
             {"required", json::array({"content"})}}};
}

ToolResult Upper(const json& arguments) {
    auto text = arguments["content"].get<std::string>();
    for (auto& c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return TextResult(text);
}

} // anonymous namespace

// ===========================================================================
// Register
// ===========================================================================

TEST_CASE("ToolRegistry: tools keep registration order", "[server][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(Definition("zeta"), Upper).IsOk());
    REQUIRE(registry.Register(Definition("alpha"), Upper).IsOk());

    REQUIRE(registry.Tools().size() == 2);
    CHECK(registry.Tools()[0].name == "zeta");
    CHECK(registry.Tools()[1].name == "alpha");
    CHECK(registry.HasTool("alpha"));
    CHECK_FALSE(registry.HasTool("beta"));
    REQUIRE(registry.Find("zeta") != nullptr);
    CHECK(registry.Find("zeta")->description == "Test tool");
    CHECK(registry.Find("beta") == nullptr);
}

TEST_CASE("ToolRegistry: duplicate names are rejected", "[server][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(Definition("upper"), Upper).IsOk());
    auto again = registry.Register(Definition("upper"), Upper);
    REQUIRE(again.IsErr());
    CHECK(again.Error().category == ErrorCategory::InvalidRequest);
    CHECK(registry.Tools().size() == 1);
}

TEST_CASE("ToolRegistry: invalid definitions are rejected", "[server][registry]") {
    ToolRegistry registry;
    CHECK(registry.Register(Definition(""), Upper).IsErr());

    auto bad_schema = Definition("bad");
    bad_schema.input_schema = json::array();
    CHECK(registry.Register(bad_schema, Upper).IsErr());

    CHECK(registry.Register(Definition("nohandler"), ToolHandler{}).IsErr());
    CHECK(registry.Tools().empty());
}

// ===========================================================================
// Dispatch
// ===========================================================================

TEST_CASE("ToolRegistry: dispatch runs the handler", "[server][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(Definition("upper"), Upper).IsOk());

    auto result = registry.Dispatch(ToolInvocation{"upper", {{"content", "memo"}}});
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().is_error);
    CHECK(result.Value().Text() == "MEMO");
}

TEST_CASE("ToolRegistry: unknown tool is MethodNotFound", "[server][registry]") {
    ToolRegistry registry;
    auto result = registry.Dispatch(ToolInvocation{"missing", json::object()});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::MethodNotFound);
    CHECK(result.Error().WireCode() == rpc_code::kMethodNotFound);
    CHECK(result.Error().message == "Unknown tool: missing");
}

TEST_CASE("ToolRegistry: schema violations never reach the handler", "[server][registry]") {
    ToolRegistry registry;
    int calls = 0;
    REQUIRE(registry
                .Register(Definition("count"),
                          [&calls](const json&) {
                              ++calls;
                              return TextResult("ok");
                          })
                .IsOk());

    auto missing = registry.Dispatch(ToolInvocation{"count", json::object()});
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().category == ErrorCategory::InvalidParams);

    auto empty = registry.Dispatch(ToolInvocation{"count", {{"content", ""}}});
    REQUIRE(empty.IsErr());
    CHECK(empty.Error().WireCode() == rpc_code::kInvalidParams);
    CHECK(calls == 0);
}

TEST_CASE("ToolRegistry: a throwing handler yields an error result", "[server][registry]") {
    ToolRegistry registry;
    REQUIRE(registry
                .Register(Definition("explode"),
                          [](const json&) -> ToolResult {
                              throw std::runtime_error("kaboom");
                          })
                .IsOk());

    auto result = registry.Dispatch(ToolInvocation{"explode", {{"content", "x"}}});
    REQUIRE(result.IsOk());
    CHECK(result.Value().is_error);
    CHECK(result.Value().Text() == "Tool error: kaboom");
}

#pragma once

#include <docmcp/core/result.hpp>
#include <docmcp/protocol/tool_types.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docmcp {

// A tool handler takes the (already validated) arguments object and returns
// a ToolResult. Throwing is allowed; the registry turns the exception into
// an error result.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: tools published by the tool host.
//
// Populated once at startup, read-only afterwards; Dispatch() may then be
// called from any number of threads.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Fails with InvalidRequest for an empty name, a duplicate name or a
    // schema that is not a JSON object.
    [[nodiscard]] Result<void, Error> Register(ToolDefinition definition,
                                               ToolHandler handler);

    // Registration order.
    [[nodiscard]] const std::vector<ToolDefinition>& Tools() const noexcept {
        return definitions_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;
    [[nodiscard]] const ToolDefinition* Find(const std::string& name) const;

    // MethodNotFound for an unknown tool, InvalidParams when the arguments
    // fail the tool's input schema.
    [[nodiscard]] Result<ToolResult, Error> Dispatch(const ToolInvocation& invocation) const;

private:
    std::vector<ToolDefinition> definitions_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace docmcp

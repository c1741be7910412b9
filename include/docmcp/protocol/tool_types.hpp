#pragma once

#include <docmcp/core/result.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docmcp {

// ---------------------------------------------------------------------------
// ToolDefinition: a tool as published by the tool host. Immutable once
// listed; `input_schema` is a JSON Schema object.
// ---------------------------------------------------------------------------
struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();

    bool operator==(const ToolDefinition& other) const {
        return name == other.name && description == other.description &&
               input_schema == other.input_schema;
    }
};

// ---------------------------------------------------------------------------
// ToolInvocation: a request to run one tool.
// ---------------------------------------------------------------------------
struct ToolInvocation {
    std::string tool_name;
    nlohmann::json arguments = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// ToolResult: outcome of a tool that ran. `is_error` marks a tool-level
// failure; protocol failures never produce a ToolResult.
// `content` is an array of MCP content blocks ({"type":"text","text":...}).
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content = nlohmann::json::array();

    // Concatenated text of all text blocks.
    [[nodiscard]] std::string Text() const;

    bool operator==(const ToolResult& other) const {
        return is_error == other.is_error && content == other.content;
    }
};

ToolResult TextResult(const std::string& text);
ToolResult ErrorResult(const std::string& text);

// -- Wire conversions (MCP field names: inputSchema, isError) ---------------

nlohmann::json ToolDefinitionToJson(const ToolDefinition& definition);
Result<ToolDefinition, Error> ToolDefinitionFromJson(const nlohmann::json& value);

// Parses the result of tools/list: {"tools": [...]}.
Result<std::vector<ToolDefinition>, Error> ToolListFromJson(const nlohmann::json& value);

nlohmann::json ToolResultToJson(const ToolResult& result);
Result<ToolResult, Error> ToolResultFromJson(const nlohmann::json& value);

} // namespace docmcp

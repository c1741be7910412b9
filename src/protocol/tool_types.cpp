#include <docmcp/protocol/tool_types.hpp>

namespace docmcp {

namespace {

Error MalformedTool(const std::string& op, const std::string& message) {
    Error error = MakeError(ErrorCategory::MalformedMessage, op, message);
    error.rpc_code = rpc_code::kInvalidParams;
    return error;
}

nlohmann::json TextBlock(const std::string& text) {
    return nlohmann::json{{"type", "text"}, {"text", text}};
}

} // anonymous namespace

std::string ToolResult::Text() const {
    std::string text;
    if (!content.is_array()) {
        return text;
    }
    for (const auto& block : content) {
        if (block.is_object() && block.value("type", "") == "text" &&
            block.contains("text") && block["text"].is_string()) {
            if (!text.empty()) {
                text += "\n";
            }
            text += block["text"].get<std::string>();
        }
    }
    return text;
}

ToolResult TextResult(const std::string& text) {
    ToolResult result;
    result.content.push_back(TextBlock(text));
    return result;
}

ToolResult ErrorResult(const std::string& text) {
    ToolResult result;
    result.is_error = true;
    result.content.push_back(TextBlock(text));
    return result;
}

nlohmann::json ToolDefinitionToJson(const ToolDefinition& definition) {
    return nlohmann::json{{"name", definition.name},
                          {"description", definition.description},
                          {"inputSchema", definition.input_schema}};
}

Result<ToolDefinition, Error> ToolDefinitionFromJson(const nlohmann::json& value) {
    using R = Result<ToolDefinition, Error>;
    if (!value.is_object()) {
        return R::Err(MalformedTool("ToolDefinitionFromJson", "Tool entry is not an object"));
    }
    if (!value.contains("name") || !value["name"].is_string() ||
        value["name"].get<std::string>().empty()) {
        return R::Err(MalformedTool("ToolDefinitionFromJson", "Tool entry has no name"));
    }
    ToolDefinition definition;
    definition.name = value["name"].get<std::string>();
    if (value.contains("description") && value["description"].is_string()) {
        definition.description = value["description"].get<std::string>();
    }
    if (value.contains("inputSchema")) {
        if (!value["inputSchema"].is_object()) {
            return R::Err(MalformedTool("ToolDefinitionFromJson",
                                        "inputSchema of '" + definition.name +
                                            "' is not an object"));
        }
        definition.input_schema = value["inputSchema"];
    }
    return R::Ok(std::move(definition));
}

Result<std::vector<ToolDefinition>, Error> ToolListFromJson(const nlohmann::json& value) {
    using R = Result<std::vector<ToolDefinition>, Error>;
    if (!value.is_object() || !value.contains("tools") || !value["tools"].is_array()) {
        return R::Err(MalformedTool("ToolListFromJson",
                                    "tools/list result has no 'tools' array"));
    }
    std::vector<ToolDefinition> tools;
    tools.reserve(value["tools"].size());
    for (const auto& entry : value["tools"]) {
        auto parsed = ToolDefinitionFromJson(entry);
        if (parsed.IsErr()) {
            return R::Err(std::move(parsed).Error());
        }
        tools.push_back(std::move(parsed).Value());
    }
    return R::Ok(std::move(tools));
}

nlohmann::json ToolResultToJson(const ToolResult& result) {
    return nlohmann::json{{"content", result.content}, {"isError", result.is_error}};
}

Result<ToolResult, Error> ToolResultFromJson(const nlohmann::json& value) {
    using R = Result<ToolResult, Error>;
    if (!value.is_object() || !value.contains("content") || !value["content"].is_array()) {
        return R::Err(MalformedTool("ToolResultFromJson",
                                    "tools/call result has no 'content' array"));
    }
    ToolResult result;
    result.content = value["content"];
    if (value.contains("isError")) {
        if (!value["isError"].is_boolean()) {
            return R::Err(MalformedTool("ToolResultFromJson", "isError is not a boolean"));
        }
        result.is_error = value["isError"].get<bool>();
    }
    return R::Ok(std::move(result));
}

} // namespace docmcp

#include <docmcp/server/tool_registry.hpp>

#include <docmcp/core/log.hpp>
#include <docmcp/server/schema_validator.hpp>

namespace docmcp {

Result<void, Error> ToolRegistry::Register(ToolDefinition definition,
                                           ToolHandler handler) {
    if (definition.name.empty()) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::InvalidRequest, "RegisterTool", "Tool name must not be empty"));
    }
    if (handlers_.count(definition.name) > 0) {
        return Result<void, Error>::Err(
            MakeError(ErrorCategory::InvalidRequest, "RegisterTool",
                      "Tool '" + definition.name + "' is already registered"));
    }
    if (!definition.input_schema.is_object()) {
        return Result<void, Error>::Err(
            MakeError(ErrorCategory::InvalidRequest, "RegisterTool",
                      "Input schema of '" + definition.name + "' must be an object"));
    }
    if (!handler) {
        return Result<void, Error>::Err(
            MakeError(ErrorCategory::InvalidRequest, "RegisterTool",
                      "Tool '" + definition.name + "' has no handler"));
    }
    handlers_[definition.name] = std::move(handler);
    definitions_.push_back(std::move(definition));
    return Result<void, Error>::Ok();
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

const ToolDefinition* ToolRegistry::Find(const std::string& name) const {
    for (const auto& definition : definitions_) {
        if (definition.name == name) {
            return &definition;
        }
    }
    return nullptr;
}

Result<ToolResult, Error> ToolRegistry::Dispatch(const ToolInvocation& invocation) const {
    using R = Result<ToolResult, Error>;
    auto it = handlers_.find(invocation.tool_name);
    const auto* definition = Find(invocation.tool_name);
    if (it == handlers_.end() || definition == nullptr) {
        Error error = MakeError(ErrorCategory::MethodNotFound, "Dispatch",
                                "Unknown tool: " + invocation.tool_name);
        error.rpc_code = rpc_code::kMethodNotFound;
        return R::Err(std::move(error));
    }

    auto valid = ValidateAgainstSchema(invocation.arguments, definition->input_schema);
    if (valid.IsErr()) {
        return R::Err(std::move(valid).Error());
    }

    try {
        return R::Ok(it->second(invocation.arguments));
    } catch (const std::exception& e) {
        LogError("tools", "Tool '" + invocation.tool_name + "' threw: " + e.what());
        return R::Ok(ErrorResult(std::string("Tool error: ") + e.what()));
    }
}

} // namespace docmcp

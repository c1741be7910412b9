#pragma once

#include <docmcp/core/result.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace docmcp {

// Validates `value` against the JSON Schema subset used for tool inputs:
// type, properties, required, additionalProperties (false only), minLength,
// maxLength, enum and items. Unknown keywords are ignored.
//
// Fails with InvalidParams; the message names the offending path, e.g.
// "arguments.content: expected string, got number".
[[nodiscard]] Result<void, Error> ValidateAgainstSchema(
    const nlohmann::json& value,
    const nlohmann::json& schema,
    const std::string& path = "arguments");

} // namespace docmcp

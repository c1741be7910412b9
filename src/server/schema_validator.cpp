#include <docmcp/server/schema_validator.hpp>

#include <cmath>
#include <optional>

namespace docmcp {

namespace {

Result<void, Error> Invalid(const std::string& path, const std::string& message) {
    Error error = MakeError(ErrorCategory::InvalidParams, "ValidateArguments",
                            path + ": " + message);
    error.rpc_code = rpc_code::kInvalidParams;
    error.data = nlohmann::json{{"path", path}};
    return Result<void, Error>::Err(std::move(error));
}

const char* TypeName(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return "integer";
    }
    if (value.is_number()) {
        return "number";
    }
    return value.type_name();
}

bool MatchesType(const nlohmann::json& value, const std::string& type) {
    if (type == "object") return value.is_object();
    if (type == "string") return value.is_string();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        if (value.is_number_float()) {
            const double d = value.get<double>();
            return std::isfinite(d) && std::trunc(d) == d;
        }
        return false;
    }
    if (type == "boolean") return value.is_boolean();
    if (type == "array") return value.is_array();
    if (type == "null") return value.is_null();
    return true;
}

Result<void, Error> CheckType(const nlohmann::json& value, const nlohmann::json& type,
                              const std::string& path) {
    if (type.is_string()) {
        if (!MatchesType(value, type.get<std::string>())) {
            return Invalid(path, "expected " + type.get<std::string>() + ", got " +
                                     TypeName(value));
        }
        return Result<void, Error>::Ok();
    }
    if (type.is_array()) {
        std::string names;
        for (const auto& candidate : type) {
            if (!candidate.is_string()) {
                continue;
            }
            if (MatchesType(value, candidate.get<std::string>())) {
                return Result<void, Error>::Ok();
            }
            names += names.empty() ? "" : "|";
            names += candidate.get<std::string>();
        }
        return Invalid(path, "expected " + names + ", got " + TypeName(value));
    }
    return Result<void, Error>::Ok();
}

// Length in code points, as JSON Schema counts it.
std::size_t Utf8Length(const std::string& s) {
    std::size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::optional<std::size_t> LengthBound(const nlohmann::json& schema, const char* keyword) {
    if (!schema.contains(keyword) || !schema[keyword].is_number_integer() ||
        schema[keyword].get<long long>() < 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(schema[keyword].get<long long>());
}

} // anonymous namespace

Result<void, Error> ValidateAgainstSchema(const nlohmann::json& value,
                                          const nlohmann::json& schema,
                                          const std::string& path) {
    if (!schema.is_object()) {
        return Result<void, Error>::Ok();
    }

    if (schema.contains("type")) {
        auto typed = CheckType(value, schema["type"], path);
        if (typed.IsErr()) {
            return typed;
        }
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto& allowed : schema["enum"]) {
            if (allowed == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return Invalid(path, "value " + value.dump() + " is not one of " +
                                     schema["enum"].dump());
        }
    }

    if (value.is_string()) {
        const auto length = Utf8Length(value.get<std::string>());
        if (auto min = LengthBound(schema, "minLength"); min && length < *min) {
            return Invalid(path, "must be at least " + std::to_string(*min) +
                                     " character(s)");
        }
        if (auto max = LengthBound(schema, "maxLength"); max && length > *max) {
            return Invalid(path, "must be at most " + std::to_string(*max) +
                                     " character(s)");
        }
    }

    if (value.is_object()) {
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& name : schema["required"]) {
                if (name.is_string() && !value.contains(name.get<std::string>())) {
                    return Invalid(path + "." + name.get<std::string>(),
                                   "required property is missing");
                }
            }
        }
        const bool has_properties =
            schema.contains("properties") && schema["properties"].is_object();
        const bool closed = schema.contains("additionalProperties") &&
                            schema["additionalProperties"].is_boolean() &&
                            !schema["additionalProperties"].get<bool>();
        for (const auto& [key, member] : value.items()) {
            const auto member_path = path + "." + key;
            if (has_properties && schema["properties"].contains(key)) {
                auto checked =
                    ValidateAgainstSchema(member, schema["properties"][key], member_path);
                if (checked.IsErr()) {
                    return checked;
                }
            } else if (closed) {
                return Invalid(member_path, "unexpected property");
            }
        }
    }

    if (value.is_array() && schema.contains("items") && schema["items"].is_object()) {
        for (std::size_t i = 0; i < value.size(); ++i) {
            auto checked = ValidateAgainstSchema(value[i], schema["items"],
                                                 path + "[" + std::to_string(i) + "]");
            if (checked.IsErr()) {
                return checked;
            }
        }
    }

    return Result<void, Error>::Ok();
}

} // namespace docmcp

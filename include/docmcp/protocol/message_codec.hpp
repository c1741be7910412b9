#pragma once

#include <docmcp/core/result.hpp>
#include <docmcp/protocol/message.hpp>

#include <string>
#include <string_view>

namespace docmcp {

// ---------------------------------------------------------------------------
// Line codec for JSON-RPC 2.0 messages.
//
// One message per line: a compact JSON object followed by '\n'. The
// serializer never emits raw newlines inside the object, so '\n' is an
// unambiguous frame delimiter.
// ---------------------------------------------------------------------------

/// Encode a message as one newline-terminated line. Never fails.
std::string EncodeMessage(const Message& message);

/// Same as EncodeMessage but returns the JSON object (no trailing newline).
nlohmann::json MessageToJson(const Message& message);

/// Decode one line (a trailing "\n" or "\r\n" is tolerated).
/// Fails with ErrorCategory::MalformedMessage when the text is not a valid
/// JSON-RPC 2.0 request, response or notification.
Result<Message, Error> DecodeMessage(std::string_view line);

/// Decode an already-parsed JSON value.
Result<Message, Error> MessageFromJson(const nlohmann::json& value);

} // namespace docmcp

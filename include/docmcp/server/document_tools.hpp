#pragma once

#include <docmcp/core/result.hpp>
#include <docmcp/server/text_client.hpp>
#include <docmcp/server/tool_registry.hpp>

#include <string>
#include <vector>

namespace docmcp {

constexpr const char* kRecipientToolName = "get_recipient_suggestion";
constexpr const char* kImproveToolName = "improve_document";

// Register the document tools. Handlers capture `text_client` by reference;
// it must outlive the registry and be safe for concurrent use.
[[nodiscard]] Result<void, Error> RegisterDocumentTools(
    ToolRegistry& registry,
    ITextClient& text_client,
    std::vector<std::string> recipients);

// -- Individual tools (exposed for tests) ------------------------------------

// Text is {"recipients": [...], "reasoning": "..."}; recipients are limited
// to `allowed`, in their canonical spelling.
ToolResult SuggestRecipients(ITextClient& text_client,
                             const std::vector<std::string>& allowed,
                             const std::string& content);

// Text is {"improved_content": "...", "changes_summary": "..."}.
ToolResult ImproveDocument(ITextClient& text_client, const std::string& content);

std::string BuildRecipientPrompt(const std::vector<std::string>& allowed,
                                 const std::string& content);
std::string BuildImprovePrompt(const std::string& content);

} // namespace docmcp

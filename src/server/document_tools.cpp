#include <docmcp/server/document_tools.hpp>

#include <docmcp/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace docmcp {

namespace {

constexpr const char* kComponent = "tools";
constexpr double kRecipientTemperature = 0.3;
constexpr double kImproveTemperature = 0.5;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

nlohmann::json ContentSchema(const std::string& description) {
    return {
        {"type", "object"},
        {"properties",
         {{"content", {{"type", "string"}, {"minLength", 1}, {"description", description}}}}},
        {"required", nlohmann::json::array({"content"})},
    };
}

ToolResult JsonTextResult(const nlohmann::json& data, bool is_error) {
    auto text = data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return is_error ? ErrorResult(text) : TextResult(text);
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Models sometimes wrap JSON answers in a ```json fence.
std::string StripCodeFence(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos || text.compare(begin, 3, "```") != 0) {
        return text;
    }
    auto body = text.find('\n', begin);
    auto end = text.rfind("```");
    if (body == std::string::npos || end == std::string::npos || end <= body) {
        return text;
    }
    return text.substr(body + 1, end - body - 1);
}

std::optional<nlohmann::json> ParseAnswer(const std::string& text) {
    try {
        auto parsed = nlohmann::json::parse(StripCodeFence(text));
        if (parsed.is_object()) {
            return parsed;
        }
    } catch (const nlohmann::json::exception&) {
        // fall through
    }
    return std::nullopt;
}

std::string Join(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += separator;
        }
        out += item;
    }
    return out;
}

ToolResult RecipientFailure(const std::string& message) {
    LogError(kComponent, std::string(kRecipientToolName) + ": " + message);
    return JsonTextResult({{"recipients", nlohmann::json::array()},
                           {"reasoning", "Error occurred: " + message},
                           {"error", message}},
                          true);
}

ToolResult ImproveFailure(const std::string& content, const std::string& message) {
    LogError(kComponent, std::string(kImproveToolName) + ": " + message);
    return JsonTextResult({{"improved_content", content},
                           {"changes_summary", "Error occurred: " + message},
                           {"error", message}},
                          true);
}

std::string RequireContent(const nlohmann::json& params) {
    if (!params.contains("content") || !params["content"].is_string()) {
        throw std::invalid_argument("Missing required parameter: content");
    }
    return params["content"].get<std::string>();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Prompts
// ---------------------------------------------------------------------------

std::string BuildRecipientPrompt(const std::vector<std::string>& allowed,
                                 const std::string& content) {
    return "You are a document distribution expert. Analyze the following document "
           "and suggest appropriate recipients from this list:\n" +
           Join(allowed, ", ") +
           "\n\nDocument:\n" + content +
           "\n\nBased on the content, determine which recipients should receive this "
           "document. Consider:\n"
           "- Subject matter (legal, HR, financial, technical, etc.)\n"
           "- Sensitivity level\n"
           "- Required action or awareness\n"
           "- Organizational impact\n\n"
           "Respond in JSON format:\n"
           "{\n"
           "    \"recipients\": [\"recipient1\", \"recipient2\"],\n"
           "    \"reasoning\": \"Brief explanation of why these recipients were chosen\"\n"
           "}\n\n"
           "Only include recipients from the provided list. Be specific and selective.";
}

std::string BuildImprovePrompt(const std::string& content) {
    return "You are a professional document editor. Improve the following document by:\n"
           "1. Fixing grammar and spelling errors\n"
           "2. Enhancing clarity and readability\n"
           "3. Improving sentence structure and flow\n"
           "4. Maintaining the original meaning and tone\n"
           "5. Making it more professional and polished\n\n"
           "Original Document:\n" + content +
           "\n\nRespond in JSON format:\n"
           "{\n"
           "    \"improved_content\": \"The improved version of the document\",\n"
           "    \"changes_summary\": \"Brief summary of the main improvements made\"\n"
           "}";
}

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------

ToolResult SuggestRecipients(ITextClient& text_client,
                             const std::vector<std::string>& allowed,
                             const std::string& content) {
    auto generated = text_client.Generate(
        TextRequest{BuildRecipientPrompt(allowed, content), kRecipientTemperature, true});
    if (generated.IsErr()) {
        return RecipientFailure(generated.Error().message);
    }

    auto answer = ParseAnswer(generated.Value());
    if (!answer || !answer->contains("recipients") || !(*answer)["recipients"].is_array()) {
        return RecipientFailure("Text service answer has no 'recipients' list");
    }

    nlohmann::json recipients = nlohmann::json::array();
    for (const auto& candidate : (*answer)["recipients"]) {
        if (!candidate.is_string()) {
            continue;
        }
        const auto wanted = Lower(candidate.get<std::string>());
        for (const auto& name : allowed) {
            if (Lower(name) == wanted &&
                std::find(recipients.begin(), recipients.end(), name) == recipients.end()) {
                recipients.push_back(name);
                break;
            }
        }
    }
    if (recipients.size() != (*answer)["recipients"].size()) {
        LogWarn(kComponent, "Dropped recipient(s) outside the allowed list: " +
                                (*answer)["recipients"].dump());
    }

    std::string reasoning;
    if (answer->contains("reasoning") && (*answer)["reasoning"].is_string()) {
        reasoning = (*answer)["reasoning"].get<std::string>();
    }
    LogInfo(kComponent, "Suggested recipients: " + recipients.dump());
    return JsonTextResult({{"recipients", recipients}, {"reasoning", reasoning}}, false);
}

ToolResult ImproveDocument(ITextClient& text_client, const std::string& content) {
    auto generated =
        text_client.Generate(TextRequest{BuildImprovePrompt(content), kImproveTemperature, true});
    if (generated.IsErr()) {
        return ImproveFailure(content, generated.Error().message);
    }

    auto answer = ParseAnswer(generated.Value());
    if (!answer || !answer->contains("improved_content") ||
        !(*answer)["improved_content"].is_string()) {
        return ImproveFailure(content, "Text service answer has no 'improved_content'");
    }

    std::string summary;
    if (answer->contains("changes_summary") && (*answer)["changes_summary"].is_string()) {
        summary = (*answer)["changes_summary"].get<std::string>();
    }
    LogInfo(kComponent, "Document improvement completed");
    return JsonTextResult({{"improved_content", (*answer)["improved_content"]},
                           {"changes_summary", summary}},
                          false);
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

Result<void, Error> RegisterDocumentTools(ToolRegistry& registry,
                                          ITextClient& text_client,
                                          std::vector<std::string> recipients) {
    auto registered = registry.Register(
        ToolDefinition{kRecipientToolName,
                       "Analyzes document content and suggests appropriate recipients "
                       "from a predefined list",
                       ContentSchema("The document content to analyze")},
        [&text_client, recipients](const nlohmann::json& params) {
            return SuggestRecipients(text_client, recipients, RequireContent(params));
        });
    if (registered.IsErr()) {
        return registered;
    }

    return registry.Register(
        ToolDefinition{kImproveToolName,
                       "Improves document quality by fixing grammar, enhancing clarity, "
                       "and improving structure",
                       ContentSchema("The document content to improve")},
        [&text_client](const nlohmann::json& params) {
            return ImproveDocument(text_client, RequireContent(params));
        });
}

} // namespace docmcp

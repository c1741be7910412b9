#include <docmcp/server/text_client.hpp>

#include <docmcp/core/log.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <memory>

namespace docmcp {

namespace {

constexpr const char* kComponent = "text";
constexpr const char* kChatPath = "/v1/chat";

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Upstream;
    }
}

// Cohere reports failures as {"message": "..."}; fall back to the raw body.
std::string DescribeFailure(const std::string& body) {
    try {
        auto parsed = nlohmann::json::parse(body);
        if (parsed.is_object() && parsed.contains("message") && parsed["message"].is_string()) {
            return parsed["message"].get<std::string>();
        }
    } catch (const nlohmann::json::exception&) {
        // not JSON
    }
    return body.size() > 200 ? body.substr(0, 200) + "..." : body;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct CohereTextClient::Impl {
    TextServiceConfig config;

    explicit Impl(TextServiceConfig cfg) : config(std::move(cfg)) {}

    // One client per request: httplib::Client serializes the requests it
    // sends, and tool calls run on several workers at once.
    std::unique_ptr<httplib::Client> MakeClient() const {
        auto client = std::make_unique<httplib::Client>(config.base_url);
        client->set_bearer_token_auth(config.api_key);
        client->set_connection_timeout(std::chrono::seconds{10});
        client->set_read_timeout(config.timeout);
        client->set_write_timeout(config.timeout);
        return client;
    }
};

CohereTextClient::CohereTextClient(TextServiceConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

CohereTextClient::~CohereTextClient() = default;

Result<std::string, Error> CohereTextClient::Generate(const TextRequest& request) {
    using R = Result<std::string, Error>;

    nlohmann::json body = {
        {"model", impl_->config.model},
        {"message", request.prompt},
        {"temperature", request.temperature},
    };
    if (request.json_output) {
        body["response_format"] = {{"type", "json_object"}};
    }

    httplib::Headers headers = {{"Accept", "application/json"}};
    LogDebug(kComponent, std::string("POST ") + kChatPath + " (model " +
                             impl_->config.model + ")");

    auto client = impl_->MakeClient();
    auto res = client->Post(kChatPath, headers, body.dump(), "application/json");
    if (!res) {
        const auto http_error = res.error();
        return R::Err(MakeError(CategoryFromHttpTransportError(http_error), "Generate",
                                "Text service request failed: " +
                                    httplib::to_string(http_error)));
    }
    if (res->status < 200 || res->status >= 300) {
        Error error = MakeError(ErrorCategory::Upstream, "Generate",
                                "Text service returned HTTP " + std::to_string(res->status) +
                                    ": " + DescribeFailure(res->body));
        error.data = nlohmann::json{{"status", res->status}};
        return R::Err(std::move(error));
    }

    try {
        auto parsed = nlohmann::json::parse(res->body);
        if (!parsed.is_object() || !parsed.contains("text") || !parsed["text"].is_string()) {
            return R::Err(MakeError(ErrorCategory::Upstream, "Generate",
                                    "Text service reply has no 'text' field"));
        }
        return R::Ok(parsed["text"].get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        return R::Err(MakeError(ErrorCategory::Upstream, "Generate",
                                std::string("Text service reply is not JSON: ") + e.what()));
    }
}

} // namespace docmcp

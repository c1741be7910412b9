#pragma once

#include <docmcp/config/app_config.hpp>
#include <docmcp/core/result.hpp>

#include <memory>
#include <string>

namespace docmcp {

struct TextRequest {
    std::string prompt;
    double temperature = 0.3;
    // Ask the service to answer with a single JSON object.
    bool json_output = false;
};

// ---------------------------------------------------------------------------
// ITextClient: a hosted text-generation service.
//
// Abstract so the document tools can be tested against a scripted fake.
// Implementations must be safe to call from several worker threads.
// ---------------------------------------------------------------------------
class ITextClient {
public:
    virtual ~ITextClient() = default;

    ITextClient(const ITextClient&) = delete;
    ITextClient& operator=(const ITextClient&) = delete;
    ITextClient(ITextClient&&) = delete;
    ITextClient& operator=(ITextClient&&) = delete;

    // Returns the generated text. Fails with Upstream (or Timeout).
    [[nodiscard]] virtual Result<std::string, Error> Generate(const TextRequest& request) = 0;

protected:
    ITextClient() = default;
};

// ---------------------------------------------------------------------------
// CohereTextClient: ITextClient over the Cohere chat API (POST /v1/chat)
// using cpp-httplib. Bearer auth; the reply's "text" field is returned.
// ---------------------------------------------------------------------------
class CohereTextClient : public ITextClient {
public:
    explicit CohereTextClient(TextServiceConfig config);
    ~CohereTextClient() override;

    [[nodiscard]] Result<std::string, Error> Generate(const TextRequest& request) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace docmcp

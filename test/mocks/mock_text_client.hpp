#pragma once

#include <docmcp/server/text_client.hpp>

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace docmcp {
namespace testing {

// ---------------------------------------------------------------------------
// MockTextClient: scripted ITextClient.
//
// Usage:
//   MockTextClient text;
//   text.EnqueueText(R"({"recipients": ["HR"], "reasoning": "..."})");
//   text.EnqueueError(MakeError(ErrorCategory::Upstream, "Generate", "down"));
//
// Responses are returned FIFO; an empty queue yields an Upstream error.
// Every request is recorded.
// ---------------------------------------------------------------------------
class MockTextClient : public ITextClient {
public:
    MockTextClient() = default;

    void EnqueueText(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(Result<std::string, Error>::Ok(text));
    }

    void EnqueueError(Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(Result<std::string, Error>::Err(std::move(error)));
    }

    Result<std::string, Error> Generate(const TextRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (responses_.empty()) {
            return Result<std::string, Error>::Err(
                MakeError(ErrorCategory::Upstream, "Generate", "No scripted response"));
        }
        auto next = std::move(responses_.front());
        responses_.pop_front();
        return next;
    }

    [[nodiscard]] std::vector<TextRequest> Requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Result<std::string, Error>> responses_;
    std::vector<TextRequest> requests_;
};

} // namespace testing
} // namespace docmcp

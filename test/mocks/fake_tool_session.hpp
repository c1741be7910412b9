#pragma once

#include <docmcp/client/tool_session.hpp>

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace docmcp {
namespace testing {

// ---------------------------------------------------------------------------
// FakeToolSession: scripted IToolSession for façade tests.
//
// Usage:
//   FakeToolSession session;
//   session.SetTools({...});
//   session.EnqueueCall(Result<ToolResult, Error>::Ok(TextResult("{...}")));
//
// CallTool() returns queued outcomes FIFO and records every call. Calls are
// rejected with NotConnected unless the state is Connected.
// ---------------------------------------------------------------------------
class FakeToolSession : public IToolSession {
public:
    struct CallRecord {
        std::string name;
        nlohmann::json arguments;
        std::optional<std::chrono::milliseconds> timeout;
    };

    FakeToolSession() = default;

    void SetState(ConnectionState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
    }

    void SetTools(std::vector<ToolDefinition> tools) {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_ = std::move(tools);
    }

    void EnqueueCall(Result<ToolResult, Error> outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_.push_back(std::move(outcome));
    }

    [[nodiscard]] std::vector<CallRecord> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    // -- IToolSession -----------------------------------------------------------

    ConnectionState State() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    std::vector<ToolDefinition> Tools() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return tools_;
    }

    Result<std::vector<ToolDefinition>, Error> ListTools() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Connected) {
            return Result<std::vector<ToolDefinition>, Error>::Err(
                MakeError(ErrorCategory::NotConnected, "ListTools", "not connected"));
        }
        return Result<std::vector<ToolDefinition>, Error>::Ok(tools_);
    }

    Result<ToolResult, Error> CallTool(
        const std::string& name,
        const nlohmann::json& arguments,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(CallRecord{name, arguments, timeout});
        if (state_ != ConnectionState::Connected) {
            return Result<ToolResult, Error>::Err(
                MakeError(ErrorCategory::NotConnected, "CallTool", "Session is not connected"));
        }
        if (outcomes_.empty()) {
            return Result<ToolResult, Error>::Err(
                MakeError(ErrorCategory::Internal, "CallTool", "No scripted outcome"));
        }
        auto next = std::move(outcomes_.front());
        outcomes_.pop_front();
        return next;
    }

private:
    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::Connected;
    std::vector<ToolDefinition> tools_;
    std::deque<Result<ToolResult, Error>> outcomes_;
    std::vector<CallRecord> calls_;
};

} // namespace testing
} // namespace docmcp

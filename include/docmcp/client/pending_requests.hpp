#pragma once

#include <docmcp/core/result.hpp>
#include <docmcp/protocol/message.hpp>

#include <chrono>
#include <cstddef>
#include <future>
#include <map>
#include <mutex>
#include <optional>

#include <nlohmann/json.hpp>

namespace docmcp {

// What a waiter eventually receives: the response's result payload, or the
// reason it will never get one (protocol error, timeout, connection loss).
using CallOutcome = Result<nlohmann::json, Error>;

// ---------------------------------------------------------------------------
// PendingRequests: correlation table of in-flight requests.
//
// Callers Register() before sending; the response pump Resolve()s; timeouts
// and teardown Cancel(). Lookup, removal and delivery happen under one lock,
// so every entry is completed exactly once and a late response for a
// removed entry is reported as an orphan instead of reaching anyone.
// ---------------------------------------------------------------------------
class PendingRequests {
public:
    using Clock = std::chrono::steady_clock;

    PendingRequests() = default;
    ~PendingRequests();

    PendingRequests(const PendingRequests&) = delete;
    PendingRequests& operator=(const PendingRequests&) = delete;

    // Fails with ErrorCategory::DuplicateId when `id` is already pending.
    [[nodiscard]] Result<std::future<CallOutcome>, Error> Register(
        const RequestId& id,
        std::optional<Clock::time_point> deadline = std::nullopt);

    // Returns false when no entry matches (orphan).
    bool Resolve(const RequestId& id, CallOutcome outcome);

    // Removes the entry and delivers `reason` as its error. Returns false if
    // the entry was already resolved or cancelled.
    bool Cancel(const RequestId& id);
    bool Cancel(const RequestId& id, Error reason);

    // Cancels every pending entry with `reason`; returns how many.
    std::size_t CancelAll(const Error& reason);

    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] bool Contains(const RequestId& id) const;
    [[nodiscard]] std::optional<Clock::time_point> NextDeadline() const;

private:
    struct PendingRequest {
        RequestId id;
        std::promise<CallOutcome> promise;
        Clock::time_point registered_at;
        std::optional<Clock::time_point> deadline;
    };

    mutable std::mutex mutex_;
    std::map<RequestId, PendingRequest> entries_;
};

} // namespace docmcp

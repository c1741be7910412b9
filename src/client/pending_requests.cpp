#include <docmcp/client/pending_requests.hpp>

#include <docmcp/core/log.hpp>

#include <utility>

namespace docmcp {

namespace {

constexpr const char* kComponent = "pending";

} // anonymous namespace

PendingRequests::~PendingRequests() {
    // A waiter must never see a broken promise.
    CancelAll(MakeError(ErrorCategory::ConnectionClosed, "PendingRequests",
                        "Correlation table destroyed"));
}

Result<std::future<CallOutcome>, Error> PendingRequests::Register(
    const RequestId& id, std::optional<Clock::time_point> deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(id) > 0) {
        return Result<std::future<CallOutcome>, Error>::Err(MakeError(
            ErrorCategory::DuplicateId, "RegisterRequest",
            "Request id " + IdToString(id) + " is already pending"));
    }
    PendingRequest entry{id, std::promise<CallOutcome>(), Clock::now(), deadline};
    auto future = entry.promise.get_future();
    entries_.emplace(id, std::move(entry));
    return Result<std::future<CallOutcome>, Error>::Ok(std::move(future));
}

bool PendingRequests::Resolve(const RequestId& id, CallOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    auto entry = std::move(it->second);
    entries_.erase(it);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - entry.registered_at);
    LogDebug(kComponent, "Resolved " + IdToString(id) + " after " +
                             std::to_string(elapsed.count()) + " ms");
    entry.promise.set_value(std::move(outcome));
    return true;
}

bool PendingRequests::Cancel(const RequestId& id) {
    return Cancel(id, MakeError(ErrorCategory::Cancelled, "CancelRequest",
                                "Request " + IdToString(id) + " was cancelled"));
}

bool PendingRequests::Cancel(const RequestId& id, Error reason) {
    return Resolve(id, CallOutcome::Err(std::move(reason)));
}

std::size_t PendingRequests::CancelAll(const Error& reason) {
    std::map<RequestId, PendingRequest> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(entries_);
    }
    for (auto& [id, entry] : drained) {
        entry.promise.set_value(CallOutcome::Err(reason));
    }
    if (!drained.empty()) {
        LogDebug(kComponent, "Cancelled " + std::to_string(drained.size()) +
                                 " pending request(s): " + reason.message);
    }
    return drained.size();
}

std::size_t PendingRequests::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool PendingRequests::Contains(const RequestId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

std::optional<PendingRequests::Clock::time_point>
PendingRequests::NextDeadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<Clock::time_point> next;
    for (const auto& [id, entry] : entries_) {
        if (entry.deadline.has_value() && (!next || *entry.deadline < *next)) {
            next = entry.deadline;
        }
    }
    return next;
}

} // namespace docmcp

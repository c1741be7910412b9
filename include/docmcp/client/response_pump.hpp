#pragma once

#include <docmcp/client/pending_requests.hpp>
#include <docmcp/client/transport.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace docmcp {

// ---------------------------------------------------------------------------
// ResponsePump: the single reader of a transport.
//
// Runs on its own thread and routes every response to PendingRequests by
// id. Unmatched responses are logged and dropped. The pump stops, failing
// all pending requests with ConnectionLost, when the stream ends, the
// transport reports closure, or `malformed_threshold` consecutive lines
// fail to decode.
// ---------------------------------------------------------------------------
class ResponsePump {
public:
    // Invoked once, on the pump thread, with the reason the pump stopped.
    using StopCallback = std::function<void(const Error&)>;

    ResponsePump(ITransport& transport, PendingRequests& pending,
                 int malformed_threshold, StopCallback on_stopped = {});
    ~ResponsePump();

    ResponsePump(const ResponsePump&) = delete;
    ResponsePump& operator=(const ResponsePump&) = delete;

    void Start();

    // Wait for the pump thread to exit. The transport must have been
    // stopped (or have reached end of stream) first.
    void Join();

    [[nodiscard]] bool IsRunning() const noexcept { return running_.load(); }

    [[nodiscard]] std::optional<Error> StopReason() const;

    [[nodiscard]] std::size_t OrphanCount() const noexcept { return orphans_.load(); }

private:
    void Run();
    void Finish(Error reason);

    ITransport& transport_;
    PendingRequests& pending_;
    int malformed_threshold_;
    StopCallback on_stopped_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> orphans_{0};

    mutable std::mutex reason_mutex_;
    std::optional<Error> stop_reason_;
};

} // namespace docmcp

#include <docmcp/client/response_pump.hpp>

#include <docmcp/core/log.hpp>

#include <utility>

namespace docmcp {

namespace {

constexpr const char* kComponent = "pump";

CallOutcome OutcomeFromResponse(const Response& response) {
    if (response.IsError()) {
        const auto& error = response.ErrorPayload();
        return CallOutcome::Err(ErrorFromRpc(error.code, error.message, error.data));
    }
    return CallOutcome::Ok(response.ResultPayload());
}

} // anonymous namespace

ResponsePump::ResponsePump(ITransport& transport, PendingRequests& pending,
                           int malformed_threshold, StopCallback on_stopped)
    : transport_(transport),
      pending_(pending),
      malformed_threshold_(malformed_threshold < 1 ? 1 : malformed_threshold),
      on_stopped_(std::move(on_stopped)) {}

ResponsePump::~ResponsePump() {
    Join();
}

void ResponsePump::Start() {
    if (thread_.joinable()) {
        return;
    }
    running_ = true;
    thread_ = std::thread([this] { Run(); });
}

void ResponsePump::Join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

std::optional<Error> ResponsePump::StopReason() const {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    return stop_reason_;
}

void ResponsePump::Run() {
    int consecutive_malformed = 0;

    for (;;) {
        auto received = transport_.Receive();

        if (received.IsErr()) {
            auto error = std::move(received).Error();
            if (error.category != ErrorCategory::MalformedMessage) {
                Finish(MakeError(ErrorCategory::ConnectionLost, "ResponsePump",
                                 "Connection to tool host lost: " + error.message));
                return;
            }
            ++consecutive_malformed;
            LogWarn(kComponent, "Dropping malformed line (" +
                                    std::to_string(consecutive_malformed) + "/" +
                                    std::to_string(malformed_threshold_) +
                                    "): " + error.message);
            if (consecutive_malformed >= malformed_threshold_) {
                Finish(MakeError(ErrorCategory::ConnectionLost, "ResponsePump",
                                 "Tool host sent " +
                                     std::to_string(consecutive_malformed) +
                                     " malformed lines in a row"));
                return;
            }
            continue;
        }

        auto message = std::move(received).Value();
        if (!message.has_value()) {
            Finish(MakeError(ErrorCategory::ConnectionLost, "ResponsePump",
                             "Tool host closed its output stream"));
            return;
        }
        consecutive_malformed = 0;

        if (const auto* response = std::get_if<Response>(&*message)) {
            if (!pending_.Resolve(response->id, OutcomeFromResponse(*response))) {
                ++orphans_;
                LogWarn(kComponent, "Discarding response for unknown or expired id " +
                                        IdToString(response->id));
            }
        } else if (const auto* request = std::get_if<Request>(&*message)) {
            LogDebug(kComponent, "Ignoring server request '" + request->method + "'");
        } else {
            LogDebug(kComponent, "Ignoring notification '" +
                                     std::get<Notification>(*message).method + "'");
        }
    }
}

void ResponsePump::Finish(Error reason) {
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        stop_reason_ = reason;
    }
    running_ = false;
    // Notify before draining so the owner stops accepting new requests
    // first; nothing registered afterwards can be left waiting.
    if (on_stopped_) {
        on_stopped_(reason);
    }
    const auto cancelled = pending_.CancelAll(reason);
    LogInfo(kComponent, "Stopped (" + reason.message + "), failed " +
                            std::to_string(cancelled) + " pending request(s)");
}

} // namespace docmcp

#pragma once

#include <docmcp/core/result.hpp>
#include <docmcp/protocol/message.hpp>

#include <optional>

namespace docmcp {

// ---------------------------------------------------------------------------
// ITransport: a duplex channel carrying framed messages to one tool host.
//
// Exactly one reader (the response pump) calls Receive(); any number of
// callers may call Send() concurrently, and implementations serialize them
// so frames never interleave. Session owns its transport exclusively.
//
// Methods return Result<T, Error> and never throw on expected failures.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;
    ITransport(ITransport&&) = delete;
    ITransport& operator=(ITransport&&) = delete;

    // Open the channel. Fails with ErrorCategory::Launch.
    [[nodiscard]] virtual Result<void, Error> Start() = 0;

    // Write one framed message. Fails with ErrorCategory::TransportClosed.
    [[nodiscard]] virtual Result<void, Error> Send(const Message& message) = 0;

    // Block until one full message is available.
    //   Ok(message)      : a decoded message
    //   Ok(std::nullopt) : end of stream: the peer closed its output
    //   Err(MalformedMessage): one undecodable frame; the channel is still usable
    //   Err(TransportClosed) : Stop() was called or the read side failed
    [[nodiscard]] virtual Result<std::optional<Message>, Error> Receive() = 0;

    // Close the channel and terminate the peer. Idempotent. Unblocks a
    // concurrent Receive().
    virtual void Stop() = 0;

    [[nodiscard]] virtual bool IsRunning() const = 0;

    // Exit status of the peer process once it has terminated.
    [[nodiscard]] virtual std::optional<int> ExitCode() const = 0;

protected:
    ITransport() = default;
};

} // namespace docmcp

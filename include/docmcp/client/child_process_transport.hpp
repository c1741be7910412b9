#pragma once

#include <docmcp/client/transport.hpp>
#include <docmcp/config/app_config.hpp>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

#include <sys/types.h>

namespace docmcp {

// ---------------------------------------------------------------------------
// ChildProcessTransport: ITransport over the stdin/stdout pipes of a
// spawned tool host (POSIX fork/exec).
//
//   - Start(): pipe + fork + chdir + execvp. Exec failures travel back over
//     a close-on-exec status pipe, so a missing executable is reported by
//     Start() itself rather than as an early EOF.
//   - The child's stderr is inherited; it is diagnostics only.
//   - Receive() polls the stdout pipe together with an internal wake pipe
//     so Stop() can interrupt a blocked reader.
//   - Stop(): close stdin, SIGTERM, wait up to `grace`, then SIGKILL.
// ---------------------------------------------------------------------------
class ChildProcessTransport : public ITransport {
public:
    // Frames longer than this are discarded and reported as malformed.
    static constexpr std::size_t kMaxLineBytes = 16u * 1024u * 1024u;

    explicit ChildProcessTransport(
        ServerLaunchConfig launch,
        std::chrono::milliseconds grace = std::chrono::milliseconds{2000});

    ~ChildProcessTransport() override;

    [[nodiscard]] Result<void, Error> Start() override;
    [[nodiscard]] Result<void, Error> Send(const Message& message) override;
    [[nodiscard]] Result<std::optional<Message>, Error> Receive() override;
    void Stop() override;

    [[nodiscard]] bool IsRunning() const override;
    [[nodiscard]] std::optional<int> ExitCode() const override;

    [[nodiscard]] pid_t Pid() const;

private:
    // Reap the child if it has exited. Caller holds state_mutex_.
    void PollExitLocked() const;
    void CloseFd(int& fd);

    ServerLaunchConfig launch_;
    std::chrono::milliseconds grace_;

    mutable std::mutex state_mutex_;
    pid_t pid_ = -1;
    mutable std::optional<int> exit_code_;
    bool started_ = false;
    bool stopped_ = false;

    std::mutex write_mutex_;
    int stdin_fd_ = -1;    // parent writes requests here

    int stdout_fd_ = -1;   // parent reads responses here; owned by the reader
    int wake_read_fd_ = -1;
    int wake_write_fd_ = -1;
    std::string read_buffer_;
    bool discarding_ = false;
    bool eof_ = false;
};

} // namespace docmcp

#include <docmcp/client/child_process_transport.hpp>

#include <docmcp/core/log.hpp>
#include <docmcp/protocol/message_codec.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace docmcp {

namespace {

constexpr const char* kComponent = "transport";

Error MakeLaunchError(const std::string& message) {
    return MakeError(ErrorCategory::Launch, "StartTransport", message);
}

Error MakeClosedError(const std::string& operation, const std::string& message) {
    return MakeError(ErrorCategory::TransportClosed, operation, message);
}

std::string ErrnoText(int err) {
    return std::strerror(err);
}

// Writes to a pipe whose reader died must fail with EPIPE instead of
// killing the whole client process.
void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

bool IsBlankLine(const std::string& line) {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r') {
            return false;
        }
    }
    return true;
}

void ClosePair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

} // anonymous namespace

ChildProcessTransport::ChildProcessTransport(ServerLaunchConfig launch,
                                             std::chrono::milliseconds grace)
    : launch_(std::move(launch)), grace_(grace) {}

ChildProcessTransport::~ChildProcessTransport() {
    Stop();
    CloseFd(stdout_fd_);
    CloseFd(wake_read_fd_);
    CloseFd(wake_write_fd_);
}

void ChildProcessTransport::CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// ---------------------------------------------------------------------------
// Start
// ---------------------------------------------------------------------------
Result<void, Error> ChildProcessTransport::Start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (started_ && !stopped_) {
        return Result<void, Error>::Err(
            MakeLaunchError("Transport already started"));
    }
    if (stopped_) {
        // Relaunch after Stop(): the previous reader has been joined.
        CloseFd(stdout_fd_);
        CloseFd(wake_read_fd_);
        CloseFd(wake_write_fd_);
        read_buffer_.clear();
        discarding_ = false;
        eof_ = false;
        exit_code_.reset();
        pid_ = -1;
        started_ = false;
        stopped_ = false;
    }
    if (launch_.executable.empty()) {
        return Result<void, Error>::Err(
            MakeLaunchError("No tool host executable configured"));
    }
    IgnoreSigpipe();

    int in_pipe[2] = {-1, -1};      // parent -> child stdin
    int out_pipe[2] = {-1, -1};     // child stdout -> parent
    int status_pipe[2] = {-1, -1};  // exec errno, closed on successful exec
    int wake_pipe[2] = {-1, -1};
    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0 || pipe2(wake_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        ClosePair(in_pipe);
        ClosePair(out_pipe);
        ClosePair(status_pipe);
        ClosePair(wake_pipe);
        return Result<void, Error>::Err(
            MakeLaunchError("Failed to create pipes: " + ErrnoText(err)));
    }

    // Build argv before fork: the child must not allocate.
    std::vector<std::string> arg_storage;
    arg_storage.push_back(launch_.executable);
    arg_storage.insert(arg_storage.end(), launch_.args.begin(), launch_.args.end());
    std::vector<char*> argv;
    for (auto& arg : arg_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    const char* cwd = launch_.working_directory.has_value()
                          ? launch_.working_directory->c_str()
                          : nullptr;

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        ClosePair(in_pipe);
        ClosePair(out_pipe);
        ClosePair(status_pipe);
        ClosePair(wake_pipe);
        return Result<void, Error>::Err(
            MakeLaunchError("fork failed: " + ErrnoText(err)));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        int child_errno = 0;
        if (dup2(in_pipe[0], STDIN_FILENO) < 0 ||
            dup2(out_pipe[1], STDOUT_FILENO) < 0) {
            child_errno = errno;
        } else if (cwd != nullptr && chdir(cwd) != 0) {
            child_errno = errno;
        } else {
            std::signal(SIGPIPE, SIG_DFL);
            execvp(argv[0], argv.data());
            child_errno = errno;
        }
        ssize_t written = write(status_pipe[1], &child_errno, sizeof(child_errno));
        (void)written;
        _exit(127);
    }

    // Parent.
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(in_pipe[1]);
        close(out_pipe[0]);
        ClosePair(wake_pipe);
        std::string what = "Failed to launch '" + launch_.executable + "'";
        if (cwd != nullptr) {
            what += " in '" + *launch_.working_directory + "'";
        }
        return Result<void, Error>::Err(
            MakeLaunchError(what + ": " + ErrnoText(child_errno)));
    }

    pid_ = pid;
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        stdin_fd_ = in_pipe[1];
    }
    stdout_fd_ = out_pipe[0];
    wake_read_fd_ = wake_pipe[0];
    wake_write_fd_ = wake_pipe[1];
    started_ = true;

    LogInfo(kComponent, "Started tool host '" + launch_.executable +
                            "' (pid " + std::to_string(pid_) + ")");
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Send
// ---------------------------------------------------------------------------
Result<void, Error> ChildProcessTransport::Send(const Message& message) {
    const std::string line = EncodeMessage(message);

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0) {
        return Result<void, Error>::Err(
            MakeClosedError("Send", "Tool host input pipe is closed"));
    }

    const char* data = line.data();
    std::size_t remaining = line.size();
    while (remaining > 0) {
        const ssize_t written = write(stdin_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            return Result<void, Error>::Err(MakeClosedError(
                "Send", "Write to tool host failed: " + ErrnoText(err)));
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
    LogDebug(kComponent, "> " + line.substr(0, line.size() - 1));
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Receive
// ---------------------------------------------------------------------------
Result<std::optional<Message>, Error> ChildProcessTransport::Receive() {
    using R = Result<std::optional<Message>, Error>;

    const auto decode = [](const std::string& line) -> R {
        LogDebug(kComponent, "< " + line);
        auto decoded = DecodeMessage(line);
        if (decoded.IsErr()) {
            return R::Err(std::move(decoded).Error());
        }
        return R::Ok(std::optional<Message>(std::move(decoded).Value()));
    };

    for (;;) {
        const auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            if (discarding_) {
                discarding_ = false;
                return R::Err(MakeError(
                    ErrorCategory::MalformedMessage, "Receive",
                    "Line exceeded " + std::to_string(kMaxLineBytes) +
                        " bytes and was discarded"));
            }
            if (IsBlankLine(line)) {
                continue;
            }
            return decode(line);
        }

        if (discarding_) {
            read_buffer_.clear();
        } else if (read_buffer_.size() > kMaxLineBytes) {
            read_buffer_.clear();
            discarding_ = true;
        }

        if (eof_) {
            // A final line without a terminating newline still counts.
            if (!discarding_ && !IsBlankLine(read_buffer_)) {
                std::string line = std::move(read_buffer_);
                read_buffer_.clear();
                return decode(line);
            }
            read_buffer_.clear();
            return R::Ok(std::nullopt);
        }

        if (stdout_fd_ < 0) {
            return R::Err(MakeClosedError("Receive", "Transport not started"));
        }

        pollfd fds[2] = {
            {stdout_fd_, POLLIN, 0},
            {wake_read_fd_, POLLIN, 0},
        };
        const int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            return R::Err(MakeClosedError("Receive", "poll failed: " + ErrnoText(err)));
        }
        if (fds[1].revents != 0) {
            return R::Err(MakeClosedError("Receive", "Transport stopped"));
        }
        if (fds[0].revents == 0) {
            continue;
        }

        char chunk[64 * 1024];
        const ssize_t n = read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            const int err = errno;
            return R::Err(MakeClosedError("Receive", "Read from tool host failed: " +
                                                         ErrnoText(err)));
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        read_buffer_.append(chunk, static_cast<std::size_t>(n));
    }
}

// ---------------------------------------------------------------------------
// Stop
// ---------------------------------------------------------------------------
void ChildProcessTransport::Stop() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!started_ || stopped_) {
        return;
    }
    stopped_ = true;

    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        CloseFd(stdin_fd_);
    }

    // Wake a reader blocked in poll(). The byte is never drained, so every
    // later poll() returns immediately as well.
    const char wake = 1;
    if (write(wake_write_fd_, &wake, 1) != 1) {
        LogWarn(kComponent, "Failed to signal reader: " + ErrnoText(errno));
    }

    PollExitLocked();
    if (!exit_code_.has_value()) {
        kill(pid_, SIGTERM);
        const auto deadline = std::chrono::steady_clock::now() + grace_;
        while (!exit_code_.has_value() &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
            PollExitLocked();
        }
    }
    if (!exit_code_.has_value()) {
        LogWarn(kComponent, "Tool host (pid " + std::to_string(pid_) +
                                ") ignored SIGTERM; killing");
        kill(pid_, SIGKILL);
        int status = 0;
        pid_t waited = 0;
        do {
            waited = waitpid(pid_, &status, 0);
        } while (waited < 0 && errno == EINTR);
        exit_code_ = waited == pid_ ? DecodeWaitStatus(status) : -1;
    }
    LogInfo(kComponent, "Tool host (pid " + std::to_string(pid_) +
                            ") exited with code " + std::to_string(*exit_code_));
}

void ChildProcessTransport::PollExitLocked() const {
    if (pid_ <= 0 || exit_code_.has_value()) {
        return;
    }
    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        exit_code_ = DecodeWaitStatus(status);
    } else if (waited < 0 && errno == ECHILD) {
        exit_code_ = -1;
    }
}

bool ChildProcessTransport::IsRunning() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!started_ || stopped_) {
        return false;
    }
    PollExitLocked();
    return !exit_code_.has_value();
}

std::optional<int> ChildProcessTransport::ExitCode() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    PollExitLocked();
    return exit_code_;
}

pid_t ChildProcessTransport::Pid() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pid_;
}

} // namespace docmcp

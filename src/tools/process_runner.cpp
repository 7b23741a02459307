#include "tools/process_runner.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <initializer_list>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace diagcollect::tools {

using core::errors::CollectorError;
using core::errors::ErrorCategory;

namespace {

// Exit statuses the child reports before the command itself starts.
constexpr int kChildChdirFailed = 126;
constexpr int kChildExecFailed = 127;
constexpr int kPollIntervalMs = 50;

// One pipe owned by this process; each end is closed at most once.
struct OwnedPipe {
    int read_end = -1;
    int write_end = -1;

    ~OwnedPipe() {
        close_read();
        close_write();
    }

    bool open() {
        int fds[2] = {-1, -1};
        if (pipe(fds) != 0) {
            return false;
        }
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }

    void close_read() {
        if (read_end >= 0) {
            static_cast<void>(close(read_end));
            read_end = -1;
        }
    }

    void close_write() {
        if (write_end >= 0) {
            static_cast<void>(close(write_end));
            write_end = -1;
        }
    }
};

// Reads whatever is available without blocking. Closes the read end on EOF
// or on a hard read error.
void read_available(OwnedPipe& stream, std::string& sink) {
    std::array<char, 4096> chunk{};
    while (stream.read_end >= 0) {
        const ssize_t got = read(stream.read_end, chunk.data(), chunk.size());
        if (got > 0) {
            sink.append(chunk.data(), static_cast<std::size_t>(got));
        } else if (got < 0 && errno == EINTR) {
            continue;
        } else if (got < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        } else {
            stream.close_read();
        }
    }
}

void make_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) {
        static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
    }
}

void exec_in_child(const CommandRequest& request, OwnedPipe& out, OwnedPipe& err) {
    // Own process group, so a timeout can kill everything the command started.
    static_cast<void>(setpgid(0, 0));
    if (chdir(request.working_directory.c_str()) != 0) {
        _exit(kChildChdirFailed);
    }
    static_cast<void>(dup2(out.write_end, STDOUT_FILENO));
    static_cast<void>(dup2(err.write_end, STDERR_FILENO));
    out.close_read();
    out.close_write();
    err.close_read();
    err.close_write();
    execl("/bin/sh", "sh", "-c", request.command.c_str(), static_cast<char*>(nullptr));
    _exit(kChildExecFailed);
}

int decode_wait_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
            continue;
        }
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

core::errors::Result<CommandResult> ProcessRunner::run(
    const CommandRequest& request) const {
    if (request.command.empty()) {
        return CollectorError{ErrorCategory::Input, "Command cannot be empty.",
                              "empty_command"};
    }

    OwnedPipe out;
    OwnedPipe err;
    if (!out.open() || !err.open()) {
        return CollectorError{ErrorCategory::Internal,
                              "Failed to create process pipes.",
                              "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t child = fork();
    if (child < 0) {
        return CollectorError{ErrorCategory::Internal,
                              "Failed to fork process for: " + request.command,
                              "fork_failed"};
    }
    if (child == 0) {
        exec_in_child(request, out, err);
    }
    static_cast<void>(setpgid(child, child));

    out.close_write();
    err.close_write();
    make_nonblocking(out.read_end);
    make_nonblocking(err.read_end);

    CommandResult result;
    int status = 0;
    bool reaped = false;
    bool reap_failed = false;
    const auto deadline = started + std::chrono::milliseconds(request.timeout_ms);

    // After a timeout, output still held open by a stray descendant is not
    // waited for.
    while (!reaped || (!result.timed_out && (out.read_end >= 0 || err.read_end >= 0))) {
        if (!reaped && !result.timed_out && request.timeout_ms > 0 &&
            std::chrono::steady_clock::now() > deadline) {
            result.timed_out = true;
            static_cast<void>(kill(-child, SIGKILL));
        }

        std::array<pollfd, 2> watched{};
        nfds_t count = 0;
        for (const int fd : {out.read_end, err.read_end}) {
            if (fd >= 0) {
                watched[count].fd = fd;
                watched[count].events = POLLIN;
                ++count;
            }
        }
        if (count > 0) {
            static_cast<void>(poll(watched.data(), count, kPollIntervalMs));
        } else {
            static_cast<void>(usleep(kPollIntervalMs * 200));
        }

        read_available(out, result.stdout_text);
        read_available(err, result.stderr_text);

        if (!reaped) {
            const pid_t waited = waitpid(child, &status, WNOHANG);
            if (waited == child) {
                reaped = true;
            } else if (waited < 0 && errno != EINTR) {
                reaped = true;
                reap_failed = true;
            }
        }
    }

    result.exit_code = reap_failed ? -1 : decode_wait_status(status);
    result.duration_ms = std::chrono::duration<double, std::milli>(
                             std::chrono::steady_clock::now() - started)
                             .count();
    return result;
}

}  // namespace diagcollect::tools

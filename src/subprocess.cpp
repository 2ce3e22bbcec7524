#include "subprocess.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <algorithm>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace kiln {

namespace {

// How long to keep draining pipes after the child has been killed
constexpr auto POST_KILL_DRAIN = std::chrono::seconds(2);

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct StreamState {
    int fd = -1;
    std::string* output = nullptr;
    bool* truncated = nullptr;
    std::string partial_line;
};

void emit_lines(StreamState& stream, const char* data, size_t len, const LineSink& on_line) {
    if (!on_line) return;
    stream.partial_line.append(data, len);
    size_t start = 0;
    size_t newline;
    while ((newline = stream.partial_line.find('\n', start)) != std::string::npos) {
        on_line(stream.partial_line.substr(start, newline - start));
        start = newline + 1;
    }
    stream.partial_line.erase(0, start);
}

void flush_partial(StreamState& stream, const LineSink& on_line) {
    if (on_line && !stream.partial_line.empty()) {
        on_line(stream.partial_line);
        stream.partial_line.clear();
    }
}

// Read what is available; returns false at EOF or on error
bool read_available(StreamState& stream, size_t limit, const LineSink& on_line) {
    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read = ::read(stream.fd, buffer, sizeof(buffer));
    if (bytes_read < 0) {
        return errno == EINTR || errno == EAGAIN;
    }
    if (bytes_read == 0) {
        return false;
    }

    size_t n = static_cast<size_t>(bytes_read);
    size_t room = stream.output->size() < limit ? limit - stream.output->size() : 0;
    if (n > room) {
        *stream.truncated = true;
    }
    stream.output->append(buffer, std::min(n, room));
    emit_lines(stream, buffer, n, on_line);
    return true;
}

} // namespace

SubprocessResult Subprocess::run(const SubprocessOptions& options) {
    SubprocessResult result;
    auto start_time = std::chrono::steady_clock::now();

    if (options.argv.empty()) {
        result.error_message = "Empty command";
        return result;
    }
    ignore_sigpipe();

    // Create pipes for stdin/stdout/stderr, plus one that reports exec failure
    int stdin_pipe[2], stdout_pipe[2], stderr_pipe[2], exec_pipe[2];
    if (pipe2(stdin_pipe, O_CLOEXEC) == -1) {
        result.error_message = std::string("Failed to create pipes: ") + std::strerror(errno);
        return result;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        result.error_message = std::string("Failed to create pipes: ") + std::strerror(errno);
        ::close(stdin_pipe[0]); ::close(stdin_pipe[1]);
        return result;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        result.error_message = std::string("Failed to create pipes: ") + std::strerror(errno);
        ::close(stdin_pipe[0]); ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]); ::close(stdout_pipe[1]);
        return result;
    }
    if (pipe2(exec_pipe, O_CLOEXEC) == -1) {
        result.error_message = std::string("Failed to create pipes: ") + std::strerror(errno);
        ::close(stdin_pipe[0]); ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]); ::close(stdout_pipe[1]);
        ::close(stderr_pipe[0]); ::close(stderr_pipe[1]);
        return result;
    }

    std::vector<char*> argv;
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        result.error_message = std::string("Failed to fork process: ") + std::strerror(errno);
        for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1],
                       stderr_pipe[0], stderr_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            ::close(fd);
        }
        return result;
    }

    if (pid == 0) {
        // Child process: own process group so a timeout kills everything it spawned
        setpgid(0, 0);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        std::signal(SIGPIPE, SIG_DFL);

        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);
    ::close(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        ::close(stderr_pipe[0]);
        waitpid(pid, nullptr, 0);
        result.error_message = "Failed to execute " + options.argv[0] + ": " + std::strerror(exec_errno);
        result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return result;
    }

    int stdin_fd = stdin_pipe[1];
    fcntl(stdin_fd, F_SETFL, fcntl(stdin_fd, F_GETFL) | O_NONBLOCK);
    size_t stdin_written = 0;
    if (options.stdin_data.empty()) {
        close_fd(stdin_fd);
    }

    StreamState out{stdout_pipe[0], &result.stdout_output, &result.stdout_truncated, {}};
    StreamState err{stderr_pipe[0], &result.stderr_output, &result.stderr_truncated, {}};

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options.timeout) {
        deadline = start_time + *options.timeout;
    }
    std::optional<std::chrono::steady_clock::time_point> drain_deadline;

    while (out.fd >= 0 || err.fd >= 0) {
        auto now = std::chrono::steady_clock::now();

        if (deadline && !result.timed_out && now >= *deadline) {
            result.timed_out = true;
            if (options.on_timeout) {
                options.on_timeout();
            }
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            close_fd(stdin_fd);
            drain_deadline = std::chrono::steady_clock::now() + POST_KILL_DRAIN;
        }
        if (drain_deadline && now >= *drain_deadline) {
            break;  // A descendant outside the group still holds the pipe
        }

        int poll_timeout = -1;
        std::optional<std::chrono::steady_clock::time_point> next_wakeup;
        if (drain_deadline) {
            next_wakeup = drain_deadline;
        } else if (deadline && !result.timed_out) {
            next_wakeup = deadline;
        }
        if (next_wakeup) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*next_wakeup - now);
            poll_timeout = static_cast<int>(std::max<long long>(0, remaining.count()));
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        int out_index = -1, err_index = -1, in_index = -1;
        if (out.fd >= 0) { out_index = nfds; fds[nfds++] = {out.fd, POLLIN, 0}; }
        if (err.fd >= 0) { err_index = nfds; fds[nfds++] = {err.fd, POLLIN, 0}; }
        if (stdin_fd >= 0) { in_index = nfds; fds[nfds++] = {stdin_fd, POLLOUT, 0}; }

        int ready = ::poll(fds, nfds, poll_timeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) {
            continue;
        }

        if (in_index >= 0 && fds[in_index].revents) {
            if (fds[in_index].revents & (POLLERR | POLLHUP)) {
                close_fd(stdin_fd);  // Program exited or closed stdin early
            } else {
                const std::string& data = options.stdin_data;
                ssize_t written = ::write(stdin_fd, data.data() + stdin_written,
                                          data.size() - stdin_written);
                if (written > 0) {
                    stdin_written += static_cast<size_t>(written);
                } else if (written < 0 && errno != EAGAIN && errno != EINTR) {
                    close_fd(stdin_fd);
                }
                if (stdin_written >= data.size()) {
                    close_fd(stdin_fd);
                }
            }
        }
        if (out_index >= 0 && fds[out_index].revents) {
            if (!read_available(out, options.output_limit, options.on_line)) {
                flush_partial(out, options.on_line);
                close_fd(out.fd);
            }
        }
        if (err_index >= 0 && fds[err_index].revents) {
            if (!read_available(err, options.output_limit, options.on_line)) {
                flush_partial(err, options.on_line);
                close_fd(err.fd);
            }
        }
    }

    close_fd(stdin_fd);
    close_fd(out.fd);
    close_fd(err.fd);

    // The child may have closed its pipes and still be running
    int status = 0;
    pid_t wait_result;
    while (true) {
        wait_result = waitpid(pid, &status, WNOHANG);
        if (wait_result == -1 && errno == EINTR) continue;
        if (wait_result != 0) break;

        if (deadline && !result.timed_out && std::chrono::steady_clock::now() >= *deadline) {
            result.timed_out = true;
            if (options.on_timeout) {
                options.on_timeout();
            }
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (wait_result == -1) {
        result.error_message = std::string("Failed to wait for child process: ") + std::strerror(errno);
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -WTERMSIG(status);
    }

    return result;
}

} // namespace kiln

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <climits>
#include <coderun/call_in_destructor.hh>
#include <coderun/errmsg.hh>
#include <coderun/execute/spawner.hh>
#include <coderun/file_contents.hh>
#include <coderun/file_descriptor.hh>
#include <coderun/macros/throw.hh>
#include <coderun/pipe.hh>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using std::chrono::steady_clock;

namespace {

// Blocks SIGPIPE in the current thread; a SIGPIPE generated meanwhile by
// writing to a closed pipe is discarded before restoring the old mask
class ThreadSigpipeBlocker {
    sigset_t old_mask_{};
    bool blocked_ = false;

    static sigset_t sigpipe_mask() noexcept {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGPIPE);
        return mask;
    }

public:
    ThreadSigpipeBlocker() noexcept {
        sigset_t mask = sigpipe_mask();
        blocked_ = (pthread_sigmask(SIG_BLOCK, &mask, &old_mask_) == 0);
    }

    ThreadSigpipeBlocker(const ThreadSigpipeBlocker&) = delete;
    ThreadSigpipeBlocker(ThreadSigpipeBlocker&&) = delete;
    ThreadSigpipeBlocker& operator=(const ThreadSigpipeBlocker&) = delete;
    ThreadSigpipeBlocker& operator=(ThreadSigpipeBlocker&&) = delete;

    ~ThreadSigpipeBlocker() {
        if (not blocked_) {
            return;
        }
        if (sigismember(&old_mask_, SIGPIPE) == 0) {
            sigset_t pending;
            if (sigpending(&pending) == 0 and sigismember(&pending, SIGPIPE) == 1) {
                sigset_t mask = sigpipe_mask();
                timespec no_wait = {0, 0};
                (void)sigtimedwait(&mask, nullptr, &no_wait);
            }
        }
        (void)pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }
};

// Sends @p errnum and @p what through @p error_fd and _exits; async-signal-safe
[[noreturn]] void send_error_and_exit(int error_fd, int errnum, std::string_view what) noexcept {
    (void)write_all(error_fd, &errnum, sizeof(errnum));
    (void)write_all(error_fd, what);
    _exit(127);
}

// Moves @p fd to @p target_fd without the close-on-exec flag
void move_fd(int fd, int target_fd, int error_fd) noexcept {
    if (fd == target_fd) {
        int flags = fcntl(fd, F_GETFD);
        if (flags == -1 or fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) == -1) {
            send_error_and_exit(error_fd, errno, "fcntl()");
        }
        return;
    }
    while (dup2(fd, target_fd) == -1) {
        if (errno != EINTR) {
            send_error_and_exit(error_fd, errno, "dup2()");
        }
    }
}

// Runs in the forked child, so only async-signal-safe functions may be used
[[noreturn]] void run_child(
    const char* executable,
    char* const* argv,
    int stdin_fd,
    int stdout_fd,
    int stderr_fd,
    int error_fd
) noexcept {
    // Create new process group (useful for killing the whole process group)
    if (setpgid(0, 0)) {
        send_error_and_exit(error_fd, errno, "setpgid()");
    }

    // The spawned program should not inherit the signal mask of the parent thread
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    if (sigprocmask(SIG_SETMASK, &empty_mask, nullptr)) {
        send_error_and_exit(error_fd, errno, "sigprocmask()");
    }

    move_fd(stdin_fd, STDIN_FILENO, error_fd);
    move_fd(stdout_fd, STDOUT_FILENO, error_fd);
    move_fd(stderr_fd, STDERR_FILENO, error_fd);

    execvp(executable, argv);
    send_error_and_exit(error_fd, errno, "execvp()");
}

void set_nonblocking(const FileDescriptor& fd) {
    if (fd.set_nonblocking() == -1) {
        THROW_AS(coderun::execute::LaunchError, "fcntl()", errmsg());
    }
}

Pipe make_pipe() {
    auto pipe = open_pipe(O_CLOEXEC);
    if (not pipe) {
        THROW_AS(coderun::execute::LaunchError, "pipe2()", errmsg());
    }
    return std::move(*pipe);
}

int exit_code_of(const siginfo_t& si) noexcept {
    if (si.si_code == CLD_EXITED) {
        return si.si_status;
    }
    return 128 + si.si_status; // CLD_KILLED or CLD_DUMPED
}

} // namespace

namespace coderun::execute {

SpawnResult spawn(
    const CommandSpec& command, std::string_view stdin_data, const SpawnOptions& options
) {
    using std::chrono_literals::operator""ns;
    using std::chrono_literals::operator""ms;

    if (command.args.empty()) {
        THROW_AS(LaunchError, "spawn(): args cannot be empty, args[0] is the program name");
    }
    if (options.real_time_limit.has_value() and options.real_time_limit.value() <= 0ns) {
        THROW_AS(LaunchError, "If set, real_time_limit has to be greater than 0");
    }

    // Convert args before fork(), so that the child does not need to allocate
    std::vector<char*> argv;
    argv.reserve(command.args.size() + 1);
    for (const auto& arg : command.args) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
        argv.emplace_back(const_cast<char*>(arg.c_str()));
    }
    argv.emplace_back(nullptr);

    Pipe stdin_pipe = make_pipe();
    Pipe stdout_pipe = make_pipe();
    Pipe stderr_pipe = make_pipe();
    Pipe error_pipe = make_pipe(); // Errors from the child before execvp() succeeds

    auto start = steady_clock::now();
    std::optional<steady_clock::time_point> deadline;
    if (options.real_time_limit) {
        deadline = start + *options.real_time_limit;
    }

    pid_t pid = fork();
    if (pid == -1) {
        THROW_AS(LaunchError, "fork()", errmsg());
    }
    if (pid == 0) {
        run_child(
            command.executable.c_str(),
            argv.data(),
            stdin_pipe.readable,
            stdout_pipe.writable,
            stderr_pipe.writable,
            error_pipe.writable
        );
    }

    // Also done by the child; here to make kill(-pid, ...) work right away
    (void)setpgid(pid, pid);

    // Useful when exception is thrown
    CallInDtor kill_and_wait_child_guard([pid]() noexcept {
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
        siginfo_t si;
        while (waitid(P_PID, pid, &si, WEXITED) == -1 and errno == EINTR) {
        }
    });

    (void)stdin_pipe.readable.close();
    (void)stdout_pipe.writable.close();
    (void)stderr_pipe.writable.close();
    (void)error_pipe.writable.close();

    // Reaches end-of-file as soon as execvp() succeeds (close-on-exec)
    std::string child_error = get_file_contents(error_pipe.readable);
    if (not child_error.empty()) {
        int errnum = 0;
        std::string_view what = child_error;
        if (child_error.size() >= sizeof(errnum)) {
            std::memcpy(&errnum, child_error.data(), sizeof(errnum));
            what.remove_prefix(sizeof(errnum));
        }
        THROW_AS(LaunchError, what, " of '", command.executable, '\'', errmsg(errnum));
    }

    ThreadSigpipeBlocker sigpipe_blocker;
    SpawnResult res;

    FileDescriptor& stdin_fd = stdin_pipe.writable;
    FileDescriptor& stdout_fd = stdout_pipe.readable;
    FileDescriptor& stderr_fd = stderr_pipe.readable;
    set_nonblocking(stdin_fd);
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);

    size_t stdin_pos = 0;
    if (stdin_data.empty()) {
        (void)stdin_fd.close(); // Signals end-of-input to the child
    }

    auto kill_child_group = [&] {
        (void)kill(-pid, SIGKILL);
        res.killed_by_real_time_limit = true;
    };

    std::array<char, 65536> buff{};
    // Closes fd once the end-of-file is reached
    auto drain = [&](FileDescriptor& fd, std::string& dest, bool& truncated) {
        ssize_t len = read(fd, buff.data(), buff.size());
        if (len == 0) {
            (void)fd.close();
            return;
        }
        if (len < 0) {
            if (errno == EAGAIN or errno == EINTR) {
                return;
            }
            THROW_AS(LaunchError, "read()", errmsg());
        }

        size_t to_append = len;
        if (options.max_output_size) {
            size_t space_left =
                *options.max_output_size - std::min(*options.max_output_size, dest.size());
            if (to_append > space_left) {
                to_append = space_left;
                truncated = true;
            }
        }
        dest.append(buff.data(), to_append);
    };

    while (stdout_fd.is_open() or stderr_fd.is_open()) {
        int timeout_ms = -1;
        if (deadline) {
            auto time_left = *deadline - steady_clock::now();
            if (time_left <= 0ns) {
                // Descendants that left the process group may keep the pipes
                // open, so stop reading
                kill_child_group();
                break;
            }
            timeout_ms = static_cast<int>(std::min<int64_t>(
                std::chrono::ceil<std::chrono::milliseconds>(time_left).count(), INT_MAX
            ));
        }

        // Negative fds are ignored by poll()
        std::array<pollfd, 3> pfds = {{
            {.fd = stdin_fd, .events = POLLOUT, .revents = 0},
            {.fd = stdout_fd, .events = POLLIN, .revents = 0},
            {.fd = stderr_fd, .events = POLLIN, .revents = 0},
        }};
        int rc = poll(pfds.data(), pfds.size(), timeout_ms);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW_AS(LaunchError, "poll()", errmsg());
        }
        if (rc == 0) {
            continue; // The deadline is checked at the beginning of the loop
        }

        if (pfds[0].revents & (POLLOUT | POLLERR | POLLHUP)) {
            size_t chunk = std::min<size_t>(stdin_data.size() - stdin_pos, 65536);
            ssize_t len = write(stdin_fd, stdin_data.data() + stdin_pos, chunk);
            if (len >= 0) {
                stdin_pos += len;
                if (stdin_pos == stdin_data.size()) {
                    (void)stdin_fd.close(); // Signals end-of-input to the child
                }
            } else if (errno == EPIPE) {
                (void)stdin_fd.close(); // The child does not read its stdin any more
            } else if (errno != EAGAIN and errno != EINTR) {
                THROW_AS(LaunchError, "write()", errmsg());
            }
        }
        if (pfds[1].revents & (POLLIN | POLLERR | POLLHUP)) {
            drain(stdout_fd, res.stdout_data, res.stdout_truncated);
        }
        if (pfds[2].revents & (POLLIN | POLLERR | POLLHUP)) {
            drain(stderr_fd, res.stderr_data, res.stderr_truncated);
        }
    }
    // The child cannot receive more input once it closed both of its outputs
    (void)stdin_fd.close();

    auto wait_for_child = [&](int wait_options) {
        siginfo_t si;
        si.si_pid = 0;
        while (waitid(P_PID, pid, &si, WEXITED | wait_options) == -1) {
            if (errno != EINTR) {
                THROW_AS(LaunchError, "waitid()", errmsg());
            }
        }
        return si;
    };

    siginfo_t si;
    if (deadline and not res.killed_by_real_time_limit) {
        for (;;) {
            si = wait_for_child(WNOHANG);
            if (si.si_pid != 0) {
                break;
            }
            if (steady_clock::now() >= *deadline) {
                kill_child_group();
                si = wait_for_child(0);
                break;
            }
            std::this_thread::sleep_for(10ms);
        }
    } else {
        si = wait_for_child(0);
    }
    kill_and_wait_child_guard.cancel();

    res.exit_code = exit_code_of(si);
    res.runtime = steady_clock::now() - start;
    return res;
}

} // namespace coderun::execute

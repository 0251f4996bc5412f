#include "runtime/subprocess.hpp"
#include "util/unique_fd.hpp"
#include <spdlog/spdlog.h>

#include <sys/syscall.h>
#include <sys/wait.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <csignal>
#include <cerrno>
#include <cstring>

#ifndef SYS_pidfd_open
#define SYS_pidfd_open 434
#endif

namespace execbox::runtime {

// ============================================================================
// Utility
// ============================================================================

CStringArray::CStringArray(const std::vector<std::string>& strings)
    : strings_(strings) {
    ptrs_.reserve(strings_.size() + 1);
    for (auto& s : strings_) {
        ptrs_.push_back(s.data());
    }
    ptrs_.push_back(nullptr);
}

std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

std::vector<std::string> sandbox_environment() {
    return {
        "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin",
        "HOME=/tmp",
        "TMPDIR=/tmp",
        "LANG=C.UTF-8",
        "PYTHONUNBUFFERED=1",
        "PYTHONDONTWRITEBYTECODE=1",
    };
}

int open_pidfd(pid_t pid) {
    return static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
}

ExitStatus decode_wait_status(int status) {
    ExitStatus result;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

bool wait_for_pid(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid({}) failed: {}", pid, strerror(errno));
            return false;
        }
    }
    return true;
}

// ============================================================================
// Process spawning
// ============================================================================

bool redirect_fd(int from, int to) {
    if (from == to) {
        int flags = ::fcntl(to, F_GETFD);
        return flags >= 0 && ::fcntl(to, F_SETFD, flags & ~FD_CLOEXEC) == 0;
    }
    return ::dup2(from, to) == to;
}

namespace {

[[noreturn]] void child_fail(int error_fd) {
    int err = errno;
    ssize_t ignored = ::write(error_fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

} // namespace

pid_t spawn_process(const std::vector<std::string>& args,
                    int stdin_fd, int stdout_fd, int stderr_fd,
                    std::string& error) {
    if (args.empty()) {
        error = "empty command";
        return -1;
    }

    CStringArray argv(args);
    util::Pipe error_pipe;
    if (!util::make_pipe(error_pipe)) {
        error = std::string("pipe: ") + strerror(errno);
        return -1;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork: ") + strerror(errno);
        return -1;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        int efd = error_pipe.write_end.get();
        ::setpgid(0, 0);
        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        if (!redirect_fd(stdin_fd, STDIN_FILENO) ||
            !redirect_fd(stdout_fd, STDOUT_FILENO) ||
            !redirect_fd(stderr_fd, STDERR_FILENO)) {
            child_fail(efd);
        }

        ::execvp(argv.data()[0], argv.data());
        child_fail(efd);
    }

    // Parent: the error pipe reaches EOF once exec succeeded
    error_pipe.write_end.reset();
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(error_pipe.read_end.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status;
        wait_for_pid(pid, status);
        error = "exec " + args.front() + ": " + strerror(child_errno);
        return -1;
    }

    return pid;
}

CommandResult run_command(const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout) {
    CommandResult result;

    util::UniqueFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    util::Pipe out;
    if (!dev_null.is_open() || !util::make_pipe(out)) {
        result.error = std::string("setup: ") + strerror(errno);
        return result;
    }

    pid_t pid = spawn_process(args, dev_null.get(), out.write_end.get(),
                              out.write_end.get(), result.error);
    if (pid < 0) {
        return result;
    }
    result.launched = true;
    out.write_end.reset();

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = out.read_end.get();
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed for '{}': {}", join_args(args), strerror(errno));
            result.timed_out = true;
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(pfd.fd, buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }

    if (result.timed_out) {
        spdlog::warn("Command '{}' timed out after {}ms, killing", join_args(args), timeout.count());
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    if (wait_for_pid(pid, status)) {
        ExitStatus exit = decode_wait_status(status);
        result.exit_code = exit.exit_code ? *exit.exit_code : 128 + exit.signal.value_or(0);
    }

    return result;
}

} // namespace execbox::runtime

#include "runtime/runner.hpp"
#include "util/errors.hpp"
#include "util/unique_fd.hpp"
#include <spdlog/spdlog.h>

#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <vector>
#include <algorithm>
#include <limits>

namespace execbox::runtime {

using Clock = std::chrono::steady_clock;

const char* run_state_to_string(RunState state) {
    switch (state) {
        case RunState::CREATED: return "created";
        case RunState::LAUNCHING: return "launching";
        case RunState::RUNNING: return "running";
        case RunState::EXITED_NORMALLY: return "exited_normally";
        case RunState::KILLED_ON_TIMEOUT: return "killed_on_timeout";
        case RunState::KILLED_ON_RESOURCE_LIMIT: return "killed_on_resource_limit";
        case RunState::CANCELLED: return "cancelled";
        case RunState::LAUNCH_FAILED: return "launch_failed";
        case RunState::CLEANED: return "cleaned";
        default: return "unknown";
    }
}

void StreamCapture::append(const char* data, size_t size) {
    total_bytes_ += size;
    if (data_.size() >= limit_) {
        truncated_ = truncated_ || size > 0;
        return;
    }
    size_t room = limit_ - data_.size();
    if (size > room) {
        data_.append(data, room);
        truncated_ = true;
    } else {
        data_.append(data, size);
    }
}

namespace {

// Output pipe read by the runner; the write end goes to the sandbox
struct CapturePipe {
    util::UniqueFd read_end;
    StreamCapture capture;

    explicit CapturePipe(size_t limit) : capture(limit) {}

    bool open() const { return read_end.is_open(); }

    // Read whatever is available; closes the pipe on EOF or error
    void drain_available() {
        char buffer[8192];
        while (read_end.is_open()) {
            ssize_t n = ::read(read_end.get(), buffer, sizeof(buffer));
            if (n > 0) {
                capture.append(buffer, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                return;
            }
            read_end.reset();
        }
    }
};

bool make_capture_pipe(CapturePipe& pipe, util::UniqueFd& write_end) {
    util::Pipe p;
    if (!util::make_pipe(p)) {
        return false;
    }
    // Only our end is non-blocking; the sandbox writes normally
    int flags = ::fcntl(p.read_end.get(), F_GETFL);
    if (flags < 0 || ::fcntl(p.read_end.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return false;
    }
    pipe.read_end = std::move(p.read_end);
    write_end = std::move(p.write_end);
    return true;
}

int poll_timeout_ms(Clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    if (remaining.count() <= 0) {
        return 0;
    }
    // Round up so we never wake just before the deadline and spin
    return static_cast<int>(std::min<std::chrono::milliseconds::rep>(
        remaining.count(), std::numeric_limits<int>::max() - 1)) + 1;
}

// Keep reading both pipes until EOF on both or the deadline passes
void drain_until(CapturePipe& out, CapturePipe& err, Clock::time_point deadline) {
    while (out.open() || err.open()) {
        int timeout = poll_timeout_ms(deadline);
        if (timeout == 0) {
            return;
        }

        struct pollfd fds[2];
        fds[0] = {out.open() ? out.read_end.get() : -1, POLLIN, 0};
        fds[1] = {err.open() ? err.read_end.get() : -1, POLLIN, 0};

        int ready = ::poll(fds, 2, timeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("poll failed while draining output: {}", strerror(errno));
            return;
        }
        if (fds[0].revents) out.drain_available();
        if (fds[1].revents) err.drain_available();
    }
}

} // namespace

RawOutcome SandboxRunner::run(const SandboxSpec& spec, const CancelToken* cancel) {
    RawOutcome outcome;
    const auto started = Clock::now();

    auto transition = [&](RunState next) {
        spdlog::trace("Request {}: {} -> {}", spec.request_id,
                      run_state_to_string(outcome.final_state), run_state_to_string(next));
        outcome.final_state = next;
    };

    auto finish = [&](CapturePipe* out, CapturePipe* err) {
        if (out) {
            outcome.stdout_truncated = out->capture.truncated();
            outcome.stdout_text = out->capture.take();
        }
        if (err) {
            outcome.stderr_truncated = err->capture.truncated();
            outcome.stderr_text = err->capture.take();
        }
        outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - started);
        outcome.cleaned = true;
        spdlog::trace("Request {}: {} -> {}", spec.request_id,
                      run_state_to_string(outcome.final_state),
                      run_state_to_string(RunState::CLEANED));
        return outcome;
    };

    auto fail_launch = [&](const std::string& reason) {
        spdlog::error("Request {}: launch failed: {}", spec.request_id, reason);
        outcome.launch_failed = true;
        outcome.failure_reason = reason;
        transition(RunState::LAUNCH_FAILED);
    };

    CapturePipe out(spec.max_output_bytes);
    CapturePipe err(spec.max_output_bytes);
    util::UniqueFd out_write;
    util::UniqueFd err_write;
    if (!make_capture_pipe(out, out_write) || !make_capture_pipe(err, err_write)) {
        fail_launch(std::string("cannot create output pipes: ") + strerror(errno));
        return finish(nullptr, nullptr);
    }

    if (cancel && cancel->cancelled()) {
        outcome.cancelled = true;
        outcome.failure_reason = "cancelled before launch";
        transition(RunState::CANCELLED);
        return finish(&out, &err);
    }

    transition(RunState::LAUNCHING);
    std::unique_ptr<SandboxHandle> handle;
    try {
        handle = engine_.launch(spec, SandboxStdio{out_write.get(), err_write.get()});
    } catch (const LaunchError& e) {
        fail_launch(e.what());
        return finish(&out, &err);
    }

    // Only the sandbox holds the write ends now, so EOF means it is done writing
    out_write.reset();
    err_write.reset();

    transition(RunState::RUNNING);
    outcome.pid = handle->pid();
    outcome.isolation = handle->isolation();
    outcome.memory_rlimit = outcome.isolation.memory_rlimit;

    const auto deadline = Clock::now() + spec.timeout;
    const int cancel_fd = cancel ? cancel->fd() : -1;
    const int peer_fd = cancel ? cancel->peer_fd() : -1;
    bool exited = false;

    while (!exited) {
        int timeout = poll_timeout_ms(deadline);
        if (timeout == 0) {
            outcome.timed_out = true;
            break;
        }
        if (cancel && cancel->cancelled()) {
            outcome.cancelled = true;
            break;
        }

        struct pollfd fds[5];
        fds[0] = {out.open() ? out.read_end.get() : -1, POLLIN, 0};
        fds[1] = {err.open() ? err.read_end.get() : -1, POLLIN, 0};
        fds[2] = {handle->exit_fd(), POLLIN, 0};
        fds[3] = {cancel_fd, POLLIN, 0};
        fds[4] = {peer_fd, POLLRDHUP, 0};

        int ready = ::poll(fds, 5, timeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            outcome.failure_reason = std::string("poll failed: ") + strerror(errno);
            spdlog::error("Request {}: {}", spec.request_id, outcome.failure_reason);
            outcome.cancelled = true;
            break;
        }

        if (fds[0].revents) out.drain_available();
        if (fds[1].revents) err.drain_available();
        if (fds[2].revents) {
            exited = true;
        }
        if (fds[3].revents) {
            outcome.cancelled = true;
            break;
        }
        if (fds[4].revents & (POLLRDHUP | POLLHUP | POLLERR)) {
            spdlog::info("Request {}: client went away, cancelling", spec.request_id);
            outcome.cancelled = true;
            break;
        }
        // Without a pollable exit fd, EOF on both streams is the best signal
        if (handle->exit_fd() < 0 && !out.open() && !err.open()) {
            exited = true;
        }
    }

    if (outcome.timed_out || outcome.cancelled) {
        if (outcome.timed_out) {
            spdlog::info("Request {}: timed out after {}s, killing sandbox",
                         spec.request_id, spec.timeout.count());
        }
        handle->kill();
        outcome.killed_by_runner = true;
        drain_until(out, err, Clock::now() + spec.drain_timeout);
    } else {
        // Leftover processes may still hold the pipes after the root exited
        drain_until(out, err, Clock::now() + spec.drain_timeout);
        if (out.open() || err.open()) {
            spdlog::debug("Request {}: output still open after exit, killing leftovers",
                          spec.request_id);
            handle->kill();
            drain_until(out, err, Clock::now() + spec.drain_timeout);
        }
    }

    ExitStatus status = handle->collect();
    outcome.exit_code = status.exit_code;
    outcome.signal = status.signal;

    if (!status.launch_error.empty()) {
        fail_launch(status.launch_error);
    } else if (outcome.timed_out) {
        transition(RunState::KILLED_ON_TIMEOUT);
    } else if (outcome.cancelled) {
        transition(RunState::CANCELLED);
    } else {
        if (outcome.signal) {
            outcome.oom_killed = handle->oom_killed();
            outcome.oom_authoritative = handle->oom_authoritative();
        }
        if (outcome.oom_killed || (outcome.signal == SIGKILL && !outcome.oom_authoritative)) {
            transition(RunState::KILLED_ON_RESOURCE_LIMIT);
        } else {
            transition(RunState::EXITED_NORMALLY);
        }
    }

    // The outcome is already decided; a failed teardown is only reported
    if (!handle->release()) {
        outcome.cleanup_failed = true;
        spdlog::warn("Request {}: sandbox cleanup failed", spec.request_id);
    }
    handle.reset();

    return finish(&out, &err);
}

} // namespace execbox::runtime

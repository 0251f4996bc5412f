/**
 * execbox Sandbox Runner
 *
 * Launches one isolated process per call, races its exit against the
 * wall-clock deadline and cancellation, captures bounded stdout/stderr and
 * tears the sandbox down on every path before returning.
 */
#pragma once
#include <string>
#include <optional>
#include <chrono>
#include "runtime/engine.hpp"
#include "runtime/provisioner.hpp"
#include "runtime/cancel_token.hpp"

namespace execbox::runtime {

// Per-execution lifecycle; CLEANED is always reached
enum class RunState {
    CREATED,
    LAUNCHING,
    RUNNING,
    EXITED_NORMALLY,
    KILLED_ON_TIMEOUT,
    KILLED_ON_RESOURCE_LIMIT,
    CANCELLED,
    LAUNCH_FAILED,
    CLEANED
};

const char* run_state_to_string(RunState state);

// First `limit` bytes of a stream; everything past that is read and dropped
class StreamCapture {
public:
    explicit StreamCapture(size_t limit) : limit_(limit) {}

    void append(const char* data, size_t size);

    const std::string& data() const { return data_; }
    std::string take() { return std::move(data_); }
    bool truncated() const { return truncated_; }
    size_t total_bytes() const { return total_bytes_; }

private:
    size_t limit_;
    std::string data_;
    bool truncated_ = false;
    size_t total_bytes_ = 0;
};

// Everything observed about one run, before classification
struct RawOutcome {
    std::optional<int> exit_code;
    std::optional<int> signal;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    bool timed_out = false;
    bool launch_failed = false;
    bool cancelled = false;
    bool killed_by_runner = false;  // We sent the kill (timeout or cancel)
    bool oom_killed = false;        // Engine saw the memory cap trigger
    bool oom_authoritative = false; // oom_killed is a real answer, not a default
    bool memory_rlimit = false;     // Memory capped by RLIMIT_AS, no OOM accounting
    std::string failure_reason;

    RunState final_state = RunState::CREATED;  // Last state before CLEANED
    bool cleaned = false;
    bool cleanup_failed = false;
    IsolationStatus isolation;
    pid_t pid = -1;
    std::chrono::milliseconds duration{0};
};

class SandboxRunner {
public:
    explicit SandboxRunner(IsolationEngine& engine) : engine_(engine) {}

    // Never throws for sandbox failures: launch problems come back as
    // launch_failed, everything else as observed exit status.
    RawOutcome run(const SandboxSpec& spec, const CancelToken* cancel = nullptr);

private:
    IsolationEngine& engine_;
};

} // namespace execbox::runtime

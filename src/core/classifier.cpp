#include "core/classifier.hpp"
#include <spdlog/spdlog.h>
#include <csignal>

namespace execbox::core {

namespace {

bool contains_marker(const std::string& text, const std::vector<std::string>& markers) {
    for (const auto& marker : markers) {
        if (!marker.empty() && text.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void append_note(std::string& text, const std::string& note) {
    if (!text.empty() && text.back() != '\n') {
        text += '\n';
    }
    text += note;
}

ExecutionStatus decide(const runtime::RawOutcome& raw,
                       const std::vector<std::string>& memory_markers) {
    if (raw.timed_out) {
        return ExecutionStatus::TIMEOUT;
    }
    if (raw.launch_failed || raw.cancelled) {
        return ExecutionStatus::INTERNAL_ERROR;
    }
    if (raw.oom_killed) {
        return ExecutionStatus::MEMORY_EXCEEDED;
    }
    if (raw.signal) {
        // The only SIGKILL we send is on timeout or cancel, both handled above.
        // Without OOM accounting the memory cap is the likeliest sender.
        if (*raw.signal == SIGKILL && !raw.killed_by_runner && !raw.oom_authoritative) {
            return ExecutionStatus::MEMORY_EXCEEDED;
        }
        if (*raw.signal == SIGXCPU) {
            return ExecutionStatus::TIMEOUT;
        }
        return ExecutionStatus::RUNTIME_ERROR;
    }
    if (!raw.exit_code) {
        // Neither an exit code nor a signal: the process was never reaped
        return ExecutionStatus::INTERNAL_ERROR;
    }
    if (*raw.exit_code == 0) {
        return ExecutionStatus::SUCCESS;
    }
    if (raw.memory_rlimit && contains_marker(raw.stderr_text, memory_markers)) {
        return ExecutionStatus::MEMORY_EXCEEDED;
    }
    return ExecutionStatus::RUNTIME_ERROR;
}

} // namespace

ExecutionOutcome classify(const runtime::RawOutcome& raw,
                          const std::string& request_id,
                          const std::vector<std::string>& memory_markers) {
    ExecutionOutcome outcome;
    outcome.request_id = request_id;
    outcome.status = decide(raw, memory_markers);
    outcome.stdout_text = raw.stdout_text;
    outcome.stderr_text = raw.stderr_text;
    outcome.stdout_truncated = raw.stdout_truncated;
    outcome.stderr_truncated = raw.stderr_truncated;
    outcome.exit_code = raw.exit_code;
    outcome.signal = raw.signal;
    outcome.duration_ms = static_cast<uint64_t>(raw.duration.count());

    switch (outcome.status) {
        case ExecutionStatus::TIMEOUT:
            if (raw.timed_out) {
                // Our kill, not the code's exit
                outcome.exit_code.reset();
                outcome.signal.reset();
            }
            break;
        case ExecutionStatus::INTERNAL_ERROR:
            if (raw.launch_failed) {
                append_note(outcome.stderr_text, "sandbox launch failed: " + raw.failure_reason);
            } else if (raw.cancelled) {
                append_note(outcome.stderr_text, raw.failure_reason.empty()
                                                     ? "execution cancelled"
                                                     : "execution cancelled: " + raw.failure_reason);
            } else {
                append_note(outcome.stderr_text, "sandbox exit status unavailable");
            }
            outcome.exit_code.reset();
            outcome.signal.reset();
            break;
        case ExecutionStatus::RUNTIME_ERROR:
            if (raw.signal && outcome.stderr_text.empty()) {
                outcome.stderr_text = "Killed by signal " + std::to_string(*raw.signal);
            }
            break;
        case ExecutionStatus::MEMORY_EXCEEDED:
        case ExecutionStatus::SUCCESS:
        default:
            break;
    }

    spdlog::trace("Request {} classified as {}", request_id,
                  execution_status_to_string(outcome.status));
    return outcome;
}

} // namespace execbox::core

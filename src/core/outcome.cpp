#include "core/outcome.hpp"

namespace execbox::core {

using json = nlohmann::json;

const char* execution_status_to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCESS: return "success";
        case ExecutionStatus::TIMEOUT: return "timeout";
        case ExecutionStatus::MEMORY_EXCEEDED: return "memory_exceeded";
        case ExecutionStatus::RUNTIME_ERROR: return "runtime_error";
        case ExecutionStatus::INTERNAL_ERROR: return "internal_error";
        default: return "unknown";
    }
}

bool execution_status_from_string(const std::string& str, ExecutionStatus& out) {
    for (auto status : {ExecutionStatus::SUCCESS, ExecutionStatus::TIMEOUT,
                        ExecutionStatus::MEMORY_EXCEEDED, ExecutionStatus::RUNTIME_ERROR,
                        ExecutionStatus::INTERNAL_ERROR}) {
        if (str == execution_status_to_string(status)) {
            out = status;
            return true;
        }
    }
    return false;
}

bool is_code_attributable(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCESS:
        case ExecutionStatus::TIMEOUT:
        case ExecutionStatus::MEMORY_EXCEEDED:
        case ExecutionStatus::RUNTIME_ERROR:
            return true;
        case ExecutionStatus::INTERNAL_ERROR:
        default:
            return false;
    }
}

json ExecutionOutcome::to_json() const {
    json j;
    j["request_id"] = request_id;
    j["status"] = execution_status_to_string(status);
    j["stdout"] = stdout_text;
    j["stderr"] = stderr_text;
    j["stdout_truncated"] = stdout_truncated;
    j["stderr_truncated"] = stderr_truncated;
    j["exit_code"] = exit_code ? json(*exit_code) : json(nullptr);
    if (signal) {
        j["signal"] = *signal;
    }
    j["duration_ms"] = duration_ms;
    return j;
}

int transport_status(ExecutionStatus status) {
    return is_code_attributable(status) ? 200 : 500;
}

int transport_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return 400;
        case ErrorKind::OVERLOADED: return 429;
        case ErrorKind::SHUTTING_DOWN: return 503;
        case ErrorKind::PROVISION:
        case ErrorKind::LAUNCH:
        case ErrorKind::CONFIG:
        default:
            return 500;
    }
}

} // namespace execbox::core

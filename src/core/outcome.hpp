/**
 * execbox Execution Outcome
 *
 * The single, immutable result of one request. SUCCESS, TIMEOUT,
 * MEMORY_EXCEEDED and RUNTIME_ERROR are attributable to the submitted code;
 * INTERNAL_ERROR is an infrastructure fault.
 */
#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "util/errors.hpp"

namespace execbox::core {

enum class ExecutionStatus {
    SUCCESS,
    TIMEOUT,
    MEMORY_EXCEEDED,
    RUNTIME_ERROR,
    INTERNAL_ERROR
};

const char* execution_status_to_string(ExecutionStatus status);
// Returns false for unknown names
bool execution_status_from_string(const std::string& str, ExecutionStatus& out);

// Whether the status describes what the code did (as opposed to our failure)
bool is_code_attributable(ExecutionStatus status);

struct ExecutionOutcome {
    std::string request_id;
    ExecutionStatus status = ExecutionStatus::INTERNAL_ERROR;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::optional<int> exit_code;
    std::optional<int> signal;
    uint64_t duration_ms = 0;

    nlohmann::json to_json() const;
};

// HTTP-equivalent status for transports
int transport_status(ExecutionStatus status);
int transport_status(ErrorKind kind);

} // namespace execbox::core

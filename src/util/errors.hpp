/**
 * execbox Errors
 *
 * Failure taxonomy for everything that is NOT attributable to the submitted
 * code. Code-attributable results (timeout, memory, runtime error) are
 * ExecutionOutcome values, never exceptions.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace execbox {

enum class ErrorKind {
    VALIDATION,     // Bad input, rejected before provisioning
    PROVISION,      // Local setup failure (scratch artifact)
    LAUNCH,         // Isolation engine could not start the sandbox
    OVERLOADED,     // Admission bound reached
    SHUTTING_DOWN,  // Dispatcher no longer accepts work
    CONFIG          // Invalid configuration
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:    return "VALIDATION";
        case ErrorKind::PROVISION:     return "PROVISION";
        case ErrorKind::LAUNCH:        return "LAUNCH";
        case ErrorKind::OVERLOADED:    return "OVERLOADED";
        case ErrorKind::SHUTTING_DOWN: return "SHUTTING_DOWN";
        case ErrorKind::CONFIG:        return "CONFIG";
        default: return "UNKNOWN";
    }
}

// Only an overloaded dispatcher may succeed on a plain retry
inline bool error_kind_retryable(ErrorKind kind) {
    return kind == ErrorKind::OVERLOADED;
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    bool retryable() const { return error_kind_retryable(kind_); }

private:
    ErrorKind kind_;
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorKind::VALIDATION, message) {}
};

class ProvisionError : public Error {
public:
    explicit ProvisionError(const std::string& message)
        : Error(ErrorKind::PROVISION, message) {}
};

class LaunchError : public Error {
public:
    explicit LaunchError(const std::string& message)
        : Error(ErrorKind::LAUNCH, message) {}
};

class OverloadedError : public Error {
public:
    explicit OverloadedError(const std::string& message)
        : Error(ErrorKind::OVERLOADED, message) {}
};

class ShuttingDownError : public Error {
public:
    explicit ShuttingDownError(const std::string& message)
        : Error(ErrorKind::SHUTTING_DOWN, message) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(ErrorKind::CONFIG, message) {}
};

} // namespace execbox

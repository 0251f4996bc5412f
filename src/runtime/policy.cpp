#include "runtime/policy.hpp"
#include <string>

namespace execbox::runtime {

const char* engine_kind_to_string(EngineKind kind) {
    switch (kind) {
        case EngineKind::NAMESPACE: return "namespace";
        case EngineKind::DOCKER:    return "docker";
        default: return "unknown";
    }
}

bool engine_kind_from_string(const std::string& str, EngineKind& out) {
    if (str == "namespace" || str == "ns") {
        out = EngineKind::NAMESPACE;
        return true;
    }
    if (str == "docker") {
        out = EngineKind::DOCKER;
        return true;
    }
    return false;
}

std::vector<std::string> SandboxPolicy::validate() const {
    std::vector<std::string> problems;

    if (network_enabled) {
        problems.push_back("network_enabled must be false");
    }
    if (filesystem_writable) {
        problems.push_back("filesystem_writable must be false");
    }
    if (timeout_seconds == 0) {
        problems.push_back("timeout_seconds must be positive");
    } else if (timeout_seconds > MAX_TIMEOUT_SECONDS) {
        problems.push_back("timeout_seconds must be at most " + std::to_string(MAX_TIMEOUT_SECONDS));
    }
    if (limits.memory_limit_bytes == 0) {
        problems.push_back("memory_limit_bytes must be positive");
    }
    if (limits.max_pids == 0) {
        problems.push_back("max_pids must be positive");
    }
    if (interpreter.empty() || interpreter.front().empty()) {
        problems.push_back("interpreter must not be empty");
    }
    if (scratch_root.empty() || scratch_root.front() != '/') {
        problems.push_back("scratch_root must be an absolute path");
    }
    if (max_output_bytes == 0) {
        problems.push_back("max_output_bytes must be positive");
    }
    if (engine == EngineKind::DOCKER && image.empty()) {
        problems.push_back("image is required for the docker engine");
    }
    for (const auto& bind : rootfs_binds) {
        if (bind.empty() || bind.front() != '/') {
            problems.push_back("rootfs bind '" + bind + "' must be an absolute path");
        }
    }

    return problems;
}

} // namespace execbox::runtime

/**
 * execbox Sandbox Policy
 *
 * Process-wide, read-only description of the isolation envelope every
 * execution runs in. Loaded once at startup and shared between requests
 * as std::shared_ptr<const SandboxPolicy>.
 */
#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <memory>

namespace execbox::runtime {

// Resource limits for sandboxed processes
struct ResourceLimits {
    uint64_t memory_limit_bytes = 128 * 1024 * 1024;  // Hard cap, killed on excess
    uint64_t max_pids = 64;                           // Fork bomb guard
    uint64_t cpu_shares = 0;                          // Relative CPU weight, 0 = unset
    uint64_t tmpfs_size_bytes = 16 * 1024 * 1024;     // Writable /tmp inside the sandbox
};

enum class EngineKind {
    NAMESPACE,  // Linux namespaces + cgroups v2, in-process
    DOCKER      // docker CLI
};

const char* engine_kind_to_string(EngineKind kind);
// Returns false for unknown names
bool engine_kind_from_string(const std::string& str, EngineKind& out);

// One day; keeps every deadline in poll()'s int milliseconds
constexpr uint32_t MAX_TIMEOUT_SECONDS = 24 * 60 * 60;

struct SandboxPolicy {
    ResourceLimits limits;
    uint32_t timeout_seconds = 10;       // Wall clock, enforced by the runner
    bool network_enabled = false;        // Always false for this system
    bool filesystem_writable = false;    // Always false for this system

    EngineKind engine = EngineKind::NAMESPACE;
    std::string image = "python:3.11-slim";              // Docker engine only
    std::vector<std::string> interpreter = {"python3"};  // Script path is appended
    std::string scratch_root = "/tmp/execbox";           // Parent of per-request scratch dirs

    // Host directories visible (read-only) inside the namespace engine
    std::vector<std::string> rootfs_binds = {"/usr", "/bin", "/lib", "/lib64", "/sbin"};

    size_t max_output_bytes = 200000;    // Per captured stream
    uint32_t drain_timeout_ms = 1000;    // Pipe drain bound after the sandbox died
    bool allow_degraded = false;         // Run with partial isolation instead of failing

    // stderr markers of an allocation refused by an address-space rlimit
    std::vector<std::string> memory_error_markers = {
        "MemoryError", "std::bad_alloc", "Cannot allocate memory", "out of memory"};

    // Problems that make this policy unusable (empty = valid)
    std::vector<std::string> validate() const;
};

using PolicyPtr = std::shared_ptr<const SandboxPolicy>;

} // namespace execbox::runtime

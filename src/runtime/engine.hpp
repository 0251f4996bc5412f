/**
 * execbox Isolation Engine
 *
 * Contract between the runner and whatever actually isolates a process:
 * create-isolated-process, wait (via a pollable exit fd), forcibly kill,
 * remove. Engines: NamespaceEngine (namespaces + cgroups v2) and
 * DockerEngine (docker CLI).
 */
#pragma once
#include <string>
#include <memory>
#include <optional>
#include <sys/types.h>
#include "runtime/policy.hpp"

namespace execbox::runtime {

struct SandboxSpec;

// Isolation status - tracks what isolation features are actually active
struct IsolationStatus {
    // Namespace isolation
    bool pid_namespace = false;
    bool net_namespace = false;
    bool mnt_namespace = false;
    bool uts_namespace = false;
    bool user_namespace = false;
    bool readonly_root = false;

    // Resource limits
    bool cgroups_available = false;
    bool memory_limit_applied = false;
    bool cpu_weight_applied = false;
    bool pids_limit_applied = false;
    bool memory_rlimit = false;     // Memory capped by RLIMIT_AS instead of a cgroup

    // Overall
    bool fully_isolated = false;
    std::string degraded_reason;

    bool is_degraded() const { return !fully_isolated && !degraded_reason.empty(); }
};

// How the sandbox root process ended
struct ExitStatus {
    std::optional<int> exit_code;
    std::optional<int> signal;
    std::string launch_error;   // Set when the engine found out late that nothing ran
};

// Descriptors the sandbox writes its output to (owned by the runner)
struct SandboxStdio {
    int stdout_fd = -1;
    int stderr_fd = -1;
};

// One running isolated process. Owned exclusively by one runner invocation.
class SandboxHandle {
public:
    virtual ~SandboxHandle() = default;

    virtual pid_t pid() const = 0;

    // Becomes readable once the sandbox root process has exited
    virtual int exit_fd() const = 0;

    // Reap the root process; blocks until it is gone
    virtual ExitStatus collect() = 0;

    // Forcibly terminate the sandbox and everything inside it
    virtual void kill() = 0;

    // Whether the kernel/engine killed the sandbox for exceeding its memory cap
    virtual bool oom_killed() = 0;

    // True when oom_killed() is a real answer (OOM accounting exists), so a
    // "no" rules the memory cap out as the cause of a SIGKILL
    virtual bool oom_authoritative() const = 0;

    // Tear down engine resources (cgroup, container); false = cleanup failure
    virtual bool release() = 0;

    virtual const IsolationStatus& isolation() const = 0;
};

class IsolationEngine {
public:
    virtual ~IsolationEngine() = default;

    virtual const char* name() const = 0;

    // Whether the engine can launch anything at all on this host
    virtual bool available() = 0;

    // Start the sandbox described by spec; throws LaunchError
    virtual std::unique_ptr<SandboxHandle> launch(const SandboxSpec& spec,
                                                  const SandboxStdio& stdio) = 0;
};

// Engine selected by policy.engine
std::unique_ptr<IsolationEngine> make_engine(const SandboxPolicy& policy);

} // namespace execbox::runtime

/**
 * execbox Namespace Engine
 *
 * Runs the interpreter in fresh Linux namespaces with cgroup v2 resource
 * limits, degrading step by step on hosts that cannot provide them:
 *   1. clone() with PID/mount/network/UTS/IPC namespaces (root)
 *   2. the same inside a new user namespace (unprivileged)
 *   3. plain fork() with rlimits only (only when allow_degraded)
 */
#pragma once
#include <string>
#include <mutex>
#include <atomic>
#include "runtime/engine.hpp"
#include "runtime/provisioner.hpp"
#include "util/unique_fd.hpp"

namespace execbox::runtime {

// One process tree started by NamespaceEngine
class NamespaceSandbox : public SandboxHandle {
public:
    NamespaceSandbox(pid_t pid, util::UniqueFd pidfd, std::string cgroup_path,
                     IsolationStatus isolation);
    ~NamespaceSandbox() override;

    NamespaceSandbox(const NamespaceSandbox&) = delete;
    NamespaceSandbox& operator=(const NamespaceSandbox&) = delete;

    pid_t pid() const override { return pid_; }
    int exit_fd() const override { return pidfd_.get(); }
    ExitStatus collect() override;
    void kill() override;
    bool oom_killed() override;
    bool oom_authoritative() const override {
        return !cgroup_path_.empty() && isolation_.memory_limit_applied;
    }
    bool release() override;
    const IsolationStatus& isolation() const override { return isolation_; }

    const std::string& cgroup_path() const { return cgroup_path_; }

private:
    pid_t pid_;
    util::UniqueFd pidfd_;
    std::string cgroup_path_;       // Empty when no cgroup is in use
    IsolationStatus isolation_;

    bool collected_ = false;
    bool released_ = false;
    ExitStatus exit_status_;
};

class NamespaceEngine : public IsolationEngine {
public:
    explicit NamespaceEngine(std::string cgroup_root = "/sys/fs/cgroup/execbox");

    const char* name() const override { return "namespace"; }
    bool available() override;
    std::unique_ptr<SandboxHandle> launch(const SandboxSpec& spec,
                                          const SandboxStdio& stdio) override;

private:
    enum class Mode {
        NAMESPACES,         // Root: namespaces without a user namespace
        USER_NAMESPACES,    // Unprivileged: namespaces inside a user namespace
        FORK                // No namespaces at all
    };

    static const char* mode_to_string(Mode mode);

    bool init_cgroup_root();
    std::string setup_cgroup(const SandboxSpec& spec, IsolationStatus& status);

    // Returns nullptr when this mode cannot be used on this host (reason set);
    // throws LaunchError when the interpreter itself cannot be started.
    std::unique_ptr<SandboxHandle> try_launch(Mode mode, const SandboxSpec& spec,
                                              const SandboxStdio& stdio,
                                              const std::string& cgroup_path,
                                              IsolationStatus status,
                                              std::string& reason);

    std::string cgroup_root_;
    std::once_flag cgroup_init_once_;
    bool cgroup_root_ready_ = false;
    std::atomic<bool> degraded_warned_{false};
};

} // namespace execbox::runtime

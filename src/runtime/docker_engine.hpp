/**
 * execbox Docker Engine
 *
 * Runs each request in a throwaway container through the docker CLI.
 * The CLI process is the sandbox root as far as the runner is concerned;
 * kill/inspect/rm are separate, time-bounded CLI invocations.
 */
#pragma once
#include <string>
#include <vector>
#include "runtime/engine.hpp"
#include "runtime/provisioner.hpp"
#include "util/unique_fd.hpp"

namespace execbox::runtime {

class DockerSandbox : public SandboxHandle {
public:
    DockerSandbox(std::string docker, std::string container, pid_t cli_pid,
                  util::UniqueFd pidfd, IsolationStatus isolation);
    ~DockerSandbox() override;

    DockerSandbox(const DockerSandbox&) = delete;
    DockerSandbox& operator=(const DockerSandbox&) = delete;

    pid_t pid() const override { return cli_pid_; }
    int exit_fd() const override { return pidfd_.get(); }
    ExitStatus collect() override;
    void kill() override;
    bool oom_killed() override;
    bool oom_authoritative() const override { return true; }
    bool release() override;
    const IsolationStatus& isolation() const override { return isolation_; }

    const std::string& container() const { return container_; }

private:
    // docker inspect --format <format>; empty on failure
    std::string inspect(const std::string& format);

    std::string docker_;
    std::string container_;
    pid_t cli_pid_;
    util::UniqueFd pidfd_;
    IsolationStatus isolation_;

    bool collected_ = false;
    bool released_ = false;
    ExitStatus exit_status_;
};

class DockerEngine : public IsolationEngine {
public:
    explicit DockerEngine(std::string docker = "docker");

    const char* name() const override { return "docker"; }
    bool available() override;
    std::unique_ptr<SandboxHandle> launch(const SandboxSpec& spec,
                                          const SandboxStdio& stdio) override;

    // Full `docker run ...` argv for spec
    std::vector<std::string> build_run_command(const SandboxSpec& spec) const;

    static std::string container_name(const std::string& request_id);

private:
    std::string docker_;
};

} // namespace execbox::runtime

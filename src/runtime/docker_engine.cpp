#include "runtime/docker_engine.hpp"
#include "runtime/subprocess.hpp"
#include "util/errors.hpp"
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>
#include <csignal>
#include <cerrno>
#include <cstring>

namespace execbox::runtime {

// Bounds for helper CLI calls (kill, inspect, rm, version)
constexpr std::chrono::milliseconds DOCKER_COMMAND_TIMEOUT{15000};

// docker run: 125 = daemon error, 126 = command not invokable, 127 = not found
constexpr int DOCKER_EXIT_DAEMON_ERROR = 125;
constexpr int DOCKER_EXIT_CANNOT_INVOKE = 126;
constexpr int DOCKER_EXIT_NOT_FOUND = 127;
constexpr int DOCKER_EXIT_SIGKILL = 128 + SIGKILL;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

// ============================================================================
// DockerSandbox Implementation
// ============================================================================

DockerSandbox::DockerSandbox(std::string docker, std::string container, pid_t cli_pid,
                             util::UniqueFd pidfd, IsolationStatus isolation)
    : docker_(std::move(docker)),
      container_(std::move(container)),
      cli_pid_(cli_pid),
      pidfd_(std::move(pidfd)),
      isolation_(std::move(isolation)) {}

DockerSandbox::~DockerSandbox() {
    if (!collected_) {
        kill();
        collect();
    }
    release();
}

std::string DockerSandbox::inspect(const std::string& format) {
    auto result = run_command({docker_, "inspect", "--format", format, container_},
                              DOCKER_COMMAND_TIMEOUT);
    if (!result.launched || result.timed_out || result.exit_code != 0) {
        return "";
    }
    return trim(result.output);
}

ExitStatus DockerSandbox::collect() {
    if (collected_) {
        return exit_status_;
    }

    int status = 0;
    if (wait_for_pid(cli_pid_, status)) {
        exit_status_ = decode_wait_status(status);
    }
    collected_ = true;

    if (!exit_status_.exit_code) {
        return exit_status_;
    }

    const int code = *exit_status_.exit_code;
    if (code == DOCKER_EXIT_DAEMON_ERROR || code == DOCKER_EXIT_CANNOT_INVOKE ||
        code == DOCKER_EXIT_NOT_FOUND) {
        // A container that never left "created" never ran user code
        std::string state = inspect("{{.State.Status}}");
        if (state.empty() || state == "created") {
            exit_status_.launch_error = "docker run failed with status " + std::to_string(code) +
                                        (state.empty() ? " (no container)" : " (container never started)");
        }
    } else if (code == DOCKER_EXIT_SIGKILL) {
        exit_status_.exit_code.reset();
        exit_status_.signal = SIGKILL;
    }
    return exit_status_;
}

void DockerSandbox::kill() {
    if (released_) {
        return;
    }

    auto result = run_command({docker_, "kill", container_}, DOCKER_COMMAND_TIMEOUT);
    if (!result.launched || result.exit_code != 0) {
        spdlog::debug("docker kill {} failed: {}", container_,
                      result.error.empty() ? trim(result.output) : result.error);
    }

    // The CLI may still be attached to a container that is already gone
    if (!collected_) {
        ::kill(cli_pid_, SIGKILL);
    }
}

bool DockerSandbox::oom_killed() {
    return inspect("{{.State.OOMKilled}}") == "true";
}

bool DockerSandbox::release() {
    if (released_) {
        return true;
    }
    released_ = true;
    pidfd_.reset();

    auto result = run_command({docker_, "rm", "-f", container_}, DOCKER_COMMAND_TIMEOUT);
    if (result.launched && !result.timed_out &&
        (result.exit_code == 0 || result.output.find("No such container") != std::string::npos)) {
        spdlog::debug("Removed container {}", container_);
        return true;
    }

    spdlog::warn("Failed to remove container {}: {}", container_,
                 result.error.empty() ? trim(result.output) : result.error);
    return false;
}

// ============================================================================
// DockerEngine Implementation
// ============================================================================

DockerEngine::DockerEngine(std::string docker)
    : docker_(std::move(docker)) {}

std::string DockerEngine::container_name(const std::string& request_id) {
    return "execbox_" + request_id;
}

bool DockerEngine::available() {
    auto result = run_command({docker_, "version", "--format", "{{.Server.Version}}"},
                              DOCKER_COMMAND_TIMEOUT);
    if (!result.launched) {
        spdlog::warn("docker CLI not found: {}", result.error);
        return false;
    }
    if (result.timed_out || result.exit_code != 0) {
        spdlog::warn("docker daemon not reachable: {}", trim(result.output));
        return false;
    }
    spdlog::info("Docker server version {}", trim(result.output));
    return true;
}

std::vector<std::string> DockerEngine::build_run_command(const SandboxSpec& spec) const {
    const auto& limits = spec.limits;
    const std::string memory = std::to_string(limits.memory_limit_bytes);

    std::vector<std::string> cmd = {
        docker_, "run",
        "--name", container_name(spec.request_id),
        "--network", "none",
        "--memory", memory,
        "--memory-swap", memory,
        "--pids-limit", std::to_string(limits.max_pids),
        "--read-only",
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--ulimit", "core=0",
        "--tmpfs", "/tmp:rw,size=" + std::to_string(limits.tmpfs_size_bytes),
        "--workdir", "/tmp",
        "-v", spec.scratch.code_dir() + ":/sandbox:ro",
        "-e", "PYTHONUNBUFFERED=1",
        "-e", "PYTHONDONTWRITEBYTECODE=1",
    };
    if (limits.cpu_shares > 0) {
        cmd.push_back("--cpu-shares");
        cmd.push_back(std::to_string(limits.cpu_shares));
    }
    cmd.push_back(spec.image);
    cmd.insert(cmd.end(), spec.interpreter.begin(), spec.interpreter.end());
    cmd.push_back(spec.script_sandbox_path);
    return cmd;
}

std::unique_ptr<SandboxHandle> DockerEngine::launch(const SandboxSpec& spec,
                                                    const SandboxStdio& stdio) {
    if (spec.interpreter.empty()) {
        throw LaunchError("no interpreter configured");
    }
    if (spec.image.empty()) {
        throw LaunchError("no docker image configured");
    }

    util::UniqueFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!dev_null.is_open()) {
        throw LaunchError(std::string("open /dev/null: ") + strerror(errno));
    }

    auto cmd = build_run_command(spec);
    spdlog::debug("Request {}: {}", spec.request_id, join_args(cmd));

    std::string error;
    pid_t pid = spawn_process(cmd, dev_null.get(), stdio.stdout_fd, stdio.stderr_fd, error);
    if (pid < 0) {
        throw LaunchError("cannot start docker: " + error);
    }

    util::UniqueFd pidfd(open_pidfd(pid));
    if (!pidfd.is_open()) {
        int err = errno;
        ::kill(pid, SIGKILL);
        int status;
        wait_for_pid(pid, status);
        run_command({docker_, "rm", "-f", container_name(spec.request_id)}, DOCKER_COMMAND_TIMEOUT);
        throw LaunchError(std::string("pidfd_open failed: ") + strerror(err));
    }

    IsolationStatus status;
    status.pid_namespace = true;
    status.net_namespace = true;
    status.mnt_namespace = true;
    status.uts_namespace = true;
    status.readonly_root = true;
    status.cgroups_available = true;
    status.memory_limit_applied = true;
    status.pids_limit_applied = true;
    status.cpu_weight_applied = spec.limits.cpu_shares > 0;
    status.fully_isolated = true;

    return std::make_unique<DockerSandbox>(docker_, container_name(spec.request_id), pid,
                                           std::move(pidfd), std::move(status));
}

} // namespace execbox::runtime

#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <sys/types.h>
#include "runtime/engine.hpp"

namespace execbox::runtime {

// Result of a short helper command (docker kill/inspect/rm, probes)
struct CommandResult {
    bool launched = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string output;     // stdout and stderr combined
    std::string error;      // launch failure reason
};

// NULL-terminated char* array built before fork so the child never allocates
class CStringArray {
public:
    explicit CStringArray(const std::vector<std::string>& strings);

    CStringArray(const CStringArray&) = delete;
    CStringArray& operator=(const CStringArray&) = delete;

    char* const* data() { return ptrs_.data(); }

private:
    std::vector<std::string> strings_;
    std::vector<char*> ptrs_;
};

std::string join_args(const std::vector<std::string>& args);

// Minimal environment for sandboxed interpreters
std::vector<std::string> sandbox_environment();

// dup2() for use between fork and exec; also clears FD_CLOEXEC when from == to
bool redirect_fd(int from, int to);

// Fork + exec with the given stdio; the child leads its own process group.
// Returns the pid or -1 with error set (exec failures are reported here too).
pid_t spawn_process(const std::vector<std::string>& args,
                    int stdin_fd, int stdout_fd, int stderr_fd,
                    std::string& error);

// Run a command to completion, killing it after timeout
CommandResult run_command(const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout);

// pidfd_open(2); -1 on failure
int open_pidfd(pid_t pid);

ExitStatus decode_wait_status(int status);

// Blocking waitpid that retries on EINTR
bool wait_for_pid(pid_t pid, int& status);

} // namespace execbox::runtime

#pragma once
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <unistd.h>
#include "runtime/policy.hpp"

namespace execbox::testing {

// Directory under /tmp removed at scope exit
class TempDir {
public:
    TempDir() {
        std::string templ = "/tmp/execbox_test_XXXXXX";
        if (::mkdtemp(templ.data()) != nullptr) {
            path_ = templ;
        }
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Namespace-engine policy that runs scripts with /bin/sh and tolerates
// whatever isolation an unprivileged test host can offer
inline runtime::SandboxPolicy shell_policy(const std::string& scratch_root) {
    runtime::SandboxPolicy policy;
    policy.interpreter = {"/bin/sh"};
    policy.scratch_root = scratch_root;
    policy.timeout_seconds = 5;
    policy.allow_degraded = true;
    policy.drain_timeout_ms = 500;
    return policy;
}

inline bool python_available() {
    return std::system("python3 -c 'pass' >/dev/null 2>&1") == 0;
}

} // namespace execbox::testing

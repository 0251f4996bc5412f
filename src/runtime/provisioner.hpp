/**
 * execbox Provisioner
 *
 * Materializes submitted code into a per-request scratch artifact and builds
 * the SandboxSpec handed to the runner. Never launches anything.
 */
#pragma once
#include <string>
#include <vector>
#include <chrono>
#include "runtime/policy.hpp"

namespace execbox::runtime {

// Per-request scratch directory, removed when the owner goes away
class ScratchArtifact {
public:
    ScratchArtifact() = default;
    explicit ScratchArtifact(std::string path);
    ~ScratchArtifact();

    ScratchArtifact(const ScratchArtifact&) = delete;
    ScratchArtifact& operator=(const ScratchArtifact&) = delete;
    ScratchArtifact(ScratchArtifact&& other) noexcept;
    ScratchArtifact& operator=(ScratchArtifact&& other) noexcept;

    const std::string& path() const { return path_; }
    std::string code_dir() const { return path_ + "/code"; }
    std::string root_dir() const { return path_ + "/root"; }
    bool empty() const { return path_.empty(); }

    // Remove the tree now; failures are logged and reported, never thrown
    bool remove();

private:
    std::string path_;
};

// One file of a multi-file project, path relative to the code directory
struct ProjectFile {
    std::string path;
    std::string content;
};

// Relative, '/'-separated, no empty, "." or ".." components
bool is_safe_project_path(const std::string& path);

// Everything an isolation engine needs to start one execution
struct SandboxSpec {
    std::string request_id;
    ScratchArtifact scratch;

    std::string script_host_path;                        // <scratch>/code/main.py
    std::string script_sandbox_path = "/sandbox/main.py";
    std::vector<std::string> interpreter;
    std::string image;
    EngineKind engine = EngineKind::NAMESPACE;

    ResourceLimits limits;
    std::chrono::seconds timeout{10};
    bool network_enabled = false;
    bool filesystem_writable = false;
    std::vector<std::string> rootfs_binds;
    bool allow_degraded = false;

    size_t max_output_bytes = 200000;
    std::chrono::milliseconds drain_timeout{1000};
};

class Provisioner {
public:
    static constexpr const char* SCRIPT_NAME = "main.py";

    // Throws ProvisionError if the scratch artifact cannot be created
    SandboxSpec provision(const SandboxPolicy& policy,
                          const std::string& request_id,
                          const std::string& code) const;

    // Lays out every file under the code directory; SCRIPT_NAME must be one
    // of them. Throws ProvisionError for unsafe paths or I/O failures.
    SandboxSpec provision_project(const SandboxPolicy& policy,
                                  const std::string& request_id,
                                  const std::vector<ProjectFile>& files) const;

private:
    // Fresh scratch tree with empty code/ and root/ directories
    SandboxSpec prepare(const SandboxPolicy& policy, const std::string& request_id) const;
};

} // namespace execbox::runtime

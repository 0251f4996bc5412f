#include "runtime/provisioner.hpp"
#include "util/errors.hpp"
#include "util/unique_fd.hpp"
#include <spdlog/spdlog.h>

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace execbox::runtime {

// ============================================================================
// ScratchArtifact Implementation
// ============================================================================

ScratchArtifact::ScratchArtifact(std::string path)
    : path_(std::move(path)) {}

ScratchArtifact::~ScratchArtifact() {
    remove();
}

ScratchArtifact::ScratchArtifact(ScratchArtifact&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchArtifact& ScratchArtifact::operator=(ScratchArtifact&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

bool ScratchArtifact::remove() {
    if (path_.empty()) {
        return true;
    }

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove scratch artifact {}: {}", path_, ec.message());
        return false;
    }

    spdlog::trace("Removed scratch artifact {}", path_);
    path_.clear();
    return true;
}

// ============================================================================
// Provisioner Implementation
// ============================================================================

namespace {

void write_all(int fd, const std::string& data, const std::string& path) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ProvisionError("write " + path + ": " + strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
}

// Read-only for everyone; never follows or replaces an existing entry
void write_code_file(const std::string& path, const std::string& content) {
    util::UniqueFd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0444));
    if (!fd.is_open()) {
        throw ProvisionError("create " + path + ": " + strerror(errno));
    }
    write_all(fd.get(), content, path);
    if (::fsync(fd.get()) < 0 && errno != EINVAL) {
        throw ProvisionError("fsync " + path + ": " + strerror(errno));
    }
}

} // namespace

bool is_safe_project_path(const std::string& path) {
    if (path.empty() || path.front() == '/' || path.find('\0') != std::string::npos) {
        return false;
    }

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string component = path.substr(start, end - start);
        if (component.empty() || component == "." || component == "..") {
            return false;
        }
        start = end + 1;
    }
    return true;
}

SandboxSpec Provisioner::prepare(const SandboxPolicy& policy,
                                 const std::string& request_id) const {
    std::error_code ec;
    fs::create_directories(policy.scratch_root, ec);
    if (ec) {
        throw ProvisionError("cannot create scratch root " + policy.scratch_root +
                             ": " + ec.message());
    }

    // mkdtemp never hands out an existing directory, so paths are not reused
    std::string templ = policy.scratch_root + "/exec_" + request_id + "_XXXXXX";
    if (::mkdtemp(templ.data()) == nullptr) {
        throw ProvisionError("cannot create scratch directory under " +
                             policy.scratch_root + ": " + strerror(errno));
    }

    SandboxSpec spec;
    spec.scratch = ScratchArtifact(templ);

    // The code dir is bind-mounted into sandboxes whose uid may differ from ours
    const std::string code_dir = spec.scratch.code_dir();
    if (::mkdir(code_dir.c_str(), 0755) < 0 || ::chmod(code_dir.c_str(), 0755) < 0) {
        throw ProvisionError("mkdir " + code_dir + ": " + strerror(errno));
    }
    const std::string root_dir = spec.scratch.root_dir();
    if (::mkdir(root_dir.c_str(), 0755) < 0) {
        throw ProvisionError("mkdir " + root_dir + ": " + strerror(errno));
    }

    spec.request_id = request_id;
    spec.script_host_path = code_dir + "/" + SCRIPT_NAME;
    spec.script_sandbox_path = std::string("/sandbox/") + SCRIPT_NAME;
    spec.interpreter = policy.interpreter;
    spec.image = policy.image;
    spec.engine = policy.engine;
    spec.limits = policy.limits;
    spec.timeout = std::chrono::seconds(policy.timeout_seconds);
    spec.network_enabled = policy.network_enabled;
    spec.filesystem_writable = policy.filesystem_writable;
    spec.rootfs_binds = policy.rootfs_binds;
    spec.allow_degraded = policy.allow_degraded;
    spec.max_output_bytes = policy.max_output_bytes;
    spec.drain_timeout = std::chrono::milliseconds(policy.drain_timeout_ms);
    return spec;
}

SandboxSpec Provisioner::provision(const SandboxPolicy& policy,
                                   const std::string& request_id,
                                   const std::string& code) const {
    SandboxSpec spec = prepare(policy, request_id);
    write_code_file(spec.script_host_path, code);

    spdlog::debug("Provisioned scratch {} for request {} ({} bytes)",
                  spec.scratch.path(), request_id, code.size());
    return spec;
}

SandboxSpec Provisioner::provision_project(const SandboxPolicy& policy,
                                           const std::string& request_id,
                                           const std::vector<ProjectFile>& files) const {
    bool has_entry = false;
    for (const auto& file : files) {
        if (!is_safe_project_path(file.path)) {
            throw ProvisionError("unsafe project path '" + file.path + "'");
        }
        has_entry = has_entry || file.path == SCRIPT_NAME;
    }
    if (!has_entry) {
        throw ProvisionError(std::string("project has no ") + SCRIPT_NAME);
    }

    SandboxSpec spec = prepare(policy, request_id);
    const std::string code_dir = spec.scratch.code_dir();

    size_t total = 0;
    for (const auto& file : files) {
        const fs::path target = fs::path(code_dir) / file.path;
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw ProvisionError("mkdir " + target.parent_path().string() + ": " + ec.message());
        }
        write_code_file(target.string(), file.content);
        total += file.content.size();
    }

    // Subdirectories must be listable by the sandbox uid whatever our umask is
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(code_dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec)) {
            fs::permissions(it->path(), fs::perms(0755), ec);
        }
    }
    if (ec) {
        throw ProvisionError("cannot set permissions under " + code_dir + ": " + ec.message());
    }

    spdlog::debug("Provisioned project scratch {} for request {} ({} files, {} bytes)",
                  spec.scratch.path(), request_id, files.size(), total);
    return spec;
}

} // namespace execbox::runtime

#include "runtime/namespace_engine.hpp"
#include "runtime/subprocess.hpp"
#include "util/errors.hpp"
#include <spdlog/spdlog.h>

#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sched.h>
#include <grp.h>
#include <fcntl.h>
#include <unistd.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <filesystem>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace execbox::runtime {

// Stack size for clone()
constexpr size_t STACK_SIZE = 1024 * 1024; // 1MB

// Unprivileged identity for sandboxes started by root
constexpr uid_t NOBODY_ID = 65534;

namespace {

// ============================================================================
// Child side (runs between clone/fork and exec: async-signal-safe calls only)
// ============================================================================

enum ChildStage : int {
    STAGE_SYNC,
    STAGE_HOSTNAME,
    STAGE_MOUNT_PRIVATE,
    STAGE_MOUNT_ROOT,
    STAGE_BIND,
    STAGE_MOUNT_CODE,
    STAGE_MOUNT_TMP,
    STAGE_MOUNT_DEV,
    STAGE_PIVOT,
    STAGE_REMOUNT_RO,
    STAGE_CHDIR,
    STAGE_DROP_PRIVILEGES,
    STAGE_PRCTL,
    STAGE_RLIMIT,
    STAGE_STDIO,
    STAGE_EXEC
};

const char* child_stage_to_string(int stage) {
    switch (stage) {
        case STAGE_SYNC: return "sync";
        case STAGE_HOSTNAME: return "sethostname";
        case STAGE_MOUNT_PRIVATE: return "make mounts private";
        case STAGE_MOUNT_ROOT: return "mount root tmpfs";
        case STAGE_BIND: return "bind host directory";
        case STAGE_MOUNT_CODE: return "bind code directory";
        case STAGE_MOUNT_TMP: return "mount /tmp";
        case STAGE_MOUNT_DEV: return "bind device nodes";
        case STAGE_PIVOT: return "pivot_root";
        case STAGE_REMOUNT_RO: return "remount root read-only";
        case STAGE_CHDIR: return "chdir";
        case STAGE_DROP_PRIVILEGES: return "drop privileges";
        case STAGE_PRCTL: return "prctl";
        case STAGE_RLIMIT: return "setrlimit";
        case STAGE_STDIO: return "redirect stdio";
        case STAGE_EXEC: return "exec";
        default: return "unknown";
    }
}

struct ChildError {
    int stage;
    int err;
};

// Sync byte from the parent: which limits the cgroup could not provide
constexpr char SYNC_RLIMIT_AS = 0x1;
constexpr char SYNC_RLIMIT_NPROC = 0x2;

struct BindMount {
    std::string source;
    std::string target;
    std::string link_target;    // Non-empty: recreate a symlink instead of binding
};

// New root filesystem, all paths computed before the child exists
struct MountPlan {
    std::string root;
    std::string root_options = "size=1m,mode=0755";
    std::vector<BindMount> binds;
    std::string code_source;
    std::string code_target;
    std::string tmp_target;
    std::string tmp_options;
    std::string dev_dir;
    std::vector<BindMount> devices;
    std::string proc_target;
};

struct ChildContext {
    char* const* argv = nullptr;
    char* const* envp = nullptr;

    bool isolate_filesystem = false;
    bool drop_privileges = false;
    const MountPlan* mounts = nullptr;
    const char* work_dir = nullptr;

    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
    int sync_read_fd = -1;
    int sync_write_fd = -1;
    int error_fd = -1;

    rlim_t memory_bytes = 0;
    rlim_t max_procs = 0;
    bool limit_fsize = false;
};

[[noreturn]] void child_fail(const ChildContext& ctx, int stage) {
    ChildError error{stage, errno};
    ssize_t ignored = ::write(ctx.error_fd, &error, sizeof(error));
    (void)ignored;
    ::_exit(127);
}

// Flags a user namespace may not clear when remounting a bind
unsigned long locked_mount_flags(const char* path) {
    struct statvfs st;
    if (::statvfs(path, &st) < 0) {
        return 0;
    }
    unsigned long flags = 0;
    if (st.f_flag & ST_NOSUID) flags |= MS_NOSUID;
    if (st.f_flag & ST_NODEV) flags |= MS_NODEV;
    if (st.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    return flags;
}

bool bind_readonly(const char* source, const char* target) {
    if (::mount(source, target, nullptr, MS_BIND | MS_REC, nullptr) < 0) {
        return false;
    }
    unsigned long flags = MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID |
                          locked_mount_flags(target);
    return ::mount(nullptr, target, nullptr, flags, nullptr) == 0;
}

void setup_root(const ChildContext& ctx) {
    const MountPlan& plan = *ctx.mounts;

    if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) < 0) {
        child_fail(ctx, STAGE_MOUNT_PRIVATE);
    }
    if (::mount("tmpfs", plan.root.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                plan.root_options.c_str()) < 0) {
        child_fail(ctx, STAGE_MOUNT_ROOT);
    }

    for (const auto& bind : plan.binds) {
        if (!bind.link_target.empty()) {
            if (::symlink(bind.link_target.c_str(), bind.target.c_str()) < 0) {
                child_fail(ctx, STAGE_BIND);
            }
            continue;
        }
        if (::mkdir(bind.target.c_str(), 0755) < 0 ||
            !bind_readonly(bind.source.c_str(), bind.target.c_str())) {
            child_fail(ctx, STAGE_BIND);
        }
    }

    if (::mkdir(plan.code_target.c_str(), 0755) < 0 ||
        !bind_readonly(plan.code_source.c_str(), plan.code_target.c_str())) {
        child_fail(ctx, STAGE_MOUNT_CODE);
    }

    if (::mkdir(plan.tmp_target.c_str(), 01777) < 0 ||
        ::mount("tmpfs", plan.tmp_target.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                plan.tmp_options.c_str()) < 0) {
        child_fail(ctx, STAGE_MOUNT_TMP);
    }

    if (::mkdir(plan.dev_dir.c_str(), 0755) < 0) {
        child_fail(ctx, STAGE_MOUNT_DEV);
    }
    for (const auto& dev : plan.devices) {
        int fd = ::open(dev.target.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0666);
        if (fd < 0) {
            child_fail(ctx, STAGE_MOUNT_DEV);
        }
        ::close(fd);
        if (::mount(dev.source.c_str(), dev.target.c_str(), nullptr, MS_BIND, nullptr) < 0) {
            child_fail(ctx, STAGE_MOUNT_DEV);
        }
    }

    // A fresh /proc needs the new PID namespace; some hosts refuse it
    // (masked /proc in nested containers) and the interpreter runs without it.
    if (::mkdir(plan.proc_target.c_str(), 0555) == 0) {
        ::mount("proc", plan.proc_target.c_str(), "proc",
                MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr);
    }

    // pivot_root(".", ".") stacks the old root on top; detach it right away
    if (::chdir(plan.root.c_str()) < 0 ||
        ::syscall(SYS_pivot_root, ".", ".") < 0 ||
        ::umount2(".", MNT_DETACH) < 0 ||
        ::chdir("/") < 0) {
        child_fail(ctx, STAGE_PIVOT);
    }

    if (::mount(nullptr, "/", nullptr,
                MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) < 0) {
        child_fail(ctx, STAGE_REMOUNT_RO);
    }
}

int child_entry(void* arg) {
    const ChildContext& ctx = *static_cast<ChildContext*>(arg);

    // Wait for the parent to place us in the cgroup and write id maps
    ::close(ctx.sync_write_fd);
    char sync = 0;
    ssize_t n;
    do {
        n = ::read(ctx.sync_read_fd, &sync, 1);
    } while (n < 0 && errno == EINTR);
    if (n != 1) {
        if (n == 0) errno = EPIPE;
        child_fail(ctx, STAGE_SYNC);
    }
    ::close(ctx.sync_read_fd);

    if (ctx.isolate_filesystem) {
        static const char hostname[] = "execbox";
        if (::sethostname(hostname, sizeof(hostname) - 1) < 0) {
            child_fail(ctx, STAGE_HOSTNAME);
        }
        setup_root(ctx);
    }
    if (::chdir(ctx.work_dir) < 0) {
        child_fail(ctx, STAGE_CHDIR);
    }

    if (ctx.drop_privileges) {
        if (::setgroups(0, nullptr) < 0 ||
            ::setresgid(NOBODY_ID, NOBODY_ID, NOBODY_ID) < 0 ||
            ::setresuid(NOBODY_ID, NOBODY_ID, NOBODY_ID) < 0) {
            child_fail(ctx, STAGE_DROP_PRIVILEGES);
        }
    }

    // PDEATHSIG is cleared by credential changes, so set it afterwards
    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0 ||
        ::prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) < 0) {
        child_fail(ctx, STAGE_PRCTL);
    }

    struct rlimit rl;
    rl.rlim_cur = rl.rlim_max = 0;
    if (::setrlimit(RLIMIT_CORE, &rl) < 0) {
        child_fail(ctx, STAGE_RLIMIT);
    }
    if (sync & SYNC_RLIMIT_AS) {
        rl.rlim_cur = rl.rlim_max = ctx.memory_bytes;
        if (::setrlimit(RLIMIT_AS, &rl) < 0) {
            child_fail(ctx, STAGE_RLIMIT);
        }
    }
    if (sync & SYNC_RLIMIT_NPROC) {
        rl.rlim_cur = rl.rlim_max = ctx.max_procs;
        if (::setrlimit(RLIMIT_NPROC, &rl) < 0) {
            child_fail(ctx, STAGE_RLIMIT);
        }
    }
    if (ctx.limit_fsize) {
        rl.rlim_cur = rl.rlim_max = 0;
        if (::setrlimit(RLIMIT_FSIZE, &rl) < 0) {
            child_fail(ctx, STAGE_RLIMIT);
        }
    }

    ::setpgid(0, 0);
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    ::signal(SIGPIPE, SIG_DFL);
    // Writes past RLIMIT_FSIZE fail with EFBIG instead of killing the process
    ::signal(SIGXFSZ, ctx.limit_fsize ? SIG_IGN : SIG_DFL);

    if (!redirect_fd(ctx.stdin_fd, STDIN_FILENO) ||
        !redirect_fd(ctx.stdout_fd, STDOUT_FILENO) ||
        !redirect_fd(ctx.stderr_fd, STDERR_FILENO)) {
        child_fail(ctx, STAGE_STDIO);
    }

#ifdef SYS_close_range
    // Nothing but stdio survives exec, whatever other threads have opened
    ::syscall(SYS_close_range, 3U, ~0U, 4U /* CLOSE_RANGE_CLOEXEC */);
#endif

    ::execvpe(ctx.argv[0], ctx.argv, ctx.envp);
    child_fail(ctx, STAGE_EXEC);
}

// ============================================================================
// Parent side helpers
// ============================================================================

bool write_cgroup_file(const std::string& path, const std::string& value) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        return false;
    }
    ofs << value;
    ofs.flush();
    return ofs.good();
}

bool remove_cgroup(const std::string& path) {
    // rmdir is refused while dying processes are still being reaped
    int err = 0;
    for (int attempt = 0; attempt < 50; ++attempt) {
        if (::rmdir(path.c_str()) == 0) {
            spdlog::debug("Cleaned up cgroup: {}", path);
            return true;
        }
        err = errno;
        if (err == ENOENT) {
            return true;
        }
        if (err != EBUSY) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    spdlog::warn("Failed to cleanup cgroup {}: {}", path, strerror(err));
    return false;
}

bool write_id_maps(pid_t pid) {
    const std::string proc = "/proc/" + std::to_string(pid);
    return write_cgroup_file(proc + "/setgroups", "deny") &&
           write_cgroup_file(proc + "/uid_map", "0 " + std::to_string(::geteuid()) + " 1") &&
           write_cgroup_file(proc + "/gid_map", "0 " + std::to_string(::getegid()) + " 1");
}

MountPlan build_mount_plan(const SandboxSpec& spec) {
    MountPlan plan;
    plan.root = spec.scratch.root_dir();

    for (const auto& dir : spec.rootfs_binds) {
        std::error_code ec;
        auto st = fs::symlink_status(dir, ec);
        if (ec || !fs::exists(st)) {
            spdlog::trace("Skipping missing rootfs bind {}", dir);
            continue;
        }
        BindMount bind;
        bind.source = dir;
        bind.target = plan.root + dir;
        if (fs::is_symlink(st)) {
            // Merged-/usr hosts: /bin -> usr/bin and friends
            bind.link_target = fs::read_symlink(dir, ec).string();
            if (ec || bind.link_target.empty()) {
                continue;
            }
        } else if (!fs::is_directory(st)) {
            continue;
        }
        plan.binds.push_back(std::move(bind));
    }

    plan.code_source = spec.scratch.code_dir();
    plan.code_target = plan.root + "/sandbox";
    plan.tmp_target = plan.root + "/tmp";
    plan.tmp_options = "size=" + std::to_string(spec.limits.tmpfs_size_bytes) + ",mode=1777";
    plan.dev_dir = plan.root + "/dev";
    for (const char* dev : {"/dev/null", "/dev/zero", "/dev/urandom"}) {
        plan.devices.push_back({dev, plan.root + dev, ""});
    }
    plan.proc_target = plan.root + "/proc";
    return plan;
}

} // namespace

// ============================================================================
// NamespaceSandbox Implementation
// ============================================================================

NamespaceSandbox::NamespaceSandbox(pid_t pid, util::UniqueFd pidfd,
                                   std::string cgroup_path, IsolationStatus isolation)
    : pid_(pid),
      pidfd_(std::move(pidfd)),
      cgroup_path_(std::move(cgroup_path)),
      isolation_(std::move(isolation)) {}

NamespaceSandbox::~NamespaceSandbox() {
    if (!collected_) {
        kill();
        collect();
    }
    release();
}

ExitStatus NamespaceSandbox::collect() {
    if (collected_) {
        return exit_status_;
    }

    int status = 0;
    if (wait_for_pid(pid_, status)) {
        exit_status_ = decode_wait_status(status);
    }
    collected_ = true;
    spdlog::trace("Sandbox PID {} collected", pid_);
    return exit_status_;
}

void NamespaceSandbox::kill() {
    if (!cgroup_path_.empty() && !released_) {
        if (!write_cgroup_file(cgroup_path_ + "/cgroup.kill", "1")) {
            spdlog::debug("cgroup.kill not available for {}", cgroup_path_);
        }
    }

    // Once reaped the pid may belong to someone else
    if (!collected_) {
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
    }
}

bool NamespaceSandbox::oom_killed() {
    if (cgroup_path_.empty()) {
        return false;
    }

    std::ifstream events(cgroup_path_ + "/memory.events");
    std::string key;
    uint64_t value = 0;
    while (events >> key >> value) {
        if (key == "oom_kill") {
            return value > 0;
        }
    }
    return false;
}

bool NamespaceSandbox::release() {
    if (released_) {
        return true;
    }
    released_ = true;
    pidfd_.reset();

    if (cgroup_path_.empty()) {
        return true;
    }
    // Stragglers (fork mode grandchildren) would keep the cgroup busy
    write_cgroup_file(cgroup_path_ + "/cgroup.kill", "1");
    return remove_cgroup(cgroup_path_);
}

// ============================================================================
// NamespaceEngine Implementation
// ============================================================================

NamespaceEngine::NamespaceEngine(std::string cgroup_root)
    : cgroup_root_(std::move(cgroup_root)) {}

const char* NamespaceEngine::mode_to_string(Mode mode) {
    switch (mode) {
        case Mode::NAMESPACES: return "namespaces";
        case Mode::USER_NAMESPACES: return "user namespaces";
        case Mode::FORK: return "fork";
        default: return "unknown";
    }
}

bool NamespaceEngine::available() {
    // fork() always works; which isolation level is reachable is decided per launch
    return true;
}

bool NamespaceEngine::init_cgroup_root() {
    const fs::path root(cgroup_root_);
    const fs::path hierarchy = root.parent_path();

    if (!fs::exists(hierarchy / "cgroup.controllers")) {
        spdlog::warn("DEGRADED ISOLATION: cgroup v2 not available - resource limits will NOT be enforced");
        return false;
    }

    if (!fs::exists(root)) {
        try {
            fs::create_directories(root);
            spdlog::info("Created cgroup root: {}", cgroup_root_);
        } catch (const std::exception& e) {
            spdlog::warn("DEGRADED ISOLATION: Cannot create cgroup root (need root): {}", e.what());
            spdlog::warn("  -> Memory limits and PID limits will fall back to rlimits");
            return false;
        }
    }

    // Controllers must be enabled on every level above the per-request cgroups
    if (!write_cgroup_file((hierarchy / "cgroup.subtree_control").string(), "+cpu +memory +pids")) {
        spdlog::debug("Could not enable cgroup controllers in {}", hierarchy.string());
    }
    if (!write_cgroup_file((root / "cgroup.subtree_control").string(), "+cpu +memory +pids")) {
        spdlog::warn("DEGRADED ISOLATION: Cannot enable cgroup controllers in {}", cgroup_root_);
        return false;
    }

    return true;
}

std::string NamespaceEngine::setup_cgroup(const SandboxSpec& spec, IsolationStatus& status) {
    std::call_once(cgroup_init_once_, [this]() { cgroup_root_ready_ = init_cgroup_root(); });
    if (!cgroup_root_ready_) {
        return "";
    }
    status.cgroups_available = true;

    const std::string path = cgroup_root_ + "/" + spec.request_id;
    if (::mkdir(path.c_str(), 0755) < 0) {
        spdlog::warn("DEGRADED ISOLATION: Cannot create sandbox cgroup {}: {}", path, strerror(errno));
        status.cgroups_available = false;
        return "";
    }

    const auto& limits = spec.limits;
    if (write_cgroup_file(path + "/memory.max", std::to_string(limits.memory_limit_bytes))) {
        status.memory_limit_applied = true;
        spdlog::debug("Set memory limit: {} bytes", limits.memory_limit_bytes);
        // Absent without swap accounting
        write_cgroup_file(path + "/memory.swap.max", "0");
        // OOM takes the whole sandbox down, not one victim inside it
        write_cgroup_file(path + "/memory.oom.group", "1");
    } else {
        spdlog::warn("DEGRADED ISOLATION: memory.max not writable - memory limit NOT enforced by cgroup");
    }

    if (write_cgroup_file(path + "/pids.max", std::to_string(limits.max_pids))) {
        status.pids_limit_applied = true;
        spdlog::debug("Set max PIDs: {}", limits.max_pids);
    } else {
        spdlog::warn("DEGRADED ISOLATION: pids.max not writable - PID limit NOT enforced by cgroup");
    }

    // cpu.weight range: 1-10000, default 100
    // cpu.shares range: 2-262144, default 1024
    if (limits.cpu_shares > 0) {
        uint64_t weight = (limits.cpu_shares * 100) / 1024;
        if (weight < 1) weight = 1;
        if (weight > 10000) weight = 10000;
        if (write_cgroup_file(path + "/cpu.weight", std::to_string(weight))) {
            status.cpu_weight_applied = true;
            spdlog::debug("Set CPU weight: {} (from shares {})", weight, limits.cpu_shares);
        } else {
            spdlog::debug("Could not set CPU weight for {}", path);
        }
    }

    return path;
}

std::unique_ptr<SandboxHandle> NamespaceEngine::launch(const SandboxSpec& spec,
                                                       const SandboxStdio& stdio) {
    if (spec.interpreter.empty()) {
        throw LaunchError("no interpreter configured");
    }

    IsolationStatus cgroup_status;
    const std::string cgroup_path = setup_cgroup(spec, cgroup_status);

    std::vector<std::string> failures;
    try {
        for (Mode mode : {Mode::NAMESPACES, Mode::USER_NAMESPACES, Mode::FORK}) {
            if (mode == Mode::FORK && !spec.allow_degraded) {
                break;
            }

            std::string reason;
            auto handle = try_launch(mode, spec, stdio, cgroup_path, cgroup_status, reason);
            if (handle) {
                return handle;
            }
            spdlog::debug("Request {}: {} unavailable: {}", spec.request_id,
                          mode_to_string(mode), reason);
            failures.push_back(std::string(mode_to_string(mode)) + ": " + reason);
        }
    } catch (const LaunchError&) {
        if (!cgroup_path.empty()) {
            remove_cgroup(cgroup_path);
        }
        throw;
    }

    if (!cgroup_path.empty()) {
        remove_cgroup(cgroup_path);
    }

    std::string message = "no usable isolation mode";
    for (const auto& failure : failures) {
        message += (&failure == &failures.front() ? " (" : "; ") + failure;
    }
    if (!failures.empty()) {
        message += ")";
    }
    if (!spec.allow_degraded) {
        message += "; degraded isolation is not allowed";
    }
    throw LaunchError(message);
}

std::unique_ptr<SandboxHandle> NamespaceEngine::try_launch(Mode mode,
                                                           const SandboxSpec& spec,
                                                           const SandboxStdio& stdio,
                                                           const std::string& cgroup_path,
                                                           IsolationStatus status,
                                                           std::string& reason) {
    const bool namespaces = mode != Mode::FORK;

    util::UniqueFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    util::Pipe sync_pipe;
    util::Pipe error_pipe;
    if (!dev_null.is_open() || !util::make_pipe(sync_pipe) || !util::make_pipe(error_pipe)) {
        throw LaunchError(std::string("cannot create launch pipes: ") + strerror(errno));
    }

    // Everything the child touches is allocated here, before it exists
    std::vector<std::string> args = spec.interpreter;
    args.push_back(namespaces ? spec.script_sandbox_path : spec.script_host_path);
    CStringArray argv(args);
    CStringArray envp(sandbox_environment());
    MountPlan plan = build_mount_plan(spec);
    const std::string code_dir = spec.scratch.code_dir();

    ChildContext ctx;
    ctx.argv = argv.data();
    ctx.envp = envp.data();
    ctx.isolate_filesystem = namespaces;
    ctx.drop_privileges = mode == Mode::NAMESPACES;
    ctx.mounts = &plan;
    ctx.work_dir = namespaces ? "/tmp" : code_dir.c_str();
    ctx.stdin_fd = dev_null.get();
    ctx.stdout_fd = stdio.stdout_fd;
    ctx.stderr_fd = stdio.stderr_fd;
    ctx.sync_read_fd = sync_pipe.read_end.get();
    ctx.sync_write_fd = sync_pipe.write_end.get();
    ctx.error_fd = error_pipe.write_end.get();
    ctx.memory_bytes = static_cast<rlim_t>(spec.limits.memory_limit_bytes);
    ctx.max_procs = static_cast<rlim_t>(spec.limits.max_pids);
    ctx.limit_fsize = !namespaces;

    pid_t pid;
    if (namespaces) {
        int flags = CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWNET | CLONE_NEWUTS | CLONE_NEWIPC | SIGCHLD;
        if (mode == Mode::USER_NAMESPACES) {
            flags |= CLONE_NEWUSER;
        }
        std::vector<char> stack(STACK_SIZE);
        pid = ::clone(child_entry, stack.data() + stack.size(), flags, &ctx);
        if (pid < 0) {
            reason = std::string("clone() failed: ") + strerror(errno);
            return nullptr;
        }
    } else {
        pid = ::fork();
        if (pid < 0) {
            throw LaunchError(std::string("fork() failed: ") + strerror(errno));
        }
        if (pid == 0) {
            ::_exit(child_entry(&ctx));
        }
    }

    sync_pipe.read_end.reset();
    error_pipe.write_end.reset();

    auto abandon_child = [pid]() {
        ::kill(pid, SIGKILL);
        int st;
        wait_for_pid(pid, st);
    };

    if (mode == Mode::USER_NAMESPACES && !write_id_maps(pid)) {
        abandon_child();
        reason = "cannot write uid/gid maps";
        return nullptr;
    }

    // Add child to cgroup before it can allocate anything
    if (!cgroup_path.empty()) {
        if (write_cgroup_file(cgroup_path + "/cgroup.procs", std::to_string(pid))) {
            spdlog::debug("Added PID {} to cgroup {}", pid, cgroup_path);
        } else {
            spdlog::warn("DEGRADED ISOLATION: Process {} not added to cgroup - limits fall back to rlimits", pid);
            status.memory_limit_applied = false;
            status.pids_limit_applied = false;
            status.cpu_weight_applied = false;
        }
    }

    char sync = 0;
    if (!status.memory_limit_applied) {
        sync |= SYNC_RLIMIT_AS;
    }
    // RLIMIT_NPROC counts per host uid, only meaningful without a PID namespace
    if (!status.pids_limit_applied && !namespaces) {
        sync |= SYNC_RLIMIT_NPROC;
    }
    if (::write(sync_pipe.write_end.get(), &sync, 1) != 1) {
        abandon_child();
        reason = std::string("cannot signal child: ") + strerror(errno);
        return nullptr;
    }
    sync_pipe.write_end.reset();

    // EOF means exec succeeded; otherwise the child says where it stopped
    ChildError child_error{};
    ssize_t n;
    do {
        n = ::read(error_pipe.read_end.get(), &child_error, sizeof(child_error));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_error))) {
        int st;
        wait_for_pid(pid, st);
        if (child_error.stage == STAGE_EXEC) {
            throw LaunchError("cannot execute " + args.front() + ": " + strerror(child_error.err));
        }
        reason = std::string(child_stage_to_string(child_error.stage)) + ": " +
                 strerror(child_error.err);
        return nullptr;
    }

    util::UniqueFd pidfd(open_pidfd(pid));
    if (!pidfd.is_open()) {
        int err = errno;
        abandon_child();
        throw LaunchError(std::string("pidfd_open failed: ") + strerror(err));
    }

    if (namespaces) {
        status.pid_namespace = true;
        status.mnt_namespace = true;
        status.net_namespace = true;
        status.uts_namespace = true;
        status.readonly_root = true;
        status.user_namespace = mode == Mode::USER_NAMESPACES;
    }
    status.memory_rlimit = !status.memory_limit_applied;
    status.fully_isolated = namespaces && status.memory_limit_applied && status.pids_limit_applied;

    if (!namespaces) {
        status.degraded_reason = "no namespace isolation (filesystem and network visible)";
    } else if (!status.fully_isolated) {
        status.degraded_reason = "no cgroup limits (memory capped by RLIMIT_AS)";
    }

    if (status.is_degraded()) {
        if (!degraded_warned_.exchange(true)) {
            spdlog::warn("DEGRADED ISOLATION: sandboxes run with {} via {}",
                         status.degraded_reason, mode_to_string(mode));
            spdlog::warn("  Namespaces: pid={}, mnt={}, net={}, user={}",
                         status.pid_namespace ? "ON" : "OFF",
                         status.mnt_namespace ? "ON" : "OFF",
                         status.net_namespace ? "ON" : "OFF",
                         status.user_namespace ? "ON" : "OFF");
            spdlog::warn("  Cgroups: memory={}, pids={}",
                         status.memory_limit_applied ? "ON" : "OFF",
                         status.pids_limit_applied ? "ON" : "OFF");
        } else {
            spdlog::debug("Request {} running with degraded isolation: {}",
                          spec.request_id, status.degraded_reason);
        }
    }

    spdlog::debug("Request {} started (PID={}, mode={})", spec.request_id, pid, mode_to_string(mode));
    return std::make_unique<NamespaceSandbox>(pid, std::move(pidfd), cgroup_path, std::move(status));
}

} // namespace execbox::runtime

#include "runtime/sandbox.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <sys/wait.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/resource.h>
#include <sys/prctl.h>
#include <sched.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <grp.h>
#include <signal.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

extern char** environ;

namespace codeloop::runtime {

// Stack size for clone()
constexpr size_t STACK_SIZE = 1024 * 1024; // 1MB

constexpr const char* CGROUP_ROOT = "/sys/fs/cgroup/codeloop";
constexpr const char* SANDBOX_MOUNT_POINT = "/workspace";
constexpr int POLL_INTERVAL_MS = 50;
constexpr int DRAIN_TIMEOUT_MS = 200;

// Child process arguments. Everything the child touches is prepared
// by the parent so the child only performs syscalls before exec.
struct ChildArgs {
    std::vector<std::string> argv;
    std::vector<std::string> envp;
    std::vector<char*> argv_ptrs;
    std::vector<char*> envp_ptrs;
    std::string rootfs;          // Empty for the host image
    std::string workdir;         // Host path of the working directory
    std::string hostname;
    ResourceLimits limits;
    int uid = -1;
    int gid = -1;
    int sync_fd[2] = {-1, -1};   // Parent releases the child once it is in the cgroup
    int stdout_fd = -1;
    int stderr_fd = -1;
    bool namespaced = false;
    bool mount_namespace = false;
    bool pid_namespace = false;
    bool uts_namespace = false;
};

static void child_fail(const char* what) {
    dprintf(STDERR_FILENO, "sandbox: %s failed: %s\n", what, strerror(errno));
    _exit(EXIT_EXEC_FAILED);
}

static bool write_cgroup_file(const std::string& path, const std::string& value) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return false;
    }
    try {
        std::ofstream ofs(path);
        if (!ofs.is_open()) {
            return false;
        }
        ofs << value;
        ofs.flush();
        return ofs.good();
    } catch (const std::exception& e) {
        spdlog::debug("Cannot write {}: {}", path, e.what());
        return false;
    }
}

static uint64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

// ============================================================================
// Utility
// ============================================================================

const char* sandbox_state_to_string(SandboxState state) {
    switch (state) {
        case SandboxState::CREATING:   return "creating";
        case SandboxState::RUNNING:    return "running";
        case SandboxState::IDLE:       return "idle";
        case SandboxState::TERMINATED: return "terminated";
        default: return "unknown";
    }
}

const char* exec_outcome_to_string(ExecOutcome outcome) {
    switch (outcome) {
        case ExecOutcome::EXITED:             return "exited";
        case ExecOutcome::TIMEOUT:            return "timeout";
        case ExecOutcome::RESOURCE_EXCEEDED:  return "resource_exceeded";
        case ExecOutcome::NOT_SUPPORTED:      return "not_supported";
        case ExecOutcome::PROVISIONING_ERROR: return "provisioning_error";
        case ExecOutcome::CANCELLED:          return "cancelled";
        case ExecOutcome::INTERNAL_ERROR:     return "internal_error";
        default: return "unknown";
    }
}

nlohmann::json ResourceLimits::to_json() const {
    nlohmann::json j;
    j["memory_limit_bytes"] = memory_limit_bytes;
    j["cpu_shares"] = cpu_shares;
    j["cpu_quota_us"] = cpu_quota_us;
    j["cpu_period_us"] = cpu_period_us;
    j["max_pids"] = max_pids;
    j["max_output_bytes"] = max_output_bytes;
    j["max_file_size_bytes"] = max_file_size_bytes;
    j["max_open_files"] = max_open_files;
    return j;
}

ResourceLimits ResourceLimits::from_json(const nlohmann::json& j) {
    return from_json(j, ResourceLimits());
}

ResourceLimits ResourceLimits::from_json(const nlohmann::json& j, const ResourceLimits& base) {
    ResourceLimits limits = base;
    if (!j.is_object()) {
        return limits;
    }
    limits.memory_limit_bytes = j.value("memory_limit_bytes", base.memory_limit_bytes);
    limits.cpu_shares = j.value("cpu_shares", base.cpu_shares);
    limits.cpu_quota_us = j.value("cpu_quota_us", base.cpu_quota_us);
    limits.cpu_period_us = j.value("cpu_period_us", base.cpu_period_us);
    limits.max_pids = j.value("max_pids", base.max_pids);
    limits.max_output_bytes = j.value("max_output_bytes", base.max_output_bytes);
    limits.max_file_size_bytes = j.value("max_file_size_bytes", base.max_file_size_bytes);
    limits.max_open_files = j.value("max_open_files", base.max_open_files);
    return limits;
}

nlohmann::json ExecutionResult::to_json() const {
    nlohmann::json j;
    j["outcome"] = exec_outcome_to_string(outcome);
    j["stdout"] = stdout_text;
    j["stderr"] = stderr_text;
    j["exit_code"] = exit_code;
    j["duration_ms"] = duration_ms;
    if (!error.empty()) {
        j["error"] = error;
    }
    if (!sandbox_id.empty()) {
        j["sandbox_id"] = sandbox_id;
    }
    return j;
}

ExecutionResult ExecutionResult::failure(ExecOutcome outcome, const std::string& error) {
    ExecutionResult result;
    result.outcome = outcome;
    result.error = error;
    result.exit_code = EXIT_NOT_RUN;
    return result;
}

// ============================================================================
// Sandbox Implementation
// ============================================================================

Sandbox::Sandbox(std::string id, const SandboxConfig& config)
    : id_(std::move(id))
    , config_(config)
    , created_at_(std::chrono::system_clock::now()) {
    workdir_ = (fs::path(config_.workspace_root) / id_).string();
    cgroup_path_ = std::string(CGROUP_ROOT) + "/" + id_;
}

Sandbox::~Sandbox() {
    destroy();
}

bool Sandbox::create(std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != SandboxState::CREATING) {
        error = fmt::format("sandbox {} already created", id_);
        spdlog::error("{}", error);
        return false;
    }

    spdlog::info("Creating sandbox: {} (language={}, image={})",
        id_, config_.language, config_.image);

    // Image availability is an operational precondition; never fetch here
    std::error_code ec;
    if (config_.image != HOST_IMAGE) {
        rootfs_ = SandboxManager::image_path(config_.image_root, config_.image);
        if (!fs::is_directory(rootfs_, ec)) {
            error = fmt::format("image '{}' is not available locally ({})", config_.image, rootfs_);
            set_state(SandboxState::TERMINATED);
            return false;
        }
        if (!fs::is_directory(rootfs_ + SANDBOX_MOUNT_POINT, ec)) {
            error = fmt::format("image '{}' has no {} mount point", config_.image, SANDBOX_MOUNT_POINT);
            set_state(SandboxState::TERMINATED);
            return false;
        }
    }

    fs::create_directories(workdir_, ec);
    if (ec) {
        error = fmt::format("cannot create working directory {}: {}", workdir_, ec.message());
        set_state(SandboxState::TERMINATED);
        return false;
    }
    fs::permissions(workdir_, static_cast<fs::perms>(config_.workspace_mode),
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Cannot set mode {:o} on {}: {}", config_.workspace_mode, workdir_, ec.message());
    }

    // The sandboxed process drops to run_as_uid, so it must own its workdir
    if (geteuid() == 0 && chown(workdir_.c_str(), config_.run_as_uid, config_.run_as_gid) < 0) {
        error = fmt::format("cannot chown {}: {}", workdir_, strerror(errno));
        fs::remove_all(workdir_, ec);
        set_state(SandboxState::TERMINATED);
        return false;
    }

    if (config_.enable_cgroups) {
        setup_cgroups();
    }

    set_state(SandboxState::IDLE);
    spdlog::debug("Sandbox {} created successfully (workdir={})", id_, workdir_);
    return true;
}

bool Sandbox::setup_cgroups() {
    // Check if cgroup v2 is available
    std::error_code ec;
    if (!fs::exists("/sys/fs/cgroup/cgroup.controllers", ec)) {
        spdlog::warn("DEGRADED ISOLATION: cgroup v2 not available - resource limits will NOT be enforced");
        isolation_status_.degraded_reason = "cgroup v2 not available";
        return true;
    }

    fs::create_directories(cgroup_path_, ec);
    if (ec) {
        spdlog::warn("DEGRADED ISOLATION: Cannot create sandbox cgroup (need root): {}", ec.message());
        isolation_status_.degraded_reason = "Cannot create sandbox cgroup (need root)";
        return true;
    }

    isolation_status_.cgroups_available = true;
    const ResourceLimits& limits = config_.limits;

    if (write_cgroup_file(cgroup_path_ + "/memory.max", std::to_string(limits.memory_limit_bytes))) {
        isolation_status_.memory_limit_applied = true;
        spdlog::debug("Set memory limit: {} bytes", limits.memory_limit_bytes);
    } else {
        spdlog::warn("DEGRADED ISOLATION: memory.max not available - memory limit NOT enforced");
    }

    // Memory limit includes swap, as with a container's memswap == mem_limit
    if (!write_cgroup_file(cgroup_path_ + "/memory.swap.max", "0")) {
        spdlog::debug("memory.swap.max not available");
    }

    if (write_cgroup_file(cgroup_path_ + "/cpu.max",
            fmt::format("{} {}", limits.cpu_quota_us, limits.cpu_period_us))) {
        isolation_status_.cpu_quota_applied = true;
        spdlog::debug("Set CPU quota: {}us per {}us", limits.cpu_quota_us, limits.cpu_period_us);
    } else {
        spdlog::warn("DEGRADED ISOLATION: cpu.max not available - CPU quota NOT enforced");
    }

    if (write_cgroup_file(cgroup_path_ + "/pids.max", std::to_string(limits.max_pids))) {
        isolation_status_.pids_limit_applied = true;
        spdlog::debug("Set max PIDs: {}", limits.max_pids);
    } else {
        spdlog::warn("DEGRADED ISOLATION: pids.max not available - PID limit NOT enforced");
    }

    // cpu.weight range: 1-10000, default 100
    // cpu.shares range: 2-262144, default 1024
    uint64_t weight = (limits.cpu_shares * 100) / 1024;
    if (weight < 1) weight = 1;
    if (weight > 10000) weight = 10000;
    if (write_cgroup_file(cgroup_path_ + "/cpu.weight", std::to_string(weight))) {
        spdlog::debug("Set CPU weight: {} (from shares {})", weight, limits.cpu_shares);
    }

    if (!isolation_status_.memory_limit_applied ||
        !isolation_status_.cpu_quota_applied ||
        !isolation_status_.pids_limit_applied) {
        spdlog::warn("Sandbox {} running with partial cgroup limits: memory={}, cpu={}, pids={}",
            id_,
            isolation_status_.memory_limit_applied ? "ON" : "OFF",
            isolation_status_.cpu_quota_applied ? "ON" : "OFF",
            isolation_status_.pids_limit_applied ? "ON" : "OFF");
    }

    return true;
}

bool Sandbox::cleanup_cgroups() {
    std::error_code ec;
    if (!fs::exists(cgroup_path_, ec)) {
        return true;
    }
    // cgroupfs directories are removed with rmdir, not by deleting their files
    if (rmdir(cgroup_path_.c_str()) < 0) {
        spdlog::warn("Failed to cleanup cgroup {}: {}", cgroup_path_, strerror(errno));
        return false;
    }
    spdlog::debug("Cleaned up cgroup: {}", cgroup_path_);
    return true;
}

bool Sandbox::add_to_cgroup(pid_t pid) {
    if (write_cgroup_file(cgroup_path_ + "/cgroup.procs", std::to_string(pid))) {
        spdlog::debug("Added PID {} to cgroup {}", pid, cgroup_path_);
        return true;
    }
    return false;
}

uint64_t Sandbox::read_oom_kills() const {
    std::ifstream ifs(cgroup_path_ + "/memory.events");
    std::string key;
    uint64_t value = 0;
    while (ifs >> key >> value) {
        if (key == "oom_kill") {
            return value;
        }
    }
    return 0;
}

void Sandbox::kill_tree() {
    pid_t pid = child_pid_.load();
    if (pid <= 0) {
        return;
    }

    write_cgroup_file(cgroup_path_ + "/cgroup.kill", "1");

    if (child_has_pidns_) {
        // Killing the namespace init takes every process in it down
        kill(pid, SIGKILL);
    } else {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
    }
}

std::string Sandbox::sandbox_workdir() const {
    return rootfs_.empty() ? workdir_ : std::string(SANDBOX_MOUNT_POINT);
}

std::vector<std::string> Sandbox::expand_command(const std::string& file) const {
    std::vector<std::string> argv;
    const std::string dir = sandbox_workdir();
    for (std::string token : config_.command) {
        size_t pos;
        while ((pos = token.find("{file}")) != std::string::npos) {
            token.replace(pos, 6, file);
        }
        while ((pos = token.find("{dir}")) != std::string::npos) {
            token.replace(pos, 5, dir);
        }
        argv.push_back(token);
    }
    return argv;
}

std::vector<std::string> Sandbox::build_environment() const {
    const std::string dir = sandbox_workdir();
    return {
        "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin",
        "HOME=" + dir,
        "TMPDIR=" + dir,
        "LANG=C.UTF-8",
        "PYTHONUNBUFFERED=1",
    };
}

int Sandbox::child_entry(void* arg) {
    ChildArgs* args = static_cast<ChildArgs*>(arg);

    // Close write end of the sync pipe
    close(args->sync_fd[1]);

    if (dup2(args->stdout_fd, STDOUT_FILENO) < 0 || dup2(args->stderr_fd, STDERR_FILENO) < 0) {
        _exit(EXIT_EXEC_FAILED);
    }

    // Wait for parent to set up cgroups
    char buf;
    if (read(args->sync_fd[0], &buf, 1) != 1) {
        _exit(EXIT_EXEC_FAILED);
    }
    close(args->sync_fd[0]);

    // Without a PID namespace the tree is killed through its process group
    if (!args->pid_namespace) {
        setpgid(0, 0);
    }

    if (args->mount_namespace) {
        // Keep our mounts from propagating back to the host
        if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) < 0) {
            child_fail("mount(MS_PRIVATE)");
        }
    }

    if (!args->rootfs.empty()) {
        std::string target = args->rootfs + SANDBOX_MOUNT_POINT;
        if (mount(args->workdir.c_str(), target.c_str(), nullptr, MS_BIND, nullptr) < 0) {
            child_fail("bind mount of working directory");
        }
        if (args->pid_namespace) {
            std::string proc = args->rootfs + "/proc";
            if (mount("proc", proc.c_str(), "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) < 0) {
                dprintf(STDERR_FILENO, "sandbox: could not mount /proc: %s\n", strerror(errno));
            }
        }
        if (chroot(args->rootfs.c_str()) < 0) {
            child_fail("chroot");
        }
        if (chdir(SANDBOX_MOUNT_POINT) < 0) {
            child_fail("chdir");
        }
    } else if (chdir(args->workdir.c_str()) < 0) {
        child_fail("chdir");
    }

    if (args->uts_namespace) {
        sethostname(args->hostname.c_str(), args->hostname.length());
    }

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
    }

    struct rlimit rl;
    rl.rlim_cur = rl.rlim_max = args->limits.max_file_size_bytes;
    setrlimit(RLIMIT_FSIZE, &rl);
    rl.rlim_cur = rl.rlim_max = args->limits.max_open_files;
    setrlimit(RLIMIT_NOFILE, &rl);
    rl.rlim_cur = rl.rlim_max = 0;
    setrlimit(RLIMIT_CORE, &rl);

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
        child_fail("prctl(PR_SET_NO_NEW_PRIVS)");
    }

    if (geteuid() == 0) {
        if (setgroups(0, nullptr) < 0) child_fail("setgroups");
        if (setgid(args->gid) < 0) child_fail("setgid");
        if (setuid(args->uid) < 0) child_fail("setuid");
    }

    environ = args->envp_ptrs.data();
    execvp(args->argv_ptrs[0], args->argv_ptrs.data());

    // If we get here, exec failed
    dprintf(STDERR_FILENO, "sandbox: exec %s failed: %s\n", args->argv_ptrs[0], strerror(errno));
    _exit(EXIT_EXEC_FAILED);
}

ExecutionResult Sandbox::run(const std::string& code,
                             std::chrono::milliseconds timeout,
                             const CancelToken& cancel) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SandboxState::TERMINATED) {
            return ExecutionResult::failure(ExecOutcome::INTERNAL_ERROR,
                fmt::format("sandbox {} already released", id_));
        }
        if (state_ != SandboxState::IDLE) {
            return ExecutionResult::failure(ExecOutcome::INTERNAL_ERROR,
                fmt::format("sandbox {} is {}", id_, sandbox_state_to_string(state_)));
        }
        set_state(SandboxState::RUNNING);
    }

    ExecutionResult result = execute(code, timeout, cancel);
    result.sandbox_id = id_;

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SandboxState::TERMINATED) {
        // Released while running; the cgroup could not be removed then
        cleanup_cgroups();
    } else {
        set_state(SandboxState::IDLE);
    }
    return result;
}

ExecutionResult Sandbox::execute(const std::string& code,
                                 std::chrono::milliseconds timeout,
                                 const CancelToken& cancel) {
    auto start = std::chrono::steady_clock::now();

    std::string filename = "main" + config_.file_suffix;
    fs::path host_file = fs::path(workdir_) / filename;
    {
        std::ofstream ofs(host_file, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            return ExecutionResult::failure(ExecOutcome::INTERNAL_ERROR,
                fmt::format("cannot write {}", host_file.string()));
        }
        ofs << code;
        if (!ofs.good()) {
            return ExecutionResult::failure(ExecOutcome::INTERNAL_ERROR,
                fmt::format("short write to {}", host_file.string()));
        }
    }
    if (geteuid() == 0 && chown(host_file.c_str(), config_.run_as_uid, config_.run_as_gid) < 0) {
        spdlog::warn("Cannot chown {}: {}", host_file.string(), strerror(errno));
    }

    ChildArgs args;
    args.argv = expand_command(sandbox_workdir() + "/" + filename);
    args.envp = build_environment();
    for (auto& s : args.argv) args.argv_ptrs.push_back(s.data());
    args.argv_ptrs.push_back(nullptr);
    for (auto& s : args.envp) args.envp_ptrs.push_back(s.data());
    args.envp_ptrs.push_back(nullptr);
    args.rootfs = rootfs_;
    args.workdir = workdir_;
    args.hostname = "codeloop-" + id_;
    args.limits = config_.limits;
    args.uid = config_.run_as_uid;
    args.gid = config_.run_as_gid;

    if (args.argv.empty()) {
        return ExecutionResult::failure(ExecOutcome::INTERNAL_ERROR, "empty command template");
    }

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe2(args.sync_fd, O_CLOEXEC) < 0) {
        return ExecutionResult::failure(ExecOutcome::INTERNAL_ERROR,
            fmt::format("pipe: {}", strerror(errno)));
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        close(args.sync_fd[0]);
        close(args.sync_fd[1]);
        return ExecutionResult::failure(ExecOutcome::INTERNAL_ERROR,
            fmt::format("pipe: {}", strerror(errno)));
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        close(args.sync_fd[0]);
        close(args.sync_fd[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return ExecutionResult::failure(ExecOutcome::INTERNAL_ERROR,
            fmt::format("pipe: {}", strerror(errno)));
    }
    args.stdout_fd = stdout_pipe[1];
    args.stderr_fd = stderr_pipe[1];

    auto close_all = [&]() {
        close(args.sync_fd[0]);
        close(args.sync_fd[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
    };

    // Build clone flags
    int clone_flags = SIGCHLD;
    if (config_.enable_pid_namespace) clone_flags |= CLONE_NEWPID;
    if (config_.enable_mount_namespace || !rootfs_.empty()) clone_flags |= CLONE_NEWNS;
    if (config_.enable_uts_namespace) clone_flags |= CLONE_NEWUTS;
    if (config_.enable_ipc_namespace) clone_flags |= CLONE_NEWIPC;
    if (!config_.enable_network) clone_flags |= CLONE_NEWNET;

    args.namespaced = true;
    args.pid_namespace = (clone_flags & CLONE_NEWPID) != 0;
    args.mount_namespace = (clone_flags & CLONE_NEWNS) != 0;
    args.uts_namespace = (clone_flags & CLONE_NEWUTS) != 0;

    std::vector<char> stack(STACK_SIZE);
    pid_t pid = clone(child_entry, stack.data() + STACK_SIZE, clone_flags, &args);

    bool degraded_spawn = false;
    if (pid < 0) {
        int clone_errno = errno;
        if (!rootfs_.empty()) {
            close_all();
            return ExecutionResult::failure(ExecOutcome::PROVISIONING_ERROR,
                fmt::format("image '{}' needs namespace isolation but clone() failed: {}",
                    config_.image, strerror(clone_errno)));
        }

        spdlog::warn("DEGRADED ISOLATION: clone() failed ({}), falling back to fork()", strerror(clone_errno));
        spdlog::warn("  -> Namespace isolation (PID, NET, MNT, UTS, IPC) will NOT be available");

        args.namespaced = false;
        args.pid_namespace = false;
        args.mount_namespace = false;
        args.uts_namespace = false;
        degraded_spawn = true;

        pid = fork();
        if (pid < 0) {
            int fork_errno = errno;
            close_all();
            return ExecutionResult::failure(ExecOutcome::INTERNAL_ERROR,
                fmt::format("fork: {}", strerror(fork_errno)));
        }
        if (pid == 0) {
            _exit(child_entry(&args));
        }
    }

    child_pid_ = pid;
    child_has_pidns_ = args.pid_namespace;

    // Parent: close the child's ends
    close(args.sync_fd[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    bool cgroup_assigned = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (isolation_status_.cgroups_available) {
            cgroup_assigned = add_to_cgroup(pid);
        }
        if (degraded_spawn) {
            isolation_status_.degraded_reason =
                "clone() failed - no namespace isolation (need root/CAP_SYS_ADMIN)";
        } else {
            isolation_status_.pid_namespace = args.pid_namespace;
            isolation_status_.mnt_namespace = args.mount_namespace;
            isolation_status_.uts_namespace = args.uts_namespace;
            isolation_status_.ipc_namespace = (clone_flags & CLONE_NEWIPC) != 0;
            isolation_status_.net_namespace = (clone_flags & CLONE_NEWNET) != 0;
        }
        bool cgroups_ok = !config_.enable_cgroups ||
                          (cgroup_assigned &&
                           isolation_status_.memory_limit_applied &&
                           isolation_status_.cpu_quota_applied &&
                           isolation_status_.pids_limit_applied);
        isolation_status_.fully_isolated = !degraded_spawn && cgroups_ok;
    }

    if (config_.enable_cgroups && !cgroup_assigned) {
        spdlog::debug("Process {} not added to cgroup - resource limits NOT enforced", pid);
    }
    uint64_t oom_before = cgroup_assigned ? read_oom_kills() : 0;

    // Signal child to continue
    if (write(args.sync_fd[1], "x", 1) != 1) {
        spdlog::error("Failed to release sandbox child {}: {}", pid, strerror(errno));
    }
    close(args.sync_fd[1]);

    spdlog::debug("Sandbox {} started {} (pid={}, timeout={}ms)",
        id_, args.argv[0], pid, timeout.count());

    ExecutionResult result;
    result.outcome = ExecOutcome::EXITED;

    auto deadline = start + timeout;
    const uint64_t output_cap = config_.limits.max_output_bytes;
    int fds[2] = {stdout_pipe[0], stderr_pipe[0]};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    bool open_fds[2] = {true, true};
    bool exited = false;
    bool killed = false;
    int status = 0;
    char buffer[4096];

    auto force_kill = [&](ExecOutcome outcome, const std::string& reason) {
        if (killed) return;
        killed = true;
        result.outcome = outcome;
        result.error = reason;
        kill_tree();
    };

    auto read_ready = [&](int wait_ms) {
        struct pollfd pfds[2];
        int slots[2];
        nfds_t n = 0;
        for (int i = 0; i < 2; i++) {
            if (open_fds[i]) {
                pfds[n].fd = fds[i];
                pfds[n].events = POLLIN;
                pfds[n].revents = 0;
                slots[n] = i;
                n++;
            }
        }
        if (n == 0) return;
        int ready = poll(pfds, n, wait_ms);
        if (ready < 0) {
            if (errno != EINTR) {
                force_kill(ExecOutcome::INTERNAL_ERROR, fmt::format("poll: {}", strerror(errno)));
                open_fds[0] = open_fds[1] = false;
            }
            return;
        }
        for (nfds_t k = 0; k < n; k++) {
            if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            int i = slots[k];
            ssize_t bytes = read(fds[i], buffer, sizeof(buffer));
            if (bytes > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(bytes));
                if (output_cap > 0 && sinks[i]->size() > output_cap) {
                    sinks[i]->resize(output_cap);
                    force_kill(ExecOutcome::RESOURCE_EXCEEDED,
                        fmt::format("output limit exceeded: more than {} bytes on {}",
                            output_cap, i == 0 ? "stdout" : "stderr"));
                }
            } else if (bytes == 0 || (errno != EINTR && errno != EAGAIN)) {
                open_fds[i] = false;
            }
        }
    };

    while (!exited) {
        if (!killed && cancel.cancelled()) {
            force_kill(ExecOutcome::CANCELLED, "execution cancelled");
        }
        if (!killed && std::chrono::steady_clock::now() >= deadline) {
            force_kill(ExecOutcome::TIMEOUT,
                fmt::format("timeout: execution exceeded {} ms", timeout.count()));
        }

        if (open_fds[0] || open_fds[1]) {
            read_ready(POLL_INTERVAL_MS);
        } else {
            usleep(10 * 1000);
        }

        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            exited = true;
        } else if (r < 0 && errno != EINTR) {
            spdlog::error("waitpid({}) failed: {}", pid, strerror(errno));
            force_kill(ExecOutcome::INTERNAL_ERROR, fmt::format("waitpid: {}", strerror(errno)));
            break;
        }
    }

    if (exited && !child_has_pidns_) {
        // Leftover background processes would keep the pipes open
        kill(-pid, SIGKILL);
    }
    auto drain_start = std::chrono::steady_clock::now();
    while ((open_fds[0] || open_fds[1]) && elapsed_ms(drain_start) < DRAIN_TIMEOUT_MS) {
        read_ready(POLL_INTERVAL_MS);
    }
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    if (!exited) {
        kill_tree();
        waitpid(pid, &status, 0);
    }
    child_pid_ = -1;

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (cgroup_assigned && result.outcome == ExecOutcome::EXITED && read_oom_kills() > oom_before) {
        result.outcome = ExecOutcome::RESOURCE_EXCEEDED;
        result.error = fmt::format("memory limit exceeded ({} bytes)", config_.limits.memory_limit_bytes);
        result.exit_code = EXIT_RESOURCE_KILL;
    }

    if (result.outcome == ExecOutcome::TIMEOUT) {
        result.exit_code = EXIT_TIMEOUT;
        if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') {
            result.stderr_text += '\n';
        }
        result.stderr_text += fmt::format("Execution timed out after {} ms.\n", timeout.count());
    } else if (result.outcome == ExecOutcome::RESOURCE_EXCEEDED) {
        result.exit_code = EXIT_RESOURCE_KILL;
    }

    result.duration_ms = elapsed_ms(start);
    spdlog::info("Sandbox {} finished: outcome={} exit={} duration={}ms",
        id_, exec_outcome_to_string(result.outcome), result.exit_code, result.duration_ms);
    return result;
}

bool Sandbox::destroy() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == SandboxState::TERMINATED) {
        return true;
    }

    if (state_ == SandboxState::RUNNING) {
        spdlog::warn("Sandbox {} released while running, killing process tree", id_);
        kill_tree();
    }

    set_state(SandboxState::TERMINATED);
    cleanup_cgroups();

    std::error_code ec;
    fs::remove_all(workdir_, ec);
    if (ec) {
        spdlog::warn("Failed to remove working directory {}: {}", workdir_, ec.message());
    }

    spdlog::debug("Sandbox {} destroyed", id_);
    return true;
}

SandboxState Sandbox::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

IsolationStatus Sandbox::isolation_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isolation_status_;
}

void Sandbox::set_state(SandboxState new_state) {
    spdlog::trace("Sandbox {} state: {} -> {}", id_,
        sandbox_state_to_string(state_), sandbox_state_to_string(new_state));
    state_ = new_state;
}

// ============================================================================
// SandboxManager Implementation
// ============================================================================

static std::atomic<uint64_t> g_next_sandbox_id{1};

SandboxManager::SandboxManager() {
    cgroup_root_ = CGROUP_ROOT;
    init_cgroup_root();
}

SandboxManager::~SandboxManager() {
    cleanup_all();
}

bool SandboxManager::init_cgroup_root() {
    std::error_code ec;
    if (!fs::exists("/sys/fs/cgroup/cgroup.controllers", ec)) {
        spdlog::warn("cgroup v2 not available");
        return false;
    }

    if (!fs::exists(cgroup_root_, ec)) {
        fs::create_directories(cgroup_root_, ec);
        if (ec) {
            spdlog::warn("Cannot create cgroup root (need root): {}", ec.message());
            return false;
        }
        spdlog::info("Created cgroup root: {}", cgroup_root_);
    }

    // Enable controllers for our subtree
    if (!write_cgroup_file("/sys/fs/cgroup/cgroup.subtree_control", "+cpu +memory +pids") ||
        !write_cgroup_file(cgroup_root_ + "/cgroup.subtree_control", "+cpu +memory +pids")) {
        spdlog::debug("Could not enable cgroup controllers");
    }

    return true;
}

std::string SandboxManager::image_path(const std::string& image_root, const std::string& image) {
    if (image == HOST_IMAGE) {
        return "";
    }
    if (!image.empty() && image.front() == '/') {
        return image;
    }
    return (fs::path(image_root) / image).string();
}

bool SandboxManager::image_available(const std::string& image_root, const std::string& image) {
    if (image == HOST_IMAGE) {
        return true;
    }
    std::error_code ec;
    return fs::is_directory(image_path(image_root, image), ec);
}

std::shared_ptr<Sandbox> SandboxManager::acquire(const SandboxConfig& config, std::string& error) {
    std::string id = fmt::format("sb-{}-{}", getpid(), g_next_sandbox_id++);

    auto sandbox = std::make_shared<Sandbox>(id, config);
    if (!sandbox->create(error)) {
        spdlog::error("Provisioning of sandbox {} failed: {}", id, error);
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sandboxes_[id] = sandbox;
    acquired_total_++;
    return sandbox;
}

ExecutionResult SandboxManager::run(const std::shared_ptr<Sandbox>& sandbox,
                                    const std::string& code,
                                    std::chrono::milliseconds timeout,
                                    const CancelToken& cancel) {
    if (!sandbox) {
        return ExecutionResult::failure(ExecOutcome::INTERNAL_ERROR, "no sandbox");
    }
    return sandbox->run(code, timeout, cancel);
}

void SandboxManager::release(const std::shared_ptr<Sandbox>& sandbox) {
    if (!sandbox) {
        return;
    }

    sandbox->destroy();

    std::lock_guard<std::mutex> lock(mutex_);
    sandboxes_.erase(sandbox->id());
}

std::shared_ptr<Sandbox> SandboxManager::get_sandbox(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandboxes_.find(id);
    if (it != sandboxes_.end()) {
        return it->second;
    }
    return nullptr;
}

size_t SandboxManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sandboxes_.size();
}

void SandboxManager::cleanup_all() {
    std::unordered_map<std::string, std::shared_ptr<Sandbox>> sandboxes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sandboxes.swap(sandboxes_);
    }
    for (auto& [id, sandbox] : sandboxes) {
        sandbox->destroy();
    }
}

} // namespace codeloop::runtime

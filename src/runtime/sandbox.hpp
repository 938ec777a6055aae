/**
 * codeloop Sandbox
 *
 * Process isolation using Linux namespaces (PID, NET, MNT, UTS, IPC),
 * cgroups v2 for resource limits (memory, CPU, PIDs) and rlimits for
 * the working directory quota. Submitted code runs chrooted into an
 * image root filesystem, or against the host root for the "host" image.
 * Requires root/CAP_SYS_ADMIN for full isolation; degrades to fork().
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <unordered_map>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "runtime/cancellation.hpp"

namespace codeloop::runtime {

// Image reference that runs against the host root filesystem
constexpr const char* HOST_IMAGE = "host";

// Exit code conventions for outcomes that did not exit on their own
constexpr int EXIT_TIMEOUT = 124;
constexpr int EXIT_EXEC_FAILED = 127;
constexpr int EXIT_RESOURCE_KILL = 137;   // 128 + SIGKILL
constexpr int EXIT_NOT_RUN = -1;

// Resource limits for sandboxed processes
struct ResourceLimits {
    uint64_t memory_limit_bytes = 128 * 1024 * 1024;  // 128MB default, no swap
    uint64_t cpu_shares = 1024;                        // Relative CPU weight
    uint64_t cpu_quota_us = 100000;                    // 100ms per 100ms period (100%)
    uint64_t cpu_period_us = 100000;                   // 100ms period
    uint64_t max_pids = 128;                           // Max processes
    uint64_t max_output_bytes = 1024 * 1024;           // Per stream capture cap
    uint64_t max_file_size_bytes = 16 * 1024 * 1024;   // RLIMIT_FSIZE (workdir quota)
    uint64_t max_open_files = 256;                     // RLIMIT_NOFILE

    nlohmann::json to_json() const;
    // Fields missing from j keep the values of base
    static ResourceLimits from_json(const nlohmann::json& j, const ResourceLimits& base);
    static ResourceLimits from_json(const nlohmann::json& j);
};

// Sandbox configuration
struct SandboxConfig {
    std::string language;                  // Adapter identifier (for logs)
    std::string image = HOST_IMAGE;        // Image reference
    std::string image_root;                // Directory holding image root filesystems
    std::string workspace_root = "/tmp/codeloop";
    unsigned workspace_mode = 0700;        // Permission bits of the working directory
    std::vector<std::string> command;      // Command template ({file}, {dir})
    std::string file_suffix;               // e.g. ".py"
    ResourceLimits limits;

    int run_as_uid = 1000;                 // Applied only when running as root
    int run_as_gid = 1000;

    bool enable_network = false;           // Network isolation
    bool enable_pid_namespace = true;      // PID namespace isolation
    bool enable_mount_namespace = true;    // Mount namespace isolation
    bool enable_uts_namespace = true;      // UTS (hostname) isolation
    bool enable_ipc_namespace = true;      // SysV IPC isolation
    bool enable_cgroups = true;            // cgroups resource limits
};

// Sandbox state
enum class SandboxState {
    CREATING,
    RUNNING,
    IDLE,
    TERMINATED
};

const char* sandbox_state_to_string(SandboxState state);

// How an execution ended
enum class ExecOutcome {
    EXITED,              // Process ran to completion (any exit code)
    TIMEOUT,             // Wall-clock budget exceeded, tree killed
    RESOURCE_EXCEEDED,   // OOM kill or output cap, tree killed
    NOT_SUPPORTED,       // Unknown language, no sandbox touched
    PROVISIONING_ERROR,  // Environment could not be created
    CANCELLED,           // Aborted by the caller, tree killed
    INTERNAL_ERROR       // pipe/clone/fork failures on our side
};

const char* exec_outcome_to_string(ExecOutcome outcome);

// Result of one execution. Immutable once produced.
struct ExecutionResult {
    ExecOutcome outcome = ExecOutcome::INTERNAL_ERROR;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = EXIT_NOT_RUN;
    uint64_t duration_ms = 0;
    std::string error;          // Detail for non-EXITED outcomes
    std::string sandbox_id;     // Empty when no sandbox was used

    bool succeeded() const { return outcome == ExecOutcome::EXITED && exit_code == 0; }

    nlohmann::json to_json() const;

    static ExecutionResult failure(ExecOutcome outcome, const std::string& error);
};

// Isolation status - tracks what isolation features are actually active
struct IsolationStatus {
    // Namespace isolation
    bool pid_namespace = false;
    bool net_namespace = false;
    bool mnt_namespace = false;
    bool uts_namespace = false;
    bool ipc_namespace = false;

    // Cgroup resource limits
    bool cgroups_available = false;
    bool memory_limit_applied = false;
    bool cpu_quota_applied = false;
    bool pids_limit_applied = false;

    // Overall
    bool fully_isolated = false;  // All requested features active
    std::string degraded_reason;  // Why isolation is degraded (if applicable)

    bool is_degraded() const { return !fully_isolated && !degraded_reason.empty(); }
};

class Sandbox {
public:
    Sandbox(std::string id, const SandboxConfig& config);
    ~Sandbox();

    // Non-copyable
    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // Lifecycle
    bool create(std::string& error);
    ExecutionResult run(const std::string& code,
                        std::chrono::milliseconds timeout,
                        const CancelToken& cancel);
    bool destroy();

    // Status
    SandboxState state() const;
    bool is_terminated() const { return state() == SandboxState::TERMINATED; }
    const std::string& id() const { return id_; }
    const SandboxConfig& config() const { return config_; }
    const std::string& workdir() const { return workdir_; }
    std::chrono::system_clock::time_point created_at() const { return created_at_; }
    IsolationStatus isolation_status() const;

    // Path of the working directory as seen by the sandboxed process
    std::string sandbox_workdir() const;

private:
    std::string id_;
    SandboxConfig config_;
    std::string workdir_;
    std::string rootfs_;         // Empty for the host image
    std::string cgroup_path_;
    std::chrono::system_clock::time_point created_at_;

    mutable std::mutex mutex_;
    SandboxState state_ = SandboxState::CREATING;
    IsolationStatus isolation_status_;

    // Process currently running in this sandbox (-1 when idle)
    std::atomic<pid_t> child_pid_{-1};
    std::atomic<bool> child_has_pidns_{false};

    ExecutionResult execute(const std::string& code,
                            std::chrono::milliseconds timeout,
                            const CancelToken& cancel);

    bool setup_cgroups();
    bool cleanup_cgroups();
    bool add_to_cgroup(pid_t pid);
    uint64_t read_oom_kills() const;
    void kill_tree();

    std::vector<std::string> expand_command(const std::string& file) const;
    std::vector<std::string> build_environment() const;

    // Child process entry point (runs in new namespaces)
    static int child_entry(void* arg);

    void set_state(SandboxState new_state);
};

// Sandbox manager - owns the registry of live sandboxes
class SandboxManager {
public:
    SandboxManager();
    ~SandboxManager();

    // Non-copyable
    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    // Resolve an image reference to its root filesystem ("" for host)
    static std::string image_path(const std::string& image_root, const std::string& image);

    // Check that an image is available locally (never fetches)
    static bool image_available(const std::string& image_root, const std::string& image);

    // Provision a new sandbox. Returns nullptr and sets error on
    // provisioning failure.
    std::shared_ptr<Sandbox> acquire(const SandboxConfig& config, std::string& error);

    // Run code inside a sandbox owned by the caller
    ExecutionResult run(const std::shared_ptr<Sandbox>& sandbox,
                        const std::string& code,
                        std::chrono::milliseconds timeout,
                        const CancelToken& cancel);

    // Tear down a sandbox. Releasing twice is a no-op.
    void release(const std::shared_ptr<Sandbox>& sandbox);

    // Get sandbox by id
    std::shared_ptr<Sandbox> get_sandbox(const std::string& id) const;

    // Statistics
    size_t active_count() const;
    uint64_t acquired_total() const { return acquired_total_; }

    // Release all sandboxes
    void cleanup_all();

private:
    std::unordered_map<std::string, std::shared_ptr<Sandbox>> sandboxes_;
    mutable std::mutex mutex_;
    std::atomic<uint64_t> acquired_total_{0};
    std::string cgroup_root_;

    bool init_cgroup_root();
};

} // namespace codeloop::runtime

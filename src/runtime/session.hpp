/**
 * codeloop Execution Sessions
 *
 * A session is the continuity scope of a caller-chosen session id. It
 * serializes executions and may keep one warm sandbox across calls.
 * Idle sessions are reaped by a background thread.
 */
#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>
#include <unordered_map>
#include "runtime/sandbox.hpp"
#include "runtime/language_registry.hpp"
#include "runtime/cancellation.hpp"

namespace codeloop::runtime {

// Host-side settings applied to every sandbox a session acquires
struct SessionOptions {
    std::string workspace_root = "/tmp/codeloop";
    unsigned workspace_mode = 0700;
    std::string image_root = "/var/lib/codeloop/images";
    int run_as_uid = 1000;
    int run_as_gid = 1000;
    bool enable_sandboxing = true;         // Namespaces and cgroups
    std::chrono::milliseconds idle_timeout{300000};
    std::chrono::milliseconds reap_interval{30000};
};

struct Session {
    std::string id;
    std::chrono::steady_clock::time_point last_activity;

    // Held for the duration of one execution
    std::mutex exec_mutex;

    // Warm sandbox. Touched under exec_mutex while in_flight > 0, or
    // under the manager lock once in_flight drops to 0.
    std::shared_ptr<Sandbox> sandbox;

    // Guarded by the manager lock
    uint64_t steps = 0;
    int in_flight = 0;
    bool closing = false;
};

class SessionManager {
public:
    SessionManager(SandboxManager& sandboxes, const SessionOptions& options);
    ~SessionManager();

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Run code for a session, creating the session on first use
    ExecutionResult execute(const std::string& session_id,
                            const LanguageAdapter& adapter,
                            const std::string& code,
                            std::chrono::milliseconds timeout,
                            const CancelToken& cancel);

    // Release the session's sandbox and forget it. Deferred while an
    // execution is in flight. Returns false for unknown sessions.
    bool close(const std::string& session_id);

    // Drop sessions idle longer than the idle timeout. Returns the count.
    size_t reap_idle();

    void start_reaper();
    void stop_reaper();

    // Close every session (shutdown)
    void close_all();

    size_t session_count() const;
    bool has_session(const std::string& session_id) const;
    uint64_t step_count(const std::string& session_id) const;

    const SessionOptions& options() const { return options_; }
    SandboxConfig make_sandbox_config(const LanguageAdapter& adapter) const;

private:
    SandboxManager& sandboxes_;
    SessionOptions options_;

    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    mutable std::mutex mutex_;

    // Reaper thread
    std::thread reaper_thread_;
    std::condition_variable reaper_cv_;
    std::mutex reaper_mutex_;
    std::atomic<bool> reaper_running_{false};

    ExecutionResult execute_locked(Session& session,
                                   const LanguageAdapter& adapter,
                                   const std::string& code,
                                   std::chrono::milliseconds timeout,
                                   const CancelToken& cancel);

    void reaper_loop();
};

} // namespace codeloop::runtime

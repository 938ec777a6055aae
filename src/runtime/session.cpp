#include "runtime/session.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace codeloop::runtime {

SessionManager::SessionManager(SandboxManager& sandboxes, const SessionOptions& options)
    : sandboxes_(sandboxes)
    , options_(options) {
}

SessionManager::~SessionManager() {
    stop_reaper();
    close_all();
}

SandboxConfig SessionManager::make_sandbox_config(const LanguageAdapter& adapter) const {
    SandboxConfig config;
    config.language = adapter.name;
    config.image = adapter.image;
    config.image_root = options_.image_root;
    config.workspace_root = options_.workspace_root;
    config.workspace_mode = options_.workspace_mode;
    config.command = adapter.command;
    config.file_suffix = adapter.file_suffix;
    config.limits = adapter.limits;
    config.run_as_uid = options_.run_as_uid;
    config.run_as_gid = options_.run_as_gid;
    config.enable_network = adapter.enable_network;

    if (!options_.enable_sandboxing) {
        config.enable_pid_namespace = false;
        config.enable_mount_namespace = false;
        config.enable_uts_namespace = false;
        config.enable_ipc_namespace = false;
        config.enable_network = true;
        config.enable_cgroups = false;
    }
    return config;
}

ExecutionResult SessionManager::execute(const std::string& session_id,
                                        const LanguageAdapter& adapter,
                                        const std::string& code,
                                        std::chrono::milliseconds timeout,
                                        const CancelToken& cancel) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = sessions_[session_id];
        if (!entry) {
            entry = std::make_shared<Session>();
            entry->id = session_id;
            entry->last_activity = std::chrono::steady_clock::now();
            spdlog::debug("Session {} created", session_id);
        }
        session = entry;
        session->in_flight++;
    }

    ExecutionResult result;
    {
        std::lock_guard<std::mutex> exec_lock(session->exec_mutex);
        result = execute_locked(*session, adapter, code, timeout, cancel);
    }

    std::shared_ptr<Sandbox> to_release;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session->in_flight--;
        session->steps++;
        session->last_activity = std::chrono::steady_clock::now();

        if (session->closing && session->in_flight == 0) {
            to_release = std::move(session->sandbox);
            auto it = sessions_.find(session_id);
            if (it != sessions_.end() && it->second == session) {
                sessions_.erase(it);
            }
            spdlog::debug("Session {} closed after in-flight execution", session_id);
        }
    }
    if (to_release) {
        sandboxes_.release(to_release);
    }

    return result;
}

ExecutionResult SessionManager::execute_locked(Session& session,
                                               const LanguageAdapter& adapter,
                                               const std::string& code,
                                               std::chrono::milliseconds timeout,
                                               const CancelToken& cancel) {
    if (cancel.cancelled()) {
        return ExecutionResult::failure(ExecOutcome::CANCELLED, "cancelled before start");
    }

    // A session never holds two sandboxes: drop a warm one that does not fit
    if (session.sandbox &&
        (!adapter.reuse_workspace ||
         session.sandbox->config().language != adapter.name ||
         session.sandbox->is_terminated())) {
        spdlog::debug("Session {} dropping warm sandbox {}", session.id, session.sandbox->id());
        sandboxes_.release(session.sandbox);
        session.sandbox.reset();
    }

    std::shared_ptr<Sandbox> sandbox = session.sandbox;
    if (!sandbox) {
        std::string error;
        sandbox = sandboxes_.acquire(make_sandbox_config(adapter), error);
        if (!sandbox) {
            return ExecutionResult::failure(ExecOutcome::PROVISIONING_ERROR, error);
        }
        if (adapter.reuse_workspace) {
            session.sandbox = sandbox;
        }
    }

    ExecutionResult result = sandboxes_.run(sandbox, code, timeout, cancel);

    if (!adapter.reuse_workspace) {
        sandboxes_.release(sandbox);
    }

    return result;
}

bool SessionManager::close(const std::string& session_id) {
    std::shared_ptr<Sandbox> to_release;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }

        auto session = it->second;
        if (session->in_flight > 0) {
            session->closing = true;
            spdlog::debug("Session {} close deferred ({} in flight)", session_id, session->in_flight);
            return true;
        }

        to_release = std::move(session->sandbox);
        sessions_.erase(it);
    }

    if (to_release) {
        sandboxes_.release(to_release);
    }
    spdlog::debug("Session {} closed", session_id);
    return true;
}

size_t SessionManager::reap_idle() {
    std::vector<std::shared_ptr<Sandbox>> to_release;
    size_t reaped = 0;
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            auto& session = it->second;
            if (session->in_flight == 0 && now - session->last_activity >= options_.idle_timeout) {
                spdlog::info("Reaping idle session {}", session->id);
                if (session->sandbox) {
                    to_release.push_back(std::move(session->sandbox));
                }
                it = sessions_.erase(it);
                reaped++;
            } else {
                ++it;
            }
        }
    }

    for (auto& sandbox : to_release) {
        sandboxes_.release(sandbox);
    }
    return reaped;
}

void SessionManager::start_reaper() {
    if (reaper_running_.exchange(true)) {
        return;
    }
    reaper_thread_ = std::thread(&SessionManager::reaper_loop, this);
    spdlog::debug("Session reaper started (interval={}ms, idle={}ms)",
        options_.reap_interval.count(), options_.idle_timeout.count());
}

void SessionManager::stop_reaper() {
    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        if (!reaper_running_.exchange(false)) {
            return;
        }
    }
    reaper_cv_.notify_all();
    if (reaper_thread_.joinable()) {
        reaper_thread_.join();
    }
    spdlog::debug("Session reaper stopped");
}

void SessionManager::reaper_loop() {
    std::unique_lock<std::mutex> lock(reaper_mutex_);
    while (reaper_running_) {
        reaper_cv_.wait_for(lock, options_.reap_interval, [this] { return !reaper_running_; });
        if (!reaper_running_) {
            break;
        }
        lock.unlock();
        reap_idle();
        lock.lock();
    }
}

void SessionManager::close_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            ids.push_back(id);
        }
    }
    for (const auto& id : ids) {
        close(id);
    }
}

size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool SessionManager::has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

uint64_t SessionManager::step_count(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return 0;
    }
    return it->second->steps;
}

} // namespace codeloop::runtime

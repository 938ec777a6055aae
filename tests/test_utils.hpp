#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <thread>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <unistd.h>
#include "runtime/execution_service.hpp"
#include "runtime/language_registry.hpp"
#include "runtime/session.hpp"
#include "workflow/fix_generator.hpp"

namespace codeloop::test {

// Scratch directory shared by the tests of one process; removed at exit
std::string test_root();

// Shell adapter that runs against the host root filesystem
inline runtime::LanguageAdapter host_shell_adapter(bool reuse_workspace = false) {
    runtime::LanguageAdapter adapter;
    adapter.name = "bash";
    adapter.image = runtime::HOST_IMAGE;
    adapter.command = {"/bin/sh", "{file}"};
    adapter.file_suffix = ".sh";
    adapter.aliases = {"sh", "shell"};
    adapter.reuse_workspace = reuse_workspace;
    return adapter;
}

inline runtime::SessionOptions test_session_options() {
    runtime::SessionOptions options;
    options.workspace_root = test_root() + "/work";
    options.image_root = test_root() + "/images";
    options.enable_sandboxing = false;
    return options;
}

inline runtime::SandboxConfig host_sandbox_config() {
    runtime::SandboxConfig config;
    config.language = "bash";
    config.image = runtime::HOST_IMAGE;
    config.workspace_root = test_root() + "/work";
    config.image_root = test_root() + "/images";
    config.command = {"/bin/sh", "{file}"};
    config.file_suffix = ".sh";
    config.enable_pid_namespace = false;
    config.enable_mount_namespace = false;
    config.enable_uts_namespace = false;
    config.enable_ipc_namespace = false;
    config.enable_network = true;
    config.enable_cgroups = false;
    return config;
}

inline bool has_program(const std::string& name) {
    for (const char* dir : {"/usr/local/bin", "/usr/bin", "/bin"}) {
        if (access((std::string(dir) + "/" + name).c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

inline runtime::ExecutionResult exited(int exit_code, const std::string& out = "", const std::string& err = "") {
    runtime::ExecutionResult result;
    result.outcome = runtime::ExecOutcome::EXITED;
    result.exit_code = exit_code;
    result.stdout_text = out;
    result.stderr_text = err;
    return result;
}

// Executor that replays canned results and records what it was asked
class ScriptedExecutor : public runtime::CodeExecutor {
public:
    explicit ScriptedExecutor(std::vector<runtime::ExecutionResult> results)
        : results_(results.begin(), results.end()) {}

    // Block until cancelled instead of answering
    void block_until_cancelled(bool block) { block_ = block; }

    runtime::ExecutionResult execute(const runtime::ExecutionRequest& request,
                                     const runtime::CancelToken& cancel) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        if (block_) {
            while (!cancel.cancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return runtime::ExecutionResult::failure(runtime::ExecOutcome::CANCELLED, "execution cancelled");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (results_.empty()) {
            return exited(1, "", "no scripted result left");
        }
        runtime::ExecutionResult result = results_.front();
        if (results_.size() > 1) {
            results_.pop_front();
        }
        return result;
    }

    std::vector<runtime::ExecutionRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    std::deque<runtime::ExecutionResult> results_;   // Last one repeats
    std::vector<runtime::ExecutionRequest> requests_;
    bool block_ = false;
    mutable std::mutex mutex_;
};

// Fix generator that replays canned proposals
class ScriptedFixer : public workflow::FixGenerator {
public:
    explicit ScriptedFixer(std::vector<workflow::FixProposal> proposals, bool throws = false)
        : proposals_(proposals.begin(), proposals.end()), throws_(throws) {}

    workflow::FixProposal propose_fix(const workflow::FixRequest& request,
                                      const runtime::CancelToken&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (throws_) {
            throw std::runtime_error("fixer backend unreachable");
        }
        if (proposals_.empty()) {
            return workflow::FixProposal::none("no scripted proposal left");
        }
        workflow::FixProposal proposal = proposals_.front();
        if (proposals_.size() > 1) {
            proposals_.pop_front();
        }
        return proposal;
    }

    const char* name() const override { return "scripted"; }

    std::vector<workflow::FixRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    std::deque<workflow::FixProposal> proposals_;     // Last one repeats
    std::vector<workflow::FixRequest> requests_;
    bool throws_;
    mutable std::mutex mutex_;
};

} // namespace codeloop::test

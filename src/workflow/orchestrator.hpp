/**
 * codeloop Workflow Orchestrator
 *
 * Drives execute -> evaluate -> request fix -> re-execute until the code
 * exits 0, the fix generator gives up, the retry budget is spent or the
 * workflow is cancelled. Each submitted workflow runs on its own thread
 * and reports every transition on its event stream.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <thread>
#include <condition_variable>
#include <unordered_map>
#include "runtime/execution_service.hpp"
#include "runtime/cancellation.hpp"
#include "workflow/workflow.hpp"
#include "workflow/event_stream.hpp"
#include "workflow/fix_generator.hpp"

namespace codeloop::workflow {

struct OrchestratorConfig {
    uint32_t retry_budget = 3;                   // Max fix-request steps
    bool retry_on_provisioning_error = false;
    size_t max_retained_workflows = 256;         // Finished workflows kept for get/wait
};

class WorkflowOrchestrator {
public:
    WorkflowOrchestrator(runtime::CodeExecutor& executor,
                         FixGenerator& fixer,
                         const OrchestratorConfig& config = {});
    ~WorkflowOrchestrator();

    // Non-copyable
    WorkflowOrchestrator(const WorkflowOrchestrator&) = delete;
    WorkflowOrchestrator& operator=(const WorkflowOrchestrator&) = delete;

    // Start a workflow on its own thread. The returned snapshot carries
    // the id and the event stream.
    Workflow submit(const runtime::ExecutionRequest& request);

    // Run a workflow on the calling thread until it is terminal
    Workflow run(const runtime::ExecutionRequest& request);

    // Returns false for unknown or already finished workflows
    bool cancel(const std::string& workflow_id);

    std::optional<Workflow> get(const std::string& workflow_id) const;

    // Block until the workflow is terminal (or the timeout passes when
    // one is given). Returns the latest snapshot.
    std::optional<Workflow> wait(const std::string& workflow_id,
                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    std::vector<std::string> workflow_ids() const;

    // Workflow threads not yet joined
    size_t thread_count() const;

    // Join the threads of finished workflows and forget the oldest
    // finished ones beyond max_retained_workflows. Runs on every
    // submit and run. Returns the number of workflows forgotten.
    size_t reap_finished();

    // Cancel every running workflow and join their threads
    void shutdown();

    const OrchestratorConfig& config() const { return config_; }

private:
    struct WorkflowRecord {
        std::string id;
        uint64_t serial = 0;
        runtime::ExecutionRequest request;
        std::shared_ptr<WorkflowEventStream> events;
        runtime::CancelToken cancel;
        std::chrono::system_clock::time_point started_at;

        mutable std::mutex mutex;
        mutable std::condition_variable done_cv;
        std::vector<Step> steps;
        std::optional<WorkflowStatus> status;
        std::optional<std::chrono::system_clock::time_point> finished_at;

        std::thread thread;
    };

    runtime::CodeExecutor& executor_;
    FixGenerator& fixer_;
    OrchestratorConfig config_;

    // Thread handles are only touched under mutex_
    std::unordered_map<std::string, std::shared_ptr<WorkflowRecord>> workflows_;
    mutable std::mutex mutex_;
    std::mutex join_mutex_;
    std::atomic<bool> accepting_{true};

    std::shared_ptr<WorkflowRecord> create_record(const runtime::ExecutionRequest& request) const;
    std::shared_ptr<WorkflowRecord> find(const std::string& workflow_id) const;

    void drive(WorkflowRecord& record);

    // Terminal record for a workflow that could not be started
    void fail_to_start(WorkflowRecord& record, const std::string& error);

    // Store the step and emit its event
    void record_step(WorkflowRecord& record, const Step& step);

    // Emit the terminal event, close the stream and wake waiters
    void finish(WorkflowRecord& record, const Step& step, WorkflowStatus status,
                const std::string& error);

    static Workflow snapshot(const WorkflowRecord& record);
    static WorkflowEvent make_event(const Step& step);
};

} // namespace codeloop::workflow

#include "workflow/orchestrator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <system_error>
#include <tuple>

namespace codeloop::workflow {

using runtime::ExecOutcome;
using runtime::ExecutionResult;

static std::atomic<uint64_t> g_next_workflow_id{1};

static std::string describe_failure(const ExecutionResult& result) {
    if (result.outcome == ExecOutcome::EXITED) {
        return fmt::format("exit code {}", result.exit_code);
    }
    if (!result.error.empty()) {
        return result.error;
    }
    return runtime::exec_outcome_to_string(result.outcome);
}

static bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

WorkflowOrchestrator::WorkflowOrchestrator(runtime::CodeExecutor& executor,
                                           FixGenerator& fixer,
                                           const OrchestratorConfig& config)
    : executor_(executor)
    , fixer_(fixer)
    , config_(config) {
    spdlog::debug("Workflow orchestrator ready (retry_budget={}, fixer={})",
        config_.retry_budget, fixer_.name());
}

WorkflowOrchestrator::~WorkflowOrchestrator() {
    shutdown();
}

// ============================================================================
// Public API
// ============================================================================

Workflow WorkflowOrchestrator::submit(const runtime::ExecutionRequest& request) {
    reap_finished();

    auto record = create_record(request);
    std::string start_error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            record->cancel.cancel();
        }
        workflows_[record->id] = record;
        try {
            record->thread = std::thread([this, record] { drive(*record); });
        } catch (const std::system_error& e) {
            start_error = e.what();
        }
    }
    if (!start_error.empty()) {
        fail_to_start(*record, fmt::format("cannot start workflow thread: {}", start_error));
    }
    return snapshot(*record);
}

Workflow WorkflowOrchestrator::run(const runtime::ExecutionRequest& request) {
    reap_finished();

    auto record = create_record(request);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            record->cancel.cancel();
        }
        workflows_[record->id] = record;
    }
    drive(*record);
    return snapshot(*record);
}

bool WorkflowOrchestrator::cancel(const std::string& workflow_id) {
    auto record = find(workflow_id);
    if (!record) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        if (record->status) {
            return false;
        }
    }
    spdlog::info("Cancelling workflow {}", workflow_id);
    record->cancel.cancel();
    return true;
}

std::optional<Workflow> WorkflowOrchestrator::get(const std::string& workflow_id) const {
    auto record = find(workflow_id);
    if (!record) {
        return std::nullopt;
    }
    return snapshot(*record);
}

std::optional<Workflow> WorkflowOrchestrator::wait(const std::string& workflow_id,
                                                   std::optional<std::chrono::milliseconds> timeout) const {
    auto record = find(workflow_id);
    if (!record) {
        return std::nullopt;
    }
    {
        std::unique_lock<std::mutex> lock(record->mutex);
        auto done = [&] { return record->status.has_value(); };
        if (timeout) {
            record->done_cv.wait_for(lock, *timeout, done);
        } else {
            record->done_cv.wait(lock, done);
        }
    }
    return snapshot(*record);
}

std::vector<std::string> WorkflowOrchestrator::workflow_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(workflows_.size());
    for (const auto& [id, record] : workflows_) {
        ids.push_back(id);
    }
    return ids;
}

size_t WorkflowOrchestrator::thread_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, record] : workflows_) {
        if (record->thread.joinable()) {
            count++;
        }
    }
    return count;
}

size_t WorkflowOrchestrator::reap_finished() {
    using FinishedRecord = std::tuple<std::chrono::system_clock::time_point, uint64_t, std::string>;

    std::vector<std::thread> threads;
    std::vector<FinishedRecord> finished;
    size_t evicted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, record] : workflows_) {
            std::optional<std::chrono::system_clock::time_point> finished_at;
            {
                std::lock_guard<std::mutex> record_lock(record->mutex);
                if (record->status) {
                    finished_at = record->finished_at;
                }
            }
            if (!finished_at) {
                continue;
            }
            if (record->thread.joinable()) {
                threads.push_back(std::move(record->thread));
            }
            finished.emplace_back(*finished_at, record->serial, id);
        }

        if (finished.size() > config_.max_retained_workflows) {
            // Oldest first
            std::sort(finished.begin(), finished.end());
            evicted = finished.size() - config_.max_retained_workflows;
            for (size_t i = 0; i < evicted; i++) {
                workflows_.erase(std::get<2>(finished[i]));
            }
        }
    }

    // A finished workflow's thread is at most logging its summary
    for (auto& thread : threads) {
        thread.join();
    }

    if (evicted > 0) {
        spdlog::debug("Forgot {} finished workflow(s)", evicted);
    }
    return evicted;
}

void WorkflowOrchestrator::shutdown() {
    std::lock_guard<std::mutex> join_lock(join_mutex_);
    accepting_ = false;

    std::vector<std::shared_ptr<WorkflowRecord>> records;
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, record] : workflows_) {
            records.push_back(record);
            if (record->thread.joinable()) {
                threads.push_back(std::move(record->thread));
            }
        }
    }

    for (auto& record : records) {
        record->cancel.cancel();
    }
    for (auto& thread : threads) {
        thread.join();
    }
}

// ============================================================================
// Workflow driver
// ============================================================================

std::shared_ptr<WorkflowOrchestrator::WorkflowRecord>
WorkflowOrchestrator::create_record(const runtime::ExecutionRequest& request) const {
    auto record = std::make_shared<WorkflowRecord>();
    record->serial = g_next_workflow_id++;
    record->id = fmt::format("wf-{}", record->serial);
    record->request = request;
    record->events = std::make_shared<WorkflowEventStream>(record->id);
    record->started_at = std::chrono::system_clock::now();
    return record;
}

std::shared_ptr<WorkflowOrchestrator::WorkflowRecord>
WorkflowOrchestrator::find(const std::string& workflow_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workflows_.find(workflow_id);
    if (it == workflows_.end()) {
        return nullptr;
    }
    return it->second;
}

void WorkflowOrchestrator::drive(WorkflowRecord& record) {
    const runtime::ExecutionRequest& request = record.request;
    spdlog::info("Workflow {} started (language={}, session={}, budget={})",
        record.id, request.language, request.session_id, config_.retry_budget);

    WorkflowEvent start;
    start.type = EVENT_TYPE_START;
    start.language = request.language;
    start.detail = {
        {"session_id", request.session_id},
        {"retry_budget", config_.retry_budget},
    };
    record.events->append(start);

    Step step;
    step.number = 1;
    step.language = request.language;
    step.code = request.code;
    uint32_t fix_requests = 0;

    while (true) {
        step.kind = StepKind::EXECUTE;
        step.result.reset();
        step.error.clear();

        if (record.cancel.cancelled()) {
            step.status = WorkflowStatus::CANCELLED;
            finish(record, step, WorkflowStatus::CANCELLED, "workflow cancelled");
            return;
        }

        step.status = WorkflowStatus::EXECUTING;
        record_step(record, step);

        runtime::ExecutionRequest exec_request = request;
        exec_request.code = step.code;

        ExecutionResult result;
        try {
            result = executor_.execute(exec_request, record.cancel);
        } catch (const std::exception& e) {
            spdlog::error("Workflow {} step {}: executor failed: {}", record.id, step.number, e.what());
            result = ExecutionResult::failure(ExecOutcome::INTERNAL_ERROR,
                fmt::format("executor error: {}", e.what()));
        }
        step.result = result;

        if (result.succeeded()) {
            step.status = WorkflowStatus::COMPLETED;
            finish(record, step, WorkflowStatus::COMPLETED, "");
            return;
        }

        if (result.outcome == ExecOutcome::CANCELLED || record.cancel.cancelled()) {
            step.status = WorkflowStatus::CANCELLED;
            finish(record, step, WorkflowStatus::CANCELLED, "workflow cancelled");
            return;
        }

        step.status = WorkflowStatus::FAILED;
        step.error = describe_failure(result);
        record_step(record, step);

        // Failures no code change can repair
        if (result.outcome == ExecOutcome::NOT_SUPPORTED ||
            result.outcome == ExecOutcome::INTERNAL_ERROR ||
            (result.outcome == ExecOutcome::PROVISIONING_ERROR && !config_.retry_on_provisioning_error)) {
            finish(record, step, WorkflowStatus::NO_FIX, step.error);
            return;
        }

        if (fix_requests >= config_.retry_budget) {
            finish(record, step, WorkflowStatus::EXHAUSTED,
                fmt::format("retry budget of {} exhausted", config_.retry_budget));
            return;
        }
        fix_requests++;

        Step fix;
        fix.number = step.number + 1;
        fix.kind = StepKind::FIX_REQUEST;
        fix.language = request.language;
        fix.status = WorkflowStatus::FIX_REQUEST;
        record_step(record, fix);

        FixRequest fix_request;
        fix_request.code = step.code;
        fix_request.language = request.language;
        fix_request.stdout_text = result.stdout_text;
        fix_request.stderr_text = result.stderr_text;
        fix_request.exit_code = result.exit_code;
        fix_request.outcome = runtime::exec_outcome_to_string(result.outcome);
        fix_request.attempt = fix.number;

        FixProposal proposal;
        try {
            proposal = fixer_.propose_fix(fix_request, record.cancel);
        } catch (const std::exception& e) {
            spdlog::error("Workflow {} step {}: fix generator failed: {}", record.id, fix.number, e.what());
            proposal = FixProposal::none(fmt::format("fix generator error: {}", e.what()));
        }

        if (record.cancel.cancelled()) {
            fix.status = WorkflowStatus::CANCELLED;
            finish(record, fix, WorkflowStatus::CANCELLED, "workflow cancelled");
            return;
        }

        if (!proposal.has_fix || is_blank(proposal.code)) {
            fix.status = WorkflowStatus::NO_FIX;
            fix.error = proposal.error.empty() ? "no fix proposed" : proposal.error;
            finish(record, fix, WorkflowStatus::NO_FIX, fix.error);
            return;
        }

        step = fix;
        step.code = proposal.code;
    }
}

void WorkflowOrchestrator::fail_to_start(WorkflowRecord& record, const std::string& error) {
    spdlog::error("Workflow {}: {}", record.id, error);

    Step step;
    step.number = 1;
    step.language = record.request.language;
    step.code = record.request.code;
    step.status = WorkflowStatus::NO_FIX;
    step.error = error;
    finish(record, step, WorkflowStatus::NO_FIX, error);
}

void WorkflowOrchestrator::record_step(WorkflowRecord& record, const Step& step) {
    {
        std::lock_guard<std::mutex> lock(record.mutex);
        if (!record.steps.empty() && record.steps.back().number == step.number) {
            record.steps.back() = step;
        } else {
            record.steps.push_back(step);
        }
    }

    spdlog::debug("Workflow {} step {} ({}): {}", record.id, step.number,
        step_kind_to_string(step.kind), workflow_status_to_string(step.status));
    record.events->append(make_event(step));
}

void WorkflowOrchestrator::finish(WorkflowRecord& record, const Step& step,
                                  WorkflowStatus status, const std::string& error) {
    WorkflowEvent event = make_event(step);
    event.status = status;
    if (!error.empty()) {
        event.error = error;
    }

    {
        std::lock_guard<std::mutex> lock(record.mutex);
        if (!record.steps.empty() && record.steps.back().number == step.number) {
            record.steps.back() = step;
        } else {
            record.steps.push_back(step);
        }
    }

    record.events->append(event);
    record.events->close();

    {
        std::lock_guard<std::mutex> lock(record.mutex);
        record.status = status;
        record.finished_at = std::chrono::system_clock::now();
    }
    record.done_cv.notify_all();

    spdlog::info("Workflow {} finished: {} after {} step(s)",
        record.id, workflow_status_to_string(status), step.number);
}

WorkflowEvent WorkflowOrchestrator::make_event(const Step& step) {
    WorkflowEvent event;
    event.type = EVENT_TYPE_WORKFLOW;
    event.status = step.status;
    event.step = step.number;
    event.kind = step.kind;
    event.language = step.language;
    if (step.result && step.status != WorkflowStatus::EXECUTING) {
        event.result = step.result;
    }
    event.error = step.error;
    return event;
}

Workflow WorkflowOrchestrator::snapshot(const WorkflowRecord& record) {
    Workflow workflow;
    workflow.id = record.id;
    workflow.request = record.request;
    workflow.events = record.events;
    workflow.started_at = record.started_at;

    std::lock_guard<std::mutex> lock(record.mutex);
    workflow.steps = record.steps;
    workflow.status = record.status;
    workflow.finished_at = record.finished_at;
    return workflow;
}

} // namespace codeloop::workflow

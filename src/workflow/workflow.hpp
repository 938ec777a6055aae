/**
 * codeloop Workflow model
 *
 * A workflow is one execute / fix / re-execute attempt made of numbered
 * steps. Step N is attempt N: step 1 executes the submitted code, every
 * later step starts as a fix request and becomes an execute step once a
 * fix is returned.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "runtime/sandbox.hpp"
#include "runtime/execution_service.hpp"

namespace codeloop::workflow {

class WorkflowEventStream;

enum class WorkflowStatus {
    EXECUTING,
    COMPLETED,
    FAILED,
    FIX_REQUEST,
    NO_FIX,
    EXHAUSTED,
    CANCELLED
};

const char* workflow_status_to_string(WorkflowStatus status);

// Statuses that end a workflow
bool is_terminal(WorkflowStatus status);

enum class StepKind {
    EXECUTE,
    FIX_REQUEST
};

const char* step_kind_to_string(StepKind kind);

struct Step {
    uint32_t number = 0;
    StepKind kind = StepKind::EXECUTE;
    std::string language;
    WorkflowStatus status = WorkflowStatus::EXECUTING;
    std::string code;                                  // Code executed (or to be executed)
    std::optional<runtime::ExecutionResult> result;
    std::string error;

    nlohmann::json to_json() const;
};

// Point-in-time view of a workflow
struct Workflow {
    std::string id;
    runtime::ExecutionRequest request;
    std::vector<Step> steps;
    std::optional<WorkflowStatus> status;              // Set once terminal
    std::chrono::system_clock::time_point started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
    std::shared_ptr<WorkflowEventStream> events;

    bool is_finished() const { return status.has_value(); }

    nlohmann::json to_json() const;
};

// JSON view of a result as carried by workflow events
nlohmann::json result_to_json(const runtime::ExecutionResult& result);

// ISO 8601 UTC with milliseconds
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace codeloop::workflow

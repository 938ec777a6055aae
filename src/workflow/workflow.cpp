#include "workflow/workflow.hpp"
#include <iomanip>
#include <sstream>
#include <ctime>

using json = nlohmann::json;

namespace codeloop::workflow {

const char* workflow_status_to_string(WorkflowStatus status) {
    switch (status) {
        case WorkflowStatus::EXECUTING:   return "executing";
        case WorkflowStatus::COMPLETED:   return "completed";
        case WorkflowStatus::FAILED:      return "failed";
        case WorkflowStatus::FIX_REQUEST: return "fix_request";
        case WorkflowStatus::NO_FIX:      return "no_fix";
        case WorkflowStatus::EXHAUSTED:   return "exhausted";
        case WorkflowStatus::CANCELLED:   return "cancelled";
        default: return "unknown";
    }
}

bool is_terminal(WorkflowStatus status) {
    return status == WorkflowStatus::COMPLETED ||
           status == WorkflowStatus::NO_FIX ||
           status == WorkflowStatus::EXHAUSTED ||
           status == WorkflowStatus::CANCELLED;
}

const char* step_kind_to_string(StepKind kind) {
    switch (kind) {
        case StepKind::EXECUTE:     return "execute";
        case StepKind::FIX_REQUEST: return "fix_request";
        default: return "unknown";
    }
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

json result_to_json(const runtime::ExecutionResult& result) {
    json j;
    j["stdout"] = result.stdout_text;
    j["stderr"] = result.stderr_text;
    j["exit_code"] = result.exit_code;
    j["outcome"] = runtime::exec_outcome_to_string(result.outcome);
    j["duration_ms"] = result.duration_ms;
    return j;
}

json Step::to_json() const {
    json j;
    j["step"] = number;
    j["kind"] = step_kind_to_string(kind);
    j["language"] = language;
    j["status"] = workflow_status_to_string(status);
    j["code"] = code;
    if (result) {
        j["result"] = result_to_json(*result);
    }
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

json Workflow::to_json() const {
    json j;
    j["workflow_id"] = id;
    j["language"] = request.language;
    j["session_id"] = request.session_id;
    j["status"] = status ? workflow_status_to_string(*status) : "running";
    j["started_at"] = format_timestamp(started_at);
    if (finished_at) {
        j["finished_at"] = format_timestamp(*finished_at);
    }
    j["steps"] = json::array();
    for (const auto& step : steps) {
        j["steps"].push_back(step.to_json());
    }
    return j;
}

} // namespace codeloop::workflow

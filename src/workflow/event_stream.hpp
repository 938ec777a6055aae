/**
 * codeloop Workflow Event Stream
 *
 * Append-only, ordered log of one workflow's transitions. Consumers pull
 * by sequence number (optionally blocking) or subscribe for push
 * delivery. The stream is closed after the terminal event.
 *
 * Subscriber callbacks run on whichever thread is dispatching, normally
 * the workflow thread inside append(). A slow callback delays the
 * workflow; consumers that must not do so should poll with wait_for().
 * Callbacks may append, subscribe or unsubscribe on the same stream.
 * Nested calls queue their deliveries behind the one in progress.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <map>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "workflow/workflow.hpp"

namespace codeloop::workflow {

constexpr const char* EVENT_TYPE_START = "start";
constexpr const char* EVENT_TYPE_WORKFLOW = "workflow";

struct WorkflowEvent {
    uint64_t sequence = 0;                       // Assigned on append, from 1
    std::string type = EVENT_TYPE_WORKFLOW;
    std::string workflow_id;
    std::chrono::system_clock::time_point timestamp;
    WorkflowStatus status = WorkflowStatus::EXECUTING;
    uint32_t step = 0;
    std::optional<StepKind> kind;
    std::string language;
    std::optional<runtime::ExecutionResult> result;
    std::string error;
    nlohmann::json detail;                       // Extra payload (start entry)

    nlohmann::json to_json() const;
};

class WorkflowEventStream {
public:
    using Callback = std::function<void(const WorkflowEvent&)>;

    explicit WorkflowEventStream(std::string workflow_id);

    // Non-copyable
    WorkflowEventStream(const WorkflowEventStream&) = delete;
    WorkflowEventStream& operator=(const WorkflowEventStream&) = delete;

    // Assigns sequence and timestamp. Returns false once closed.
    bool append(WorkflowEvent event);

    // Entries with sequence > since
    std::vector<WorkflowEvent> entries(uint64_t since = 0, size_t limit = 100) const;

    // Last n entries
    std::vector<WorkflowEvent> tail(size_t n) const;

    // Block until an entry with sequence > since exists, the stream is
    // closed, or the timeout passes. Returns the available entries.
    std::vector<WorkflowEvent> wait_for(uint64_t since, std::chrono::milliseconds timeout) const;

    // Replays existing entries to the callback, then delivers every new
    // one in order, each exactly once. When another thread is already
    // dispatching, the replay happens on that thread and this returns
    // early. Returns a subscription id.
    uint64_t subscribe(Callback callback);
    bool unsubscribe(uint64_t id);

    void close();
    bool is_closed() const;

    size_t size() const;
    uint64_t last_sequence() const;
    const std::string& workflow_id() const { return workflow_id_; }

    // One JSON object per line
    std::string export_jsonl() const;

private:
    std::string workflow_id_;
    std::vector<WorkflowEvent> entries_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;

    struct Subscriber {
        Callback callback;
        uint64_t delivered = 0;                  // Last sequence handed over
    };

    // Guarded by mutex_. At most one thread dispatches at a time.
    std::map<uint64_t, Subscriber> subscribers_;
    uint64_t next_subscriber_id_ = 1;
    bool dispatching_ = false;

    void dispatch();
    void deliver(const Callback& callback, const WorkflowEvent& event);
};

} // namespace codeloop::workflow

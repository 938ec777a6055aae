#include "workflow/event_stream.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace codeloop::workflow {

// ============================================================================
// WorkflowEvent Implementation
// ============================================================================

json WorkflowEvent::to_json() const {
    json j;
    j["type"] = type;
    j["sequence"] = sequence;
    j["workflow_id"] = workflow_id;
    j["timestamp"] = format_timestamp(timestamp);
    j["step"] = step;

    if (type == EVENT_TYPE_WORKFLOW) {
        j["status"] = workflow_status_to_string(status);
    }
    if (kind) {
        j["kind"] = step_kind_to_string(*kind);
    }
    if (!language.empty()) {
        j["language"] = language;
    }
    if (result) {
        j["result"] = result_to_json(*result);
    }
    if (!error.empty()) {
        j["error"] = error;
    }
    if (detail.is_object()) {
        for (auto it = detail.begin(); it != detail.end(); ++it) {
            if (!j.contains(it.key())) {
                j[it.key()] = it.value();
            }
        }
    }
    return j;
}

// ============================================================================
// WorkflowEventStream Implementation
// ============================================================================

WorkflowEventStream::WorkflowEventStream(std::string workflow_id)
    : workflow_id_(std::move(workflow_id)) {
}

bool WorkflowEventStream::append(WorkflowEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            spdlog::warn("Workflow {}: dropping event appended after close", workflow_id_);
            return false;
        }

        event.sequence = entries_.size() + 1;
        event.workflow_id = workflow_id_;
        event.timestamp = std::chrono::system_clock::now();
        entries_.push_back(event);
    }
    cv_.notify_all();

    spdlog::trace("Workflow {} event seq={} type={} status={} step={}",
        workflow_id_, event.sequence, event.type,
        workflow_status_to_string(event.status), event.step);

    dispatch();
    return true;
}

void WorkflowEventStream::dispatch() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (dispatching_) {
            return;
        }
        dispatching_ = true;
    }

    while (true) {
        Callback callback;
        WorkflowEvent event;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            // Lowest pending sequence first, ties in subscription order
            Subscriber* next = nullptr;
            for (auto& [id, subscriber] : subscribers_) {
                if (subscriber.delivered < entries_.size() &&
                    (!next || subscriber.delivered < next->delivered)) {
                    next = &subscriber;
                }
            }
            if (!next) {
                dispatching_ = false;
                return;
            }
            event = entries_[next->delivered];
            next->delivered++;
            callback = next->callback;
        }
        deliver(callback, event);
    }
}

void WorkflowEventStream::deliver(const Callback& callback, const WorkflowEvent& event) {
    try {
        callback(event);
    } catch (const std::exception& e) {
        spdlog::warn("Workflow {} subscriber failed on seq={}: {}", workflow_id_, event.sequence, e.what());
    }
}

std::vector<WorkflowEvent> WorkflowEventStream::entries(uint64_t since, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WorkflowEvent> result;

    // Sequence numbers are dense from 1, so since is also an index
    for (size_t i = since; i < entries_.size() && result.size() < limit; i++) {
        result.push_back(entries_[i]);
    }
    return result;
}

std::vector<WorkflowEvent> WorkflowEventStream::tail(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t start = entries_.size() > n ? entries_.size() - n : 0;
    return std::vector<WorkflowEvent>(entries_.begin() + start, entries_.end());
}

std::vector<WorkflowEvent> WorkflowEventStream::wait_for(uint64_t since,
                                                         std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return entries_.size() > since || closed_; });

    std::vector<WorkflowEvent> result;
    for (size_t i = since; i < entries_.size(); i++) {
        result.push_back(entries_[i]);
    }
    return result;
}

uint64_t WorkflowEventStream::subscribe(Callback callback) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_subscriber_id_++;
        subscribers_[id] = Subscriber{std::move(callback), 0};
    }
    dispatch();
    return id;
}

bool WorkflowEventStream::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.erase(id) > 0;
}

void WorkflowEventStream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    cv_.notify_all();
    spdlog::debug("Workflow {} event stream closed", workflow_id_);
}

bool WorkflowEventStream::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t WorkflowEventStream::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t WorkflowEventStream::last_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string WorkflowEventStream::export_jsonl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    for (const auto& entry : entries_) {
        out += entry.to_json().dump();
        out += '\n';
    }
    return out;
}

} // namespace codeloop::workflow

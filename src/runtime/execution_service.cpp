#include "runtime/execution_service.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>

namespace codeloop::runtime {

nlohmann::json ExecutionRequest::to_json() const {
    nlohmann::json j;
    j["language"] = language;
    j["session_id"] = session_id;
    j["code"] = code;
    if (timeout) {
        j["timeout_ms"] = timeout->count();
    }
    return j;
}

ExecutionService::ExecutionService(const LanguageRegistry& registry,
                                   const SessionOptions& options,
                                   std::chrono::milliseconds max_timeout)
    : registry_(registry)
    , max_timeout_(max_timeout)
    , sessions_(sandboxes_, options) {
}

ExecutionService::~ExecutionService() {
    sessions_.stop_reaper();
    sessions_.close_all();
    sandboxes_.cleanup_all();
}

std::chrono::milliseconds ExecutionService::effective_timeout(const ExecutionRequest& request,
                                                              const LanguageAdapter& adapter) const {
    std::chrono::milliseconds timeout = adapter.default_timeout;
    if (request.timeout && request.timeout->count() > 0) {
        timeout = *request.timeout;
    }
    if (max_timeout_.count() > 0) {
        timeout = std::min(timeout, max_timeout_);
    }
    return timeout;
}

ExecutionResult ExecutionService::execute(const ExecutionRequest& request, const CancelToken& cancel) {
    const LanguageAdapter* adapter = registry_.resolve(request.language);
    if (!adapter) {
        spdlog::warn("Execution rejected: language '{}' is not supported", request.language);
        return ExecutionResult::failure(ExecOutcome::NOT_SUPPORTED,
            fmt::format("language '{}' is not supported", request.language));
    }

    auto timeout = effective_timeout(request, *adapter);
    spdlog::debug("Executing {} bytes of {} in session {} (timeout={}ms)",
        request.code.size(), adapter->name, request.session_id, timeout.count());

    return sessions_.execute(request.session_id, *adapter, request.code, timeout, cancel);
}

} // namespace codeloop::runtime

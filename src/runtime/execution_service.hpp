/**
 * codeloop Code Execution Service
 *
 * Facade over the language registry and the session manager: resolves
 * the language, picks the timeout and runs the code in the caller's
 * session.
 */
#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>
#include "runtime/sandbox.hpp"
#include "runtime/session.hpp"
#include "runtime/language_registry.hpp"
#include "runtime/cancellation.hpp"

namespace codeloop::runtime {

constexpr const char* DEFAULT_SESSION_ID = "default";
constexpr std::chrono::milliseconds DEFAULT_MAX_TIMEOUT{60000};

struct ExecutionRequest {
    std::string code;
    std::string language = "python";
    std::string session_id = DEFAULT_SESSION_ID;
    std::optional<std::chrono::milliseconds> timeout;   // Overrides the adapter default

    nlohmann::json to_json() const;
};

// Anything that can run a request. The workflow orchestrator only
// depends on this interface.
class CodeExecutor {
public:
    virtual ~CodeExecutor() = default;
    virtual ExecutionResult execute(const ExecutionRequest& request, const CancelToken& cancel) = 0;
};

class ExecutionService : public CodeExecutor {
public:
    ExecutionService(const LanguageRegistry& registry,
                     const SessionOptions& options,
                     std::chrono::milliseconds max_timeout = DEFAULT_MAX_TIMEOUT);
    ~ExecutionService() override;

    // Non-copyable
    ExecutionService(const ExecutionService&) = delete;
    ExecutionService& operator=(const ExecutionService&) = delete;

    ExecutionResult execute(const ExecutionRequest& request, const CancelToken& cancel) override;

    // Timeout actually applied to a request for the given adapter
    std::chrono::milliseconds effective_timeout(const ExecutionRequest& request,
                                                const LanguageAdapter& adapter) const;

    const LanguageRegistry& registry() const { return registry_; }
    SandboxManager& sandboxes() { return sandboxes_; }
    SessionManager& sessions() { return sessions_; }

private:
    const LanguageRegistry& registry_;
    std::chrono::milliseconds max_timeout_;

    // Declaration order matters: sessions release into sandboxes_
    SandboxManager sandboxes_;
    SessionManager sessions_;
};

} // namespace codeloop::runtime

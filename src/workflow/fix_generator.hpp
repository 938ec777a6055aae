/**
 * codeloop Fix Generators
 *
 * A fix generator receives failing code plus its diagnostics and may
 * propose a corrected version. LLMFixGenerator talks to long-lived
 * helper processes: one JSON request per line on stdin, one JSON reply
 * per line on stdout. Each in-flight request owns its own helper.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "runtime/cancellation.hpp"

namespace codeloop::workflow {

struct FixRequest {
    std::string code;
    std::string language;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::string outcome;       // exec_outcome_to_string of the failed run
    uint32_t attempt = 1;      // Number of the fix-request step
};

struct FixProposal {
    bool has_fix = false;
    std::string code;
    std::string error;         // Why no fix was produced

    static FixProposal none(const std::string& reason);
    static FixProposal fix(const std::string& code);
};

class FixGenerator {
public:
    virtual ~FixGenerator() = default;

    // May block; must give up when cancel is raised
    virtual FixProposal propose_fix(const FixRequest& request, const runtime::CancelToken& cancel) = 0;

    virtual const char* name() const = 0;
};

// Never proposes anything
class NullFixGenerator : public FixGenerator {
public:
    FixProposal propose_fix(const FixRequest& request, const runtime::CancelToken& cancel) override;
    const char* name() const override { return "none"; }
};

// LLM configuration
struct LLMConfig {
    std::vector<std::string> command;            // Helper argv
    std::string api_key;                         // Passed to the helper as GEMINI_API_KEY
    std::string model = "gemini-2.0-flash";
    int timeout_seconds = 30;
    float temperature = 0.2f;
    int max_tokens = 2048;

    nlohmann::json to_json() const;               // api_key omitted
};

// LLM response
struct LLMResponse {
    bool success = false;
    std::string content;
    std::string error;
    int tokens_used = 0;
};

class LLMFixGenerator : public FixGenerator {
public:
    explicit LLMFixGenerator(const LLMConfig& config);
    ~LLMFixGenerator() override;

    // Non-copyable
    LLMFixGenerator(const LLMFixGenerator&) = delete;
    LLMFixGenerator& operator=(const LLMFixGenerator&) = delete;

    FixProposal propose_fix(const FixRequest& request, const runtime::CancelToken& cancel) override;
    const char* name() const override { return "llm"; }

    // Check if configured (has helper command and API key)
    bool is_configured() const;

    // Send one prompt to the helper
    LLMResponse complete(const std::string& prompt, const runtime::CancelToken& cancel);

    const LLMConfig& config() const { return config_; }

    static std::string build_prompt(const FixRequest& request);

    // First fenced code block of a reply, or the trimmed reply itself
    static std::string extract_code(const std::string& reply);

    // Load API key from environment
    static std::string get_api_key_from_env();

    // Load model name from environment
    static std::string get_model_from_env();

private:
    // One helper subprocess speaking the line protocol
    struct HelperProcess;

    LLMConfig config_;

    // Idle helpers. A request takes one for itself so concurrent
    // workflows never wait on each other.
    std::vector<std::unique_ptr<HelperProcess>> idle_helpers_;
    std::mutex mutex_;

    std::unique_ptr<HelperProcess> take_helper();
    void return_helper(std::unique_ptr<HelperProcess> helper);
    std::unique_ptr<HelperProcess> start_helper() const;

    // Environment of a helper: ours plus GEMINI_API_KEY
    std::vector<std::string> helper_environment() const;

    // On failure healthy is cleared and the helper must not be reused
    LLMResponse call_helper(HelperProcess& helper, const std::string& request_json,
                            const runtime::CancelToken& cancel, bool& healthy);

    std::string build_request_json(const std::string& prompt) const;

    static LLMResponse parse_helper_response(const std::string& response_json, bool& healthy);
};

} // namespace codeloop::workflow

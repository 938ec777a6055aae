#include "workflow/fix_generator.hpp"
#include "util/env.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <unistd.h>
#include <signal.h>
#include <poll.h>
#include <fcntl.h>
#include <sys/wait.h>

using json = nlohmann::json;

namespace codeloop::workflow {

constexpr int POLL_INTERVAL_MS = 50;
constexpr size_t MAX_IDLE_HELPERS = 4;
constexpr const char* NO_FIX_MARKER = "NO_FIX";

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ============================================================================
// Helper subprocess
// ============================================================================

struct LLMFixGenerator::HelperProcess {
    pid_t pid = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
    std::string read_buffer;

    ~HelperProcess() { stop(); }

    void stop() {
        if (stdin_fd >= 0) {
            close(stdin_fd);
            stdin_fd = -1;
        }
        if (stdout_fd >= 0) {
            close(stdout_fd);
            stdout_fd = -1;
        }
        if (pid > 0) {
            // SIGTERM first, SIGKILL if it does not exit within a second
            kill(pid, SIGTERM);
            int status;
            pid_t r = 0;
            for (int i = 0; i < 20 && r == 0; i++) {
                r = waitpid(pid, &status, WNOHANG);
                if (r == 0) {
                    usleep(POLL_INTERVAL_MS * 1000);
                }
            }
            if (r == 0) {
                kill(pid, SIGKILL);
                waitpid(pid, &status, 0);
            }
            spdlog::debug("Fixer subprocess terminated (pid={})", pid);
            pid = -1;
        }
        read_buffer.clear();
    }
};

// ============================================================================
// FixProposal / NullFixGenerator
// ============================================================================

FixProposal FixProposal::none(const std::string& reason) {
    FixProposal proposal;
    proposal.error = reason;
    return proposal;
}

FixProposal FixProposal::fix(const std::string& code) {
    FixProposal proposal;
    proposal.has_fix = true;
    proposal.code = code;
    return proposal;
}

FixProposal NullFixGenerator::propose_fix(const FixRequest&, const runtime::CancelToken&) {
    return FixProposal::none("no fix generator configured");
}

json LLMConfig::to_json() const {
    json j;
    j["command"] = command;
    j["model"] = model;
    j["timeout_seconds"] = timeout_seconds;
    j["temperature"] = temperature;
    j["max_tokens"] = max_tokens;
    return j;
}

// ============================================================================
// LLMFixGenerator
// ============================================================================

LLMFixGenerator::LLMFixGenerator(const LLMConfig& config)
    : config_(config) {
    // Load .env file first
    util::load_dotenv();

    if (config_.api_key.empty()) {
        config_.api_key = get_api_key_from_env();
    }

    // Check environment variable for model name
    std::string env_model = get_model_from_env();
    if (!env_model.empty()) {
        config_.model = env_model;
    }

    if (config_.command.empty()) {
        spdlog::warn("No fixer command configured. Set fixer.command or CODELOOP_FIXER_CMD.");
    } else if (config_.api_key.empty()) {
        spdlog::warn("No LLM API key configured. Set CODELOOP_LLM_API_KEY or GEMINI_API_KEY in environment or .env file.");
    } else {
        spdlog::info("LLM fix generator initialized (model={}, helper={})", config_.model, config_.command[0]);
    }
}

LLMFixGenerator::~LLMFixGenerator() {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_helpers_.clear();
}

bool LLMFixGenerator::is_configured() const {
    return !config_.command.empty() && !config_.api_key.empty();
}

std::string LLMFixGenerator::get_api_key_from_env() {
    for (const char* name : {"CODELOOP_LLM_API_KEY", "GEMINI_API_KEY", "GOOGLE_API_KEY"}) {
        if (auto key = util::get_env(name)) {
            return *key;
        }
    }
    return "";
}

std::string LLMFixGenerator::get_model_from_env() {
    for (const char* name : {"CODELOOP_LLM_MODEL", "GEMINI_MODEL"}) {
        if (auto model = util::get_env(name)) {
            return *model;
        }
    }
    return "";
}

std::string LLMFixGenerator::build_prompt(const FixRequest& request) {
    std::string prompt = fmt::format(
        "The following {} program failed (exit code {}, outcome {}).\n\n"
        "Program:\n```{}\n{}\n```\n\n",
        request.language, request.exit_code, request.outcome,
        request.language, request.code);

    if (!request.stderr_text.empty()) {
        prompt += fmt::format("Standard error:\n```\n{}\n```\n\n", request.stderr_text);
    }
    if (!request.stdout_text.empty()) {
        prompt += fmt::format("Standard output:\n```\n{}\n```\n\n", request.stdout_text);
    }

    prompt += fmt::format(
        "Reply with the complete corrected program in a single ```{}``` fenced code block "
        "and nothing else. If the failure cannot be fixed by changing the program, reply "
        "with exactly {}.",
        request.language, NO_FIX_MARKER);
    return prompt;
}

std::string LLMFixGenerator::extract_code(const std::string& reply) {
    size_t open = reply.find("```");
    if (open == std::string::npos) {
        return trim(reply);
    }

    // Skip the info string (language tag) on the opening fence
    size_t body = reply.find('\n', open);
    if (body == std::string::npos) {
        return "";
    }
    body++;

    size_t close = reply.find("```", body);
    std::string code = close == std::string::npos
        ? reply.substr(body)
        : reply.substr(body, close - body);

    if (!code.empty() && code.back() != '\n') {
        code += '\n';
    }
    return trim(code).empty() ? "" : code;
}

FixProposal LLMFixGenerator::propose_fix(const FixRequest& request, const runtime::CancelToken& cancel) {
    if (!is_configured()) {
        return FixProposal::none("LLM fix generator not configured");
    }

    LLMResponse response = complete(build_prompt(request), cancel);
    if (!response.success) {
        spdlog::warn("Fix request for attempt {} failed: {}", request.attempt, response.error);
        return FixProposal::none(response.error.empty() ? "fix request failed" : response.error);
    }

    std::string trimmed = trim(response.content);
    if (trimmed.empty() || trimmed.compare(0, std::strlen(NO_FIX_MARKER), NO_FIX_MARKER) == 0) {
        return FixProposal::none("model declined to propose a fix");
    }

    std::string code = extract_code(response.content);
    if (code.empty()) {
        return FixProposal::none("reply contained no code");
    }

    spdlog::debug("Fix proposed for attempt {} ({} bytes, {} tokens)",
        request.attempt, code.size(), response.tokens_used);
    return FixProposal::fix(code);
}

LLMResponse LLMFixGenerator::complete(const std::string& prompt, const runtime::CancelToken& cancel) {
    LLMResponse response;
    if (cancel.cancelled()) {
        response.error = "fix request cancelled";
        return response;
    }

    std::unique_ptr<HelperProcess> helper = take_helper();
    if (!helper) {
        response.error = "Failed to start fixer subprocess";
        return response;
    }

    bool healthy = true;
    response = call_helper(*helper, build_request_json(prompt), cancel, healthy);
    if (healthy) {
        return_helper(std::move(helper));
    }
    return response;
}

std::string LLMFixGenerator::build_request_json(const std::string& prompt) const {
    json request;
    request["prompt"] = prompt;
    request["model"] = config_.model;
    request["temperature"] = config_.temperature;
    request["max_tokens"] = config_.max_tokens;
    return request.dump();
}

// ============================================================================
// Helper pool
// ============================================================================

std::unique_ptr<LLMFixGenerator::HelperProcess> LLMFixGenerator::take_helper() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_helpers_.empty()) {
            std::unique_ptr<HelperProcess> helper = std::move(idle_helpers_.back());
            idle_helpers_.pop_back();
            return helper;
        }
    }
    return start_helper();
}

void LLMFixGenerator::return_helper(std::unique_ptr<HelperProcess> helper) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (idle_helpers_.size() < MAX_IDLE_HELPERS) {
            idle_helpers_.push_back(std::move(helper));
            return;
        }
    }
    // Pool is full; the helper is stopped outside the lock
    helper.reset();
}

std::vector<std::string> LLMFixGenerator::helper_environment() const {
    static const std::string KEY_PREFIX = "GEMINI_API_KEY=";

    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; entry++) {
        if (!config_.api_key.empty() && std::strncmp(*entry, KEY_PREFIX.c_str(), KEY_PREFIX.size()) == 0) {
            continue;
        }
        env.emplace_back(*entry);
    }
    if (!config_.api_key.empty()) {
        env.push_back(KEY_PREFIX + config_.api_key);
    }
    return env;
}

std::unique_ptr<LLMFixGenerator::HelperProcess> LLMFixGenerator::start_helper() const {
    if (config_.command.empty()) {
        spdlog::error("No fixer command configured");
        return nullptr;
    }

    // A dead helper must surface as EPIPE, not kill us
    signal(SIGPIPE, SIG_IGN);

    spdlog::debug("Starting fixer subprocess: {}", config_.command[0]);

    // Everything the child needs is built before fork
    std::vector<std::string> args = config_.command;
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::vector<std::string> env = helper_environment();
    std::vector<char*> envp;
    for (auto& var : env) envp.push_back(var.data());
    envp.push_back(nullptr);

    int stdin_pipe[2];
    int stdout_pipe[2];
    if (pipe2(stdin_pipe, O_CLOEXEC) == -1) {
        spdlog::error("Failed to create pipes for subprocess: {}", strerror(errno));
        return nullptr;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        spdlog::error("Failed to create pipes for subprocess: {}", strerror(errno));
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return nullptr;
    }

    pid_t pid = fork();
    if (pid == -1) {
        spdlog::error("Failed to fork subprocess: {}", strerror(errno));
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return nullptr;
    }

    if (pid == 0) {
        // Child process
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        execvpe(argv[0], argv.data(), envp.data());

        // If exec fails
        _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    auto helper = std::make_unique<HelperProcess>();
    helper->pid = pid;
    helper->stdin_fd = stdin_pipe[1];
    helper->stdout_fd = stdout_pipe[0];

    // Writes go through the poll loop so a helper that stops reading
    // cannot hold us past the deadline
    int flags = fcntl(helper->stdin_fd, F_GETFL);
    if (flags < 0 || fcntl(helper->stdin_fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        spdlog::error("Failed to make fixer stdin non-blocking: {}", strerror(errno));
        return nullptr;
    }

    spdlog::info("Fixer subprocess started (pid={})", pid);
    return helper;
}

LLMResponse LLMFixGenerator::call_helper(HelperProcess& helper,
                                         const std::string& request_json,
                                         const runtime::CancelToken& cancel,
                                         bool& healthy) {
    LLMResponse response;
    auto fail = [&](const std::string& error) {
        healthy = false;
        helper.stop();
        response.error = error;
        return response;
    };

    const std::string request_line = request_json + "\n";
    size_t written = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.timeout_seconds);
    char buffer[4096];

    while (true) {
        if (written == request_line.size()) {
            size_t newline = helper.read_buffer.find('\n');
            if (newline != std::string::npos) {
                std::string line = helper.read_buffer.substr(0, newline);
                helper.read_buffer.erase(0, newline + 1);
                response = parse_helper_response(line, healthy);
                if (!healthy) {
                    helper.stop();
                }
                return response;
            }
        }

        if (cancel.cancelled()) {
            // The reply in flight would desynchronize the next request
            return fail("fix request cancelled");
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return fail(fmt::format("fixer timed out after {}s", config_.timeout_seconds));
        }

        // Keep draining stdout while writing in case the helper answers early
        struct pollfd pfds[2];
        nfds_t nfds = 0;
        pfds[nfds].fd = helper.stdout_fd;
        pfds[nfds].events = POLLIN;
        pfds[nfds].revents = 0;
        nfds++;
        if (written < request_line.size()) {
            pfds[nfds].fd = helper.stdin_fd;
            pfds[nfds].events = POLLOUT;
            pfds[nfds].revents = 0;
            nfds++;
        }

        int ready = poll(pfds, nfds, static_cast<int>(std::min<long long>(remaining, POLL_INTERVAL_MS)));
        if (ready < 0) {
            if (errno == EINTR) continue;
            return fail(fmt::format("poll on subprocess failed: {}", strerror(errno)));
        }
        if (ready == 0) {
            continue;
        }

        if (nfds > 1 && (pfds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t n = write(helper.stdin_fd, request_line.data() + written, request_line.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
            } else if (n < 0 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                return fail(fmt::format("Failed to write to subprocess: {}", strerror(errno)));
            }
        }

        if (pfds[0].revents & (POLLIN | POLLERR | POLLHUP)) {
            ssize_t n = read(helper.stdout_fd, buffer, sizeof(buffer));
            if (n > 0) {
                helper.read_buffer.append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                return fail("Failed to read from subprocess");
            }
        }
    }
}

LLMResponse LLMFixGenerator::parse_helper_response(const std::string& response_json, bool& healthy) {
    LLMResponse response;

    try {
        json j = json::parse(response_json);

        response.success = j.value("success", false);
        response.content = j.value("content", "");
        response.error = j.value("error", "");
        response.tokens_used = j.value("tokens", 0);

    } catch (const std::exception& e) {
        response.success = false;
        response.error = std::string("JSON parse error: ") + e.what();
        spdlog::error("Failed to parse subprocess response: {}", e.what());
        // Whatever the helper is doing, it is out of step with us
        healthy = false;
    }

    return response;
}

} // namespace codeloop::workflow

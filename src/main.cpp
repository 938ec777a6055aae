#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include "config/config.hpp"
#include "runtime/execution_service.hpp"
#include "runtime/language_registry.hpp"
#include "workflow/orchestrator.hpp"
#include "workflow/fix_generator.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <thread>
#include <unistd.h>

using namespace codeloop;

static std::atomic<bool> g_interrupted{false};

static void signal_handler(int) {
    g_interrupted = true;
}

struct CliOptions {
    std::string command;
    std::string language = "python";
    std::string file;
    std::optional<std::string> code;
    std::string session = runtime::DEFAULT_SESSION_ID;
    std::optional<long> timeout_ms;
    std::string config_path;
};

static void print_usage() {
    std::cerr <<
        "Usage:\n"
        "  codeloop run --lang L (--file F | --code C) [--session S] [--timeout MS] [--config F]\n"
        "  codeloop exec --lang L (--file F | --code C) [--session S] [--timeout MS] [--config F]\n"
        "  codeloop languages [--config F]\n"
        "  codeloop check [--config F]\n"
        "\n"
        "  run        execute with fix-retry, one JSON event per line\n"
        "  exec       execute once, print the result as JSON\n"
        "  languages  list languages and whether their images are present\n"
        "  check      validate the deployment (images, workspace, isolation)\n";
}

static bool parse_args(int argc, char** argv, CliOptions& opts) {
    if (argc < 2) {
        return false;
    }
    opts.command = argv[1];

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--lang" || arg == "-l") {
            if (!next(opts.language)) return false;
        } else if (arg == "--file" || arg == "-f") {
            if (!next(opts.file)) return false;
        } else if (arg == "--code" || arg == "-c") {
            if (!next(value)) return false;
            opts.code = value;
        } else if (arg == "--session" || arg == "-s") {
            if (!next(opts.session)) return false;
        } else if (arg == "--timeout" || arg == "-t") {
            if (!next(value)) return false;
            try {
                opts.timeout_ms = std::stol(value);
            } catch (const std::exception&) {
                std::cerr << "Invalid timeout: " << value << "\n";
                return false;
            }
            if (*opts.timeout_ms <= 0) {
                std::cerr << "Timeout must be positive\n";
                return false;
            }
        } else if (arg == "--config") {
            if (!next(opts.config_path)) return false;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

static bool read_source(const CliOptions& opts, std::string& code) {
    if (opts.code) {
        code = *opts.code;
        return true;
    }
    if (opts.file.empty()) {
        std::cerr << "Either --file or --code is required\n";
        return false;
    }
    if (opts.file == "-") {
        code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }

    std::ifstream in(opts.file, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "Cannot read " << opts.file << "\n";
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    code = ss.str();
    return true;
}

static runtime::ExecutionRequest make_request(const CliOptions& opts, const std::string& code) {
    runtime::ExecutionRequest request;
    request.code = code;
    request.language = opts.language;
    request.session_id = opts.session;
    if (opts.timeout_ms) {
        request.timeout = std::chrono::milliseconds(*opts.timeout_ms);
    }
    return request;
}

// Workspace root must exist before any workflow starts
static bool prepare_workspace(const config::ServiceConfig& cfg) {
    std::error_code ec;
    std::filesystem::create_directories(cfg.sessions.workspace_root, ec);
    if (ec) {
        spdlog::critical("Cannot create workspace root {}: {}", cfg.sessions.workspace_root, ec.message());
        return false;
    }
    return true;
}

static int cmd_exec(const config::ServiceConfig& cfg, const runtime::LanguageRegistry& registry,
                    const runtime::ExecutionRequest& request) {
    runtime::ExecutionService service(registry, cfg.sessions, cfg.max_timeout);
    runtime::CancelToken cancel;

    runtime::ExecutionResult result;
    std::atomic<bool> done{false};
    std::thread worker([&] {
        result = service.execute(request, cancel);
        done = true;
    });

    while (!done) {
        if (g_interrupted) {
            cancel.cancel();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    worker.join();

    std::cout << result.to_json().dump() << std::endl;
    return result.succeeded() ? 0 : 1;
}

static int cmd_run(const config::ServiceConfig& cfg, const runtime::LanguageRegistry& registry,
                   const runtime::ExecutionRequest& request) {
    runtime::ExecutionService service(registry, cfg.sessions, cfg.max_timeout);

    std::unique_ptr<workflow::FixGenerator> fixer;
    if (!cfg.fixer.command.empty()) {
        fixer = std::make_unique<workflow::LLMFixGenerator>(cfg.fixer);
    } else {
        spdlog::info("No fixer configured, failed runs end without a fix attempt");
        fixer = std::make_unique<workflow::NullFixGenerator>();
    }

    workflow::WorkflowOrchestrator orchestrator(service, *fixer, cfg.orchestrator_config());
    workflow::Workflow wf = orchestrator.submit(request);

    wf.events->subscribe([](const workflow::WorkflowEvent& event) {
        std::cout << event.to_json().dump() << std::endl;
    });

    std::optional<workflow::Workflow> final_state;
    while (true) {
        final_state = orchestrator.wait(wf.id, std::chrono::milliseconds(100));
        if (final_state && final_state->is_finished()) {
            break;
        }
        if (g_interrupted) {
            orchestrator.cancel(wf.id);
        }
    }

    orchestrator.shutdown();
    return *final_state->status == workflow::WorkflowStatus::COMPLETED ? 0 : 1;
}

static int cmd_languages(const config::ServiceConfig& cfg, const runtime::LanguageRegistry& registry) {
    for (const auto& name : registry.languages()) {
        const runtime::LanguageAdapter* adapter = registry.resolve(name);
        bool available = runtime::SandboxManager::image_available(cfg.sessions.image_root, adapter->image);

        std::string aliases;
        for (const auto& alias : adapter->aliases) {
            if (!aliases.empty()) aliases += ",";
            aliases += alias;
        }
        fmt::print("{:<12} {:<20} {:<10} {:>6}ms  {}\n",
            name, adapter->image, available ? "available" : "MISSING",
            adapter->default_timeout.count(), aliases);
    }
    return 0;
}

static int cmd_check(const config::ServiceConfig& cfg, const runtime::LanguageRegistry& registry) {
    int failures = 0;

    std::error_code ec;
    if (std::filesystem::is_directory(cfg.sessions.workspace_root, ec)) {
        fmt::print("ok       workspace root {}\n", cfg.sessions.workspace_root);
    } else {
        fmt::print("FAILED   workspace root {} is missing\n", cfg.sessions.workspace_root);
        failures++;
    }

    auto missing = registry.missing_images(cfg.sessions.image_root);
    for (const auto& name : registry.languages()) {
        const runtime::LanguageAdapter* adapter = registry.resolve(name);
        bool is_missing = std::find(missing.begin(), missing.end(), name) != missing.end();
        fmt::print("{}   image {} for {}\n", is_missing ? "MISSING" : "ok     ", adapter->image, name);
    }
    failures += static_cast<int>(missing.size());

    // Degraded isolation is reported, not fatal
    bool cgroup_v2 = std::filesystem::exists("/sys/fs/cgroup/cgroup.controllers", ec);
    fmt::print("{}   cgroup v2\n", cgroup_v2 ? "ok     " : "WARNING");
    fmt::print("{}   running as root (namespaces, uid drop)\n", geteuid() == 0 ? "ok     " : "WARNING");

    if (failures > 0) {
        spdlog::error("Deployment check failed: {} problem(s)", failures);
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 2;
    }
    if (opts.command == "help" || opts.command == "--help" || opts.command == "-h") {
        print_usage();
        return 0;
    }

    util::init_logger();

    config::ServiceConfig cfg;
    std::string error;
    if (!config::ServiceConfig::load(opts.config_path, cfg, error)) {
        spdlog::critical("Configuration error: {}", error);
        return 2;
    }

    spdlog::level::level_enum level;
    if (util::parse_log_level(cfg.log_level, level)) {
        util::set_log_level(level);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    runtime::LanguageRegistry registry;
    if (!cfg.register_languages(registry)) {
        spdlog::critical("Invalid language configuration");
        return 2;
    }

    if (opts.command == "languages") {
        return cmd_languages(cfg, registry);
    }
    if (opts.command == "check") {
        return cmd_check(cfg, registry);
    }

    if (opts.command != "run" && opts.command != "exec") {
        std::cerr << "Unknown command: " << opts.command << "\n";
        print_usage();
        return 2;
    }

    std::string code;
    if (!read_source(opts, code)) {
        return 2;
    }
    if (!prepare_workspace(cfg)) {
        return 2;
    }

    runtime::ExecutionRequest request = make_request(opts, code);
    if (opts.command == "exec") {
        return cmd_exec(cfg, registry, request);
    }
    return cmd_run(cfg, registry, request);
}

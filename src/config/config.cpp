#include "config/config.hpp"
#include "util/env.hpp"
#include "util/logger.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fstream>

using json = nlohmann::json;

namespace codeloop::config {

static bool parse_mode(const json& value, unsigned& mode, std::string& error) {
    try {
        if (value.is_number_unsigned()) {
            mode = value.get<unsigned>();
        } else if (value.is_string()) {
            size_t pos = 0;
            std::string text = value.get<std::string>();
            unsigned long parsed = std::stoul(text, &pos, 8);
            if (pos != text.size()) {
                error = fmt::format("workspace_mode '{}' is not an octal mode", text);
                return false;
            }
            mode = static_cast<unsigned>(parsed);
        } else {
            error = "workspace_mode must be an octal string or a number";
            return false;
        }
    } catch (const std::exception& e) {
        error = fmt::format("invalid workspace_mode: {}", e.what());
        return false;
    }

    if (mode > 07777) {
        error = fmt::format("workspace_mode {:o} out of range", mode);
        return false;
    }
    return true;
}

static bool parse_uint(const std::string& name, const std::string& text, uint64_t& out, std::string& error) {
    try {
        size_t pos = 0;
        unsigned long long value = std::stoull(text, &pos, 10);
        if (pos != text.size() || text.find('-') != std::string::npos) {
            error = fmt::format("{}='{}' is not a non-negative integer", name, text);
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        error = fmt::format("{}='{}' is not a non-negative integer", name, text);
        return false;
    }
}

ServiceConfig::ServiceConfig()
    : languages(runtime::default_adapters()) {
}

runtime::LanguageAdapter* ServiceConfig::find_language(const std::string& name) {
    std::string key = runtime::LanguageRegistry::normalize(name);
    for (auto& adapter : languages) {
        if (adapter.name == key) {
            return &adapter;
        }
    }
    return nullptr;
}

bool ServiceConfig::load_json(const json& j, std::string& error) {
    if (!j.is_object()) {
        error = "configuration must be a JSON object";
        return false;
    }

    try {
        log_level = j.value("log_level", log_level);
        spdlog::level::level_enum level;
        if (!util::parse_log_level(log_level, level)) {
            error = fmt::format("unknown log_level '{}'", log_level);
            return false;
        }

        int64_t budget = j.value("retry_budget", static_cast<int64_t>(retry_budget));
        if (budget < 0) {
            error = "retry_budget must not be negative";
            return false;
        }
        retry_budget = static_cast<uint32_t>(budget);
        retry_on_provisioning_error = j.value("retry_on_provisioning_error", retry_on_provisioning_error);

        default_timeout = std::chrono::milliseconds(
            j.value("default_timeout_ms", static_cast<int64_t>(default_timeout.count())));
        max_timeout = std::chrono::milliseconds(
            j.value("max_timeout_ms", static_cast<int64_t>(max_timeout.count())));
        if (default_timeout.count() <= 0 || max_timeout.count() <= 0) {
            error = "default_timeout_ms and max_timeout_ms must be positive";
            return false;
        }

        sessions.idle_timeout = std::chrono::milliseconds(
            j.value("session_idle_timeout_ms", static_cast<int64_t>(sessions.idle_timeout.count())));
        sessions.reap_interval = std::chrono::milliseconds(
            j.value("reap_interval_ms", static_cast<int64_t>(sessions.reap_interval.count())));
        if (sessions.reap_interval.count() <= 0) {
            error = "reap_interval_ms must be positive";
            return false;
        }

        sessions.workspace_root = j.value("workspace_root", sessions.workspace_root);
        sessions.image_root = j.value("image_root", sessions.image_root);
        sessions.run_as_uid = j.value("sandbox_uid", sessions.run_as_uid);
        sessions.run_as_gid = j.value("sandbox_gid", sessions.run_as_gid);
        sessions.enable_sandboxing = j.value("enable_sandboxing", sessions.enable_sandboxing);
        if (j.contains("workspace_mode") && !parse_mode(j["workspace_mode"], sessions.workspace_mode, error)) {
            return false;
        }

        if (j.contains("languages")) {
            const json& entries = j["languages"];
            if (!entries.is_array()) {
                error = "languages must be an array";
                return false;
            }
            for (const auto& entry : entries) {
                std::string name = entry.is_object() ? entry.value("name", "") : "";
                runtime::LanguageAdapter* existing = find_language(name);

                runtime::LanguageAdapter adapter;
                if (!runtime::LanguageAdapter::from_json(entry, adapter, error,
                        existing ? *existing : runtime::LanguageAdapter{})) {
                    return false;
                }
                if (adapter.command.empty()) {
                    error = fmt::format("language '{}' has no command", adapter.name);
                    return false;
                }
                if (entry.contains("timeout_ms")) {
                    explicit_timeouts_.insert(adapter.name);
                }

                if (existing) {
                    *existing = adapter;
                } else {
                    languages.push_back(adapter);
                }
            }
        }

        if (j.contains("limits")) {
            const json& limits = j["limits"];
            if (!limits.is_object()) {
                error = "limits must be an object keyed by language";
                return false;
            }
            for (auto it = limits.begin(); it != limits.end(); ++it) {
                runtime::LanguageAdapter* adapter = find_language(it.key());
                if (!adapter) {
                    error = fmt::format("limits given for unknown language '{}'", it.key());
                    return false;
                }
                adapter->limits = runtime::ResourceLimits::from_json(it.value(), adapter->limits);
            }
        }

        if (j.contains("fixer")) {
            const json& f = j["fixer"];
            if (!f.is_object()) {
                error = "fixer must be an object";
                return false;
            }
            fixer.command = f.value("command", fixer.command);
            fixer.api_key = f.value("api_key", fixer.api_key);
            fixer.model = f.value("model", fixer.model);
            fixer.timeout_seconds = f.value("timeout_seconds", fixer.timeout_seconds);
            fixer.temperature = f.value("temperature", fixer.temperature);
            fixer.max_tokens = f.value("max_tokens", fixer.max_tokens);
            if (fixer.timeout_seconds <= 0) {
                error = "fixer.timeout_seconds must be positive";
                return false;
            }
        }

    } catch (const std::exception& e) {
        error = fmt::format("invalid configuration: {}", e.what());
        return false;
    }

    return true;
}

bool ServiceConfig::load_file(const std::string& path, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = fmt::format("cannot open configuration file {}", path);
        return false;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const std::exception& e) {
        error = fmt::format("cannot parse {}: {}", path, e.what());
        return false;
    }

    if (!load_json(j, error)) {
        error = fmt::format("{}: {}", path, error);
        return false;
    }

    spdlog::debug("Loaded configuration from {}", path);
    return true;
}

bool ServiceConfig::apply_env(std::string& error) {
    uint64_t value = 0;

    if (auto budget = util::get_env("CODELOOP_RETRY_BUDGET")) {
        if (!parse_uint("CODELOOP_RETRY_BUDGET", *budget, value, error)) {
            return false;
        }
        retry_budget = static_cast<uint32_t>(value);
    }

    if (auto timeout = util::get_env("CODELOOP_TIMEOUT_MS")) {
        if (!parse_uint("CODELOOP_TIMEOUT_MS", *timeout, value, error)) {
            return false;
        }
        if (value == 0) {
            error = "CODELOOP_TIMEOUT_MS must be positive";
            return false;
        }
        default_timeout = std::chrono::milliseconds(value);
    }

    if (auto root = util::get_env("CODELOOP_WORKSPACE_ROOT")) {
        sessions.workspace_root = *root;
    }
    if (auto root = util::get_env("CODELOOP_IMAGE_ROOT")) {
        sessions.image_root = *root;
    }

    if (auto level = util::get_env("CODELOOP_LOG_LEVEL")) {
        spdlog::level::level_enum parsed;
        if (!util::parse_log_level(*level, parsed)) {
            error = fmt::format("CODELOOP_LOG_LEVEL='{}' is not a log level", *level);
            return false;
        }
        log_level = *level;
    }

    if (auto command = util::get_env("CODELOOP_FIXER_CMD")) {
        fixer.command = util::split_command(*command);
    }

    return true;
}

bool ServiceConfig::register_languages(runtime::LanguageRegistry& registry) const {
    bool ok = true;
    for (auto adapter : languages) {
        if (!explicit_timeouts_.count(adapter.name)) {
            adapter.default_timeout = default_timeout;
        }
        if (!registry.register_adapter(adapter)) {
            ok = false;
        }
    }
    registry.freeze();
    return ok;
}

workflow::OrchestratorConfig ServiceConfig::orchestrator_config() const {
    workflow::OrchestratorConfig config;
    config.retry_budget = retry_budget;
    config.retry_on_provisioning_error = retry_on_provisioning_error;
    return config;
}

json ServiceConfig::to_json() const {
    json j;
    j["log_level"] = log_level;
    j["retry_budget"] = retry_budget;
    j["retry_on_provisioning_error"] = retry_on_provisioning_error;
    j["default_timeout_ms"] = default_timeout.count();
    j["max_timeout_ms"] = max_timeout.count();
    j["session_idle_timeout_ms"] = sessions.idle_timeout.count();
    j["reap_interval_ms"] = sessions.reap_interval.count();
    j["workspace_root"] = sessions.workspace_root;
    j["workspace_mode"] = fmt::format("{:04o}", sessions.workspace_mode);
    j["image_root"] = sessions.image_root;
    j["sandbox_uid"] = sessions.run_as_uid;
    j["sandbox_gid"] = sessions.run_as_gid;
    j["enable_sandboxing"] = sessions.enable_sandboxing;

    j["languages"] = json::array();
    for (const auto& adapter : languages) {
        json entry = adapter.to_json();
        if (!explicit_timeouts_.count(adapter.name)) {
            entry["timeout_ms"] = default_timeout.count();
        }
        j["languages"].push_back(entry);
    }

    j["fixer"] = fixer.to_json();
    return j;
}

bool ServiceConfig::load(const std::string& path, ServiceConfig& out, std::string& error) {
    util::load_dotenv();

    ServiceConfig config;
    if (!path.empty() && !config.load_file(path, error)) {
        return false;
    }
    if (!config.apply_env(error)) {
        return false;
    }

    out = config;
    return true;
}

} // namespace codeloop::config

/**
 * codeloop Service Configuration
 *
 * Defaults, overridden by an optional JSON file, overridden by
 * CODELOOP_* environment variables (after .env files are loaded).
 */
#pragma once
#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "runtime/language_registry.hpp"
#include "runtime/session.hpp"
#include "runtime/execution_service.hpp"
#include "workflow/fix_generator.hpp"
#include "workflow/orchestrator.hpp"

namespace codeloop::config {

struct ServiceConfig {
    std::string log_level = "info";
    uint32_t retry_budget = 3;
    bool retry_on_provisioning_error = false;
    std::chrono::milliseconds default_timeout = runtime::DEFAULT_EXEC_TIMEOUT;
    std::chrono::milliseconds max_timeout = runtime::DEFAULT_MAX_TIMEOUT;
    runtime::SessionOptions sessions;
    std::vector<runtime::LanguageAdapter> languages;
    workflow::LLMConfig fixer;

    // Built-in languages, everything else at its default
    ServiceConfig();

    // Merge a parsed configuration document. Keys are optional.
    bool load_json(const nlohmann::json& j, std::string& error);

    // Read and merge a JSON file
    bool load_file(const std::string& path, std::string& error);

    // Apply CODELOOP_* environment overrides
    bool apply_env(std::string& error);

    // Register every configured language and freeze the registry
    bool register_languages(runtime::LanguageRegistry& registry) const;

    workflow::OrchestratorConfig orchestrator_config() const;

    nlohmann::json to_json() const;

    // .env, then path (skipped when empty), then the environment
    static bool load(const std::string& path, ServiceConfig& out, std::string& error);

private:
    // Languages whose timeout was given explicitly; others follow default_timeout
    std::set<std::string> explicit_timeouts_;

    runtime::LanguageAdapter* find_language(const std::string& name);
};

} // namespace codeloop::config

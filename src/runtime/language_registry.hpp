/**
 * codeloop Language Registry
 *
 * Maps language identifiers to the environment their code runs in:
 * image, command template, source file suffix, default timeout and
 * resource caps. Populated at startup, then frozen.
 */
#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <chrono>
#include <nlohmann/json.hpp>
#include "runtime/sandbox.hpp"

namespace codeloop::runtime {

// Default wall-clock budget for one execution
constexpr std::chrono::milliseconds DEFAULT_EXEC_TIMEOUT{10000};

// How code of one language is executed
struct LanguageAdapter {
    std::string name;                      // Lower-cased identifier
    std::string image = HOST_IMAGE;        // Image reference
    std::vector<std::string> command;      // argv template ({file}, {dir})
    std::string file_suffix;               // Source file suffix, e.g. ".py"
    std::chrono::milliseconds default_timeout = DEFAULT_EXEC_TIMEOUT;
    ResourceLimits limits;
    bool reuse_workspace = false;          // Keep the sandbox warm per session
    bool enable_network = false;
    std::vector<std::string> aliases;

    nlohmann::json to_json() const;

    // Parse an adapter declaration. Missing fields keep the values of base.
    static bool from_json(const nlohmann::json& j, LanguageAdapter& out,
                          std::string& error, const LanguageAdapter& base);
    static bool from_json(const nlohmann::json& j, LanguageAdapter& out, std::string& error);
};

// Built-in adapters (python, javascript, bash)
std::vector<LanguageAdapter> default_adapters();

class LanguageRegistry {
public:
    LanguageRegistry() = default;

    // Non-copyable
    LanguageRegistry(const LanguageRegistry&) = delete;
    LanguageRegistry& operator=(const LanguageRegistry&) = delete;

    // Startup only. Returns false (and logs) when frozen, on duplicate or
    // empty identifiers, empty command templates and alias collisions.
    bool register_adapter(const LanguageAdapter& adapter);

    // End registration; the registry is read-only afterwards
    void freeze();
    bool is_frozen() const;

    // Case-insensitive lookup honouring aliases. Returns nullptr when the
    // language is not supported. Pointers stay valid for the registry's
    // lifetime.
    const LanguageAdapter* resolve(const std::string& language) const;

    // Sorted list of registered identifiers
    std::vector<std::string> languages() const;
    size_t size() const;

    // Adapters whose image is not present under image_root
    std::vector<std::string> missing_images(const std::string& image_root) const;

    static std::string normalize(const std::string& language);

private:
    std::map<std::string, LanguageAdapter> adapters_;
    std::map<std::string, std::string> aliases_;   // alias -> name
    bool frozen_ = false;
    mutable std::mutex mutex_;
};

// Register every built-in adapter
void register_defaults(LanguageRegistry& registry);

} // namespace codeloop::runtime

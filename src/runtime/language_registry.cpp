#include "runtime/language_registry.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace codeloop::runtime {

// ============================================================================
// LanguageAdapter
// ============================================================================

json LanguageAdapter::to_json() const {
    json j;
    j["name"] = name;
    j["image"] = image;
    j["command"] = command;
    j["suffix"] = file_suffix;
    j["timeout_ms"] = default_timeout.count();
    j["reuse_workspace"] = reuse_workspace;
    j["enable_network"] = enable_network;
    j["aliases"] = aliases;
    j["limits"] = limits.to_json();
    return j;
}

bool LanguageAdapter::from_json(const json& j, LanguageAdapter& out, std::string& error) {
    return from_json(j, out, error, LanguageAdapter());
}

bool LanguageAdapter::from_json(const json& j, LanguageAdapter& out,
                                std::string& error, const LanguageAdapter& base) {
    if (!j.is_object()) {
        error = "language entry must be an object";
        return false;
    }

    try {
        LanguageAdapter adapter = base;
        adapter.name = LanguageRegistry::normalize(j.value("name", base.name));
        adapter.image = j.value("image", base.image);
        adapter.command = j.value("command", base.command);
        adapter.file_suffix = j.value("suffix", base.file_suffix);
        adapter.default_timeout = std::chrono::milliseconds(
            j.value("timeout_ms", static_cast<int64_t>(base.default_timeout.count())));
        adapter.reuse_workspace = j.value("reuse_workspace", base.reuse_workspace);
        adapter.enable_network = j.value("enable_network", base.enable_network);
        adapter.aliases = j.value("aliases", base.aliases);
        if (j.contains("limits")) {
            adapter.limits = ResourceLimits::from_json(j["limits"], base.limits);
        }

        if (adapter.name.empty()) {
            error = "language entry has no name";
            return false;
        }
        if (adapter.default_timeout.count() <= 0) {
            error = "timeout_ms must be positive for language " + adapter.name;
            return false;
        }

        out = std::move(adapter);
        return true;

    } catch (const std::exception& e) {
        error = std::string("invalid language entry: ") + e.what();
        return false;
    }
}

std::vector<LanguageAdapter> default_adapters() {
    LanguageAdapter python;
    python.name = "python";
    python.image = "python-3.11-slim";
    python.command = {"python3", "-u", "{file}"};
    python.file_suffix = ".py";
    python.aliases = {"py", "python3"};

    LanguageAdapter javascript;
    javascript.name = "javascript";
    javascript.image = "node-20-slim";
    javascript.command = {"node", "{file}"};
    javascript.file_suffix = ".js";
    javascript.aliases = {"js", "node"};

    LanguageAdapter bash;
    bash.name = "bash";
    bash.image = "alpine-latest";
    bash.command = {"/bin/sh", "{file}"};
    bash.file_suffix = ".sh";
    bash.aliases = {"sh", "shell"};

    return {python, javascript, bash};
}

void register_defaults(LanguageRegistry& registry) {
    for (const auto& adapter : default_adapters()) {
        registry.register_adapter(adapter);
    }
}

// ============================================================================
// LanguageRegistry
// ============================================================================

std::string LanguageRegistry::normalize(const std::string& language) {
    size_t start = language.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = language.find_last_not_of(" \t\r\n");
    std::string result = language.substr(start, end - start + 1);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool LanguageRegistry::register_adapter(const LanguageAdapter& adapter) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (frozen_) {
        spdlog::error("Cannot register language '{}': registry is frozen", adapter.name);
        return false;
    }

    std::string name = normalize(adapter.name);
    if (name.empty()) {
        spdlog::error("Cannot register language with empty identifier");
        return false;
    }
    if (adapters_.count(name) || aliases_.count(name)) {
        spdlog::error("Language '{}' is already registered", name);
        return false;
    }
    if (adapter.command.empty()) {
        spdlog::error("Language '{}' has an empty command template", name);
        return false;
    }

    std::vector<std::string> aliases;
    for (const auto& raw : adapter.aliases) {
        std::string alias = normalize(raw);
        if (alias.empty() || alias == name) {
            continue;
        }
        if (adapters_.count(alias) || aliases_.count(alias) ||
            std::find(aliases.begin(), aliases.end(), alias) != aliases.end()) {
            spdlog::error("Alias '{}' of language '{}' collides with an existing entry", alias, name);
            return false;
        }
        aliases.push_back(alias);
    }

    LanguageAdapter stored = adapter;
    stored.name = name;
    stored.aliases = aliases;
    for (const auto& alias : aliases) {
        aliases_[alias] = name;
    }
    adapters_[name] = std::move(stored);

    spdlog::debug("Registered language '{}' (image={}, suffix={})", name, adapter.image, adapter.file_suffix);
    return true;
}

void LanguageRegistry::freeze() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!frozen_) {
        frozen_ = true;
        spdlog::info("Language registry frozen with {} adapters", adapters_.size());
    }
}

bool LanguageRegistry::is_frozen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frozen_;
}

const LanguageAdapter* LanguageRegistry::resolve(const std::string& language) const {
    std::string key = normalize(language);

    std::lock_guard<std::mutex> lock(mutex_);
    auto alias_it = aliases_.find(key);
    if (alias_it != aliases_.end()) {
        key = alias_it->second;
    }

    auto it = adapters_.find(key);
    if (it == adapters_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> LanguageRegistry::languages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(adapters_.size());
    for (const auto& [name, adapter] : adapters_) {
        result.push_back(name);
    }
    return result;
}

size_t LanguageRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adapters_.size();
}

std::vector<std::string> LanguageRegistry::missing_images(const std::string& image_root) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> missing;
    for (const auto& [name, adapter] : adapters_) {
        if (!SandboxManager::image_available(image_root, adapter.image)) {
            missing.push_back(name);
        }
    }
    return missing;
}

} // namespace codeloop::runtime

#include "util/env.hpp"
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <climits>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <mutex>

namespace codeloop::util {

bool load_dotenv_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        // Trim whitespace
        size_t start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        line = line.substr(start);

        // Skip comments
        if (line[0] == '#') continue;

        // Optional "export " prefix
        if (line.compare(0, 7, "export ") == 0) {
            line = line.substr(7);
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        size_t key_end = key.find_last_not_of(" \t");
        if (key_end != std::string::npos) key = key.substr(0, key_end + 1);

        start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? "" : value.substr(start);
        size_t val_end = value.find_last_not_of(" \t\r\n");
        if (val_end != std::string::npos) value = value.substr(0, val_end + 1);

        // Remove surrounding quotes
        if (value.size() >= 2) {
            if ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\'')) {
                value = value.substr(1, value.size() - 2);
            }
        }

        // Only set if not already in environment
        if (!key.empty() && !value.empty()) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }

    spdlog::debug("Loaded environment from {}", path);
    return true;
}

void load_dotenv() {
    static std::once_flag once;
    std::call_once(once, [] {
        namespace fs = std::filesystem;
        std::error_code ec;

        std::vector<fs::path> search_paths = {
            fs::current_path(ec) / ".env",
            "../.env",
            "../../.env",
        };

        // Also check relative to executable
        char exe_path[PATH_MAX];
        ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
        if (len != -1) {
            exe_path[len] = '\0';
            auto exe_dir = fs::path(exe_path).parent_path();
            search_paths.push_back(exe_dir / ".env");
            search_paths.push_back(exe_dir.parent_path() / ".env");
        }

        for (const auto& env_path : search_paths) {
            if (fs::exists(env_path, ec) && load_dotenv_file(env_path.string())) {
                break;
            }
        }
    });
}

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> argv;
    std::istringstream iss(command);
    std::string token;
    while (iss >> token) {
        argv.push_back(token);
    }
    return argv;
}

} // namespace codeloop::util

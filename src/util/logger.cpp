#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace codeloop::util {

void init_logger(spdlog::level::level_enum level) {
    auto console = spdlog::get("codeloop");
    if (!console) {
        // Logs go to stderr so stdout stays machine readable
        console = spdlog::stderr_color_mt("codeloop");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

bool parse_log_level(const std::string& name, spdlog::level::level_enum& level) {
    if (name == "warning") {
        level = spdlog::level::warn;
        return true;
    }
    auto parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    level = parsed;
    return true;
}

} // namespace codeloop::util

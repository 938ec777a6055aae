#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace codeloop::util {

// Install the "codeloop" console logger as the default logger
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

void set_log_level(spdlog::level::level_enum level);

// Parse "trace", "debug", "info", "warn", "error", "critical", "off".
// Returns false for anything else.
bool parse_log_level(const std::string& name, spdlog::level::level_enum& level);

} // namespace codeloop::util

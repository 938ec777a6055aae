#pragma once
#include <string>
#include <vector>
#include <optional>

namespace codeloop::util {

// Load KEY=VALUE pairs from the first .env found in the working
// directory, its parents or next to the executable. Variables already
// set in the environment win. Runs once per process.
void load_dotenv();

// Load a specific .env file. Returns false when it cannot be read.
bool load_dotenv_file(const std::string& path);

std::optional<std::string> get_env(const char* name);

// Split on whitespace ("python3 fixer.py" -> {"python3", "fixer.py"})
std::vector<std::string> split_command(const std::string& command);

} // namespace codeloop::util

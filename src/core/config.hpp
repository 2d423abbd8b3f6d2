#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace agentgate::core::config {

// Load environment variables from a .env file (idempotent).
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Comma separated list; entries are trimmed and empty entries dropped.
std::vector<std::string> get_env_list(const std::string& key, const std::vector<std::string>& fallback);

// 1/true/yes/on and 0/false/no/off (case-insensitive). Throws ConfigError on anything else.
bool get_env_bool(const std::string& key, bool fallback);

// Throws ConfigError when the value is not an integer.
long long get_env_int(const std::string& key, long long fallback);

// Split on commas, trimming whitespace around each entry.
std::vector<std::string> split_list(const std::string& value);

} // namespace agentgate::core::config

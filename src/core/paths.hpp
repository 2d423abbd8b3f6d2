#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace agentgate::core::paths {

// Best-effort path to current executable; empty if unavailable.
std::filesystem::path executable_path();

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Common search roots for project-relative files (.env).
std::vector<std::filesystem::path> project_search_paths();

// $HOME, falling back to /tmp when unset.
std::filesystem::path home_dir();

// Expand a leading "~" or "~/" to the home directory. Other paths are returned as-is.
std::filesystem::path expand_user(const std::string& path);

// ~/.agentgate
std::filesystem::path default_state_dir();

} // namespace agentgate::core::paths

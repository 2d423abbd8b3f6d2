#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace agentgate::security::path_boundary {

// Absolute, symlink-resolved, lexically normal form of a path. Components
// that do not exist yet are normalized lexically instead of failing.
std::filesystem::path canonicalize(const std::filesystem::path& path);

// Resolve a command or tool argument. "/x" is taken as absolute, "~" and
// "~/x" are expanded to $HOME, everything else is joined to the working
// directory. All forms go through canonicalize().
std::filesystem::path resolve(const std::filesystem::path& working_directory, const std::string& token);

// Component-wise prefix test on already canonical paths.
bool contains(const std::filesystem::path& root, const std::filesystem::path& candidate);

// contains() against each root in turn
bool within_any(const std::filesystem::path& candidate, const std::vector<std::filesystem::path>& roots);

struct PathCheckResult {
    bool valid = false;
    std::filesystem::path resolved;
    std::string error;
};

// Full check for a file-tool path argument
PathCheckResult validate_path(const std::string& raw,
                              const std::filesystem::path& working_directory,
                              const std::vector<std::filesystem::path>& roots);

} // namespace agentgate::security::path_boundary

#include "core/paths.hpp"
#include <algorithm>
#include <cstdlib>
#include <unistd.h>
#include <limits.h>

namespace agentgate::core::paths {

std::filesystem::path executable_path() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}

std::filesystem::path executable_dir() {
    auto exe = executable_path();
    if (exe.empty()) {
        return {};
    }
    return exe.parent_path();
}

std::vector<std::filesystem::path> project_search_paths() {
    std::vector<std::filesystem::path> candidates;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        candidates = {cwd, cwd.parent_path()};
    }
    auto exe_dir = executable_dir();
    if (!exe_dir.empty()) {
        candidates.push_back(exe_dir);
        candidates.push_back(exe_dir.parent_path());
    }

    // First occurrence wins
    std::vector<std::filesystem::path> roots;
    for (auto& candidate : candidates) {
        if (!candidate.empty() && std::find(roots.begin(), roots.end(), candidate) == roots.end()) {
            roots.push_back(std::move(candidate));
        }
    }
    return roots;
}

std::filesystem::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::filesystem::path(home);
    }
    return std::filesystem::path("/tmp");
}

std::filesystem::path expand_user(const std::string& path) {
    if (path == "~") {
        return home_dir();
    }
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return home_dir() / path.substr(2);
    }
    return std::filesystem::path(path);
}

std::filesystem::path default_state_dir() {
    return home_dir() / ".agentgate";
}

} // namespace agentgate::core::paths

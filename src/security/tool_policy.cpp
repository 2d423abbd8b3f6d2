#include "security/tool_policy.hpp"
#include "security/path_boundary.hpp"
#include <algorithm>

namespace agentgate::security {

ToolPolicy ToolPolicy::defaults() {
    ToolPolicy policy;
    policy.allowed_tools = std::set<std::string>(DEFAULT_ALLOWED_TOOLS.begin(), DEFAULT_ALLOWED_TOOLS.end());
    policy.dangerous_patterns = DEFAULT_DANGEROUS_PATTERNS;
    policy.critical_tools = std::set<std::string>(DEFAULT_CRITICAL_TOOLS.begin(), DEFAULT_CRITICAL_TOOLS.end());
    policy.file_tools = {"create_file", "edit_file", "read_file", "Write", "Edit", "Read", "MultiEdit"};
    policy.shell_tools = {"bash", "shell", "Bash"};
    return policy;
}

std::vector<std::filesystem::path> ToolPolicy::resolved_roots() const {
    std::vector<std::filesystem::path> roots;
    for (const auto& root : approved_roots) {
        auto resolved = path_boundary::canonicalize(root);
        if (std::find(roots.begin(), roots.end(), resolved) == roots.end()) {
            roots.push_back(resolved);
        }
    }
    return roots;
}

bool ToolPolicy::is_tool_allowed(const std::string& tool_name) const {
    if (allow_list_disabled) {
        return true;
    }
    if (allowed_tools && !allowed_tools->empty() && allowed_tools->count(tool_name) == 0) {
        return false;
    }
    return disallowed_tools.count(tool_name) == 0;
}

bool ToolPolicy::is_critical(const std::string& tool_name) const {
    return critical_tools.count(tool_name) > 0;
}

bool ToolPolicy::is_file_tool(const std::string& tool_name) const {
    return file_tools.count(tool_name) > 0;
}

bool ToolPolicy::is_shell_tool(const std::string& tool_name) const {
    return shell_tools.count(tool_name) > 0;
}

std::vector<std::string> ToolPolicy::allowed_tool_list() const {
    if (!allowed_tools) {
        return {};
    }
    return std::vector<std::string>(allowed_tools->begin(), allowed_tools->end());
}

nlohmann::json ToolPolicy::to_json() const {
    nlohmann::json j;
    if (allowed_tools) {
        j["allowed_tools"] = allowed_tool_list();
    } else {
        j["allowed_tools"] = nullptr;
    }
    j["disallowed_tools"] = disallowed_tools;
    j["allow_list_disabled"] = allow_list_disabled;
    j["agentic_relaxed"] = agentic_relaxed;

    j["approved_roots"] = nlohmann::json::array();
    for (const auto& root : approved_roots) {
        j["approved_roots"].push_back(root.string());
    }

    j["dangerous_patterns"] = dangerous_patterns;
    j["critical_tools"] = critical_tools;
    return j;
}

} // namespace agentgate::security

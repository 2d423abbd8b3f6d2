#pragma once
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentgate::security {

// Tool-name and path policy consumed by ToolValidator
struct ToolPolicy {
    // Name allow-list; nullopt = every name passes this check
    std::optional<std::set<std::string>> allowed_tools;
    std::set<std::string> disallowed_tools;

    // Skips the allow/deny name checks only. Path and command checks still run.
    bool allow_list_disabled = false;

    // Skips the dangerous-pattern blacklist only (the agent's own sandbox covers it)
    bool agentic_relaxed = false;

    // Primary sandbox first, then extra mounted directories
    std::vector<std::filesystem::path> approved_roots;

    std::vector<std::string> dangerous_patterns;

    // Blocking one of these aborts the whole turn
    std::set<std::string> critical_tools;

    // Tools whose input carries "path" or "file_path"
    std::set<std::string> file_tools;

    // Tools whose input carries "command"
    std::set<std::string> shell_tools;

    // Defaults for everything except roots and the name lists
    static ToolPolicy defaults();

    // Canonical forms of approved_roots, duplicates removed
    std::vector<std::filesystem::path> resolved_roots() const;

    // Name-only check; records nothing
    bool is_tool_allowed(const std::string& tool_name) const;

    bool is_critical(const std::string& tool_name) const;
    bool is_file_tool(const std::string& tool_name) const;
    bool is_shell_tool(const std::string& tool_name) const;

    // allowed_tools in sorted order, empty when the allow-list is off
    std::vector<std::string> allowed_tool_list() const;

    nlohmann::json to_json() const;
};

// Default allow-list for the agent engine's built-in tools
const std::vector<std::string> DEFAULT_ALLOWED_TOOLS = {
    "Read",
    "Write",
    "Edit",
    "Bash",
    "Glob",
    "Grep",
    "LS",
    "Task",
    "MultiEdit",
    "NotebookRead",
    "NotebookEdit",
    "WebFetch",
    "TodoRead",
    "TodoWrite",
    "WebSearch"
};

const std::vector<std::string> DEFAULT_CRITICAL_TOOLS = {
    "Task",
    "Read",
    "Write",
    "Edit",
    "Bash"
};

// Substrings that block a shell command outright (checked lower-cased)
const std::vector<std::string> DEFAULT_DANGEROUS_PATTERNS = {
    "rm -rf",
    "sudo",
    "chmod 777",
    "curl",
    "wget",
    "nc ",
    "netcat",
    ">",
    ">>",
    "|",
    "&",
    ";",
    "$(",
    "`"
};

} // namespace agentgate::security

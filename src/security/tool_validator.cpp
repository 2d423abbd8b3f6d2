#include "security/tool_validator.hpp"
#include "security/command_tokenizer.hpp"
#include "security/path_boundary.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <set>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace agentgate::security {

namespace {

const std::set<std::string> READ_ONLY_COMMANDS = {
    "cat", "ls", "head", "tail", "less", "more", "which", "whoami",
    "pwd", "echo", "printf", "env", "printenv", "date", "wc", "sort",
    "uniq", "diff", "file", "stat", "du", "df", "tree", "realpath",
    "dirname", "basename"
};

const std::set<std::string> FS_MODIFYING_COMMANDS = {
    "mkdir", "touch", "cp", "mv", "rm", "rmdir", "ln", "install", "tee"
};

const std::set<std::string> FIND_MUTATING_ACTIONS = {
    "-delete", "-exec", "-execdir", "-ok", "-okdir"
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// First string value among "path" and "file_path"
std::string extract_file_path(const json& input) {
    if (!input.is_object()) {
        return "";
    }
    for (const char* key : {"path", "file_path"}) {
        auto it = input.find(key);
        if (it != input.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return "";
}

std::string extract_command(const json& input) {
    if (!input.is_object()) {
        return "";
    }
    auto it = input.find("command");
    if (it != input.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

} // namespace

const char* block_reason_name(BlockReason reason) {
    switch (reason) {
        case BlockReason::NONE: return "none";
        case BlockReason::NOT_ALLOWED: return "not_allowed";
        case BlockReason::EXPLICITLY_DISALLOWED: return "explicitly_disallowed";
        case BlockReason::MISSING_PATH: return "missing_path";
        case BlockReason::INVALID_PATH: return "invalid_path";
        case BlockReason::DANGEROUS_PATTERN: return "dangerous_pattern";
        case BlockReason::BOUNDARY_VIOLATION: return "boundary_violation";
    }
    return "unknown";
}

BoundaryCheckResult check_bash_directory_boundary(const std::string& command,
                                                  const fs::path& working_directory,
                                                  const std::vector<fs::path>& roots) {
    BoundaryCheckResult result;

    auto parsed = tokenize(command);
    if (!parsed.ok) {
        spdlog::debug("Boundary check skipped, command not parseable ({}): {}", parsed.error, command);
        result.parsed = false;
        return result;
    }
    if (parsed.tokens.empty()) {
        return result;
    }

    const auto& tokens = parsed.tokens;
    const std::string base = fs::path(tokens[0]).filename().string();

    if (READ_ONLY_COMMANDS.count(base)) {
        return result;
    }

    if (base == "find") {
        bool mutating = std::any_of(tokens.begin() + 1, tokens.end(),
                                    [](const std::string& t) { return FIND_MUTATING_ACTIONS.count(t) > 0; });
        if (!mutating) {
            return result;
        }
    } else if (!FS_MODIFYING_COMMANDS.count(base)) {
        return result;
    }

    for (size_t i = 1; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (!token.empty() && token[0] == '-') {
            continue;
        }

        fs::path resolved = path_boundary::resolve(working_directory, token);
        if (!path_boundary::within_any(resolved, roots)) {
            result.ok = false;
            result.error = "Directory boundary violation: '" + base + "' targets '" + token +
                           "' which is outside approved directories";
            return result;
        }
    }

    return result;
}

ToolValidator::ToolValidator(ToolPolicy policy, ValidatorState& state)
    : policy_(std::move(policy)), state_(state) {
    roots_ = policy_.resolved_roots();
}

ValidationResult ToolValidator::validate(const std::string& tool_name,
                                         const json& input,
                                         const fs::path& working_directory,
                                         int64_t user_id) {
    spdlog::debug("Validating tool call: {} (user {})", tool_name, user_id);

    if (!policy_.allow_list_disabled) {
        if (policy_.allowed_tools && !policy_.allowed_tools->empty() &&
            policy_.allowed_tools->count(tool_name) == 0) {
            return block(BlockReason::NOT_ALLOWED, "disallowed_tool",
                         "Tool not allowed: " + tool_name,
                         tool_name, working_directory, user_id, json::object());
        }
        if (policy_.disallowed_tools.count(tool_name)) {
            return block(BlockReason::EXPLICITLY_DISALLOWED, "explicitly_disallowed_tool",
                         "Tool explicitly disallowed: " + tool_name,
                         tool_name, working_directory, user_id, json::object());
        }
    }

    if (policy_.is_file_tool(tool_name)) {
        std::string file_path = extract_file_path(input);
        if (file_path.empty()) {
            return block(BlockReason::MISSING_PATH, "missing_file_path",
                         "File path required",
                         tool_name, working_directory, user_id, json::object());
        }

        auto check = path_boundary::validate_path(file_path, working_directory, roots_);
        if (!check.valid) {
            return block(BlockReason::INVALID_PATH, "invalid_file_path",
                         "Invalid file path: " + check.error,
                         tool_name, working_directory, user_id,
                         {{"file_path", file_path}, {"error", check.error}});
        }
    }

    if (policy_.is_shell_tool(tool_name)) {
        std::string command = extract_command(input);

        if (!policy_.agentic_relaxed) {
            const std::string lowered = to_lower(command);
            for (const auto& pattern : policy_.dangerous_patterns) {
                if (!pattern.empty() && lowered.find(to_lower(pattern)) != std::string::npos) {
                    return block(BlockReason::DANGEROUS_PATTERN, "dangerous_command",
                                 "Dangerous command pattern detected: " + pattern,
                                 tool_name, working_directory, user_id,
                                 {{"command", command}, {"pattern", pattern}});
                }
            }
        }

        auto boundary = check_bash_directory_boundary(command, working_directory, roots_);
        if (!boundary.parsed) {
            spdlog::warn("Shell command for user {} could not be parsed, boundary check deferred: {}",
                         user_id, command);
        }
        if (!boundary.ok) {
            return block(BlockReason::BOUNDARY_VIOLATION, "directory_boundary_violation",
                         boundary.error,
                         tool_name, working_directory, user_id,
                         {{"command", command}});
        }
    }

    state_.record_use(tool_name);

    ValidationResult result;
    result.allowed = true;
    return result;
}

ValidationResult ToolValidator::block(BlockReason reason,
                                      const std::string& violation_type,
                                      const std::string& error,
                                      const std::string& tool_name,
                                      const fs::path& working_directory,
                                      int64_t user_id,
                                      json detail) {
    spdlog::warn("Tool call blocked [{}] user={} tool={}: {}",
                 violation_type, user_id, tool_name, error);

    ViolationRecord violation;
    violation.type = violation_type;
    violation.tool_name = tool_name;
    violation.user_id = user_id;
    violation.working_directory = working_directory.string();
    violation.detail = std::move(detail);
    violation.timestamp = std::chrono::system_clock::now();
    state_.record_violation(std::move(violation));

    ValidationResult result;
    result.allowed = false;
    result.reason = reason;
    result.error = error;
    return result;
}

} // namespace agentgate::security

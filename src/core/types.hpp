#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentgate::core {

// A tool invocation the agent wants to perform.
// input keys by tool family: "path"/"file_path" for file tools, "command" for shell tools.
struct ToolCall {
    std::string name;
    nlohmann::json input = nlohmann::json::object();
    std::string id;
};

// One event streamed out of the agent engine while a turn runs
struct StreamUpdate {
    std::string type;                 // "assistant", "user", "system", "result"
    std::string content;
    std::vector<ToolCall> tool_calls;
    nlohmann::json metadata = nlohmann::json::object();
};

using StreamCallback = std::function<void(const StreamUpdate&)>;

struct ToolUse {
    std::string name;
    nlohmann::json input = nlohmann::json::object();
};

// Result of a single agent turn
struct AgentResponse {
    std::string content;
    std::string session_id;
    double cost = 0.0;
    int64_t duration_ms = 0;
    int num_turns = 0;
    bool is_error = false;
    std::string error_type;
    std::vector<ToolUse> tools_used;

    // Tool names in first-use order, duplicates removed
    std::vector<std::string> tool_names() const;

    nlohmann::json to_json() const;
};

} // namespace agentgate::core

#include "core/types.hpp"
#include <algorithm>

namespace agentgate::core {

std::vector<std::string> AgentResponse::tool_names() const {
    std::vector<std::string> names;
    for (const auto& use : tools_used) {
        if (std::find(names.begin(), names.end(), use.name) == names.end()) {
            names.push_back(use.name);
        }
    }
    return names;
}

nlohmann::json AgentResponse::to_json() const {
    nlohmann::json j;
    j["content"] = content;
    j["session_id"] = session_id;
    j["cost"] = cost;
    j["duration_ms"] = duration_ms;
    j["num_turns"] = num_turns;
    j["is_error"] = is_error;
    if (!error_type.empty()) {
        j["error_type"] = error_type;
    }
    j["tools_used"] = nlohmann::json::array();
    for (const auto& use : tools_used) {
        j["tools_used"].push_back({{"name", use.name}, {"input", use.input}});
    }
    return j;
}

} // namespace agentgate::core

#include "security/validator_state.hpp"
#include <spdlog/spdlog.h>
#include <set>

namespace agentgate::security {

nlohmann::json ViolationRecord::to_json() const {
    nlohmann::json j;
    j["type"] = type;
    j["tool_name"] = tool_name;
    j["user_id"] = user_id;
    j["working_directory"] = working_directory;
    j["detail"] = detail;
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count();
    return j;
}

void ValidatorState::record_use(const std::string& tool_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    tool_usage_[tool_name]++;
}

void ValidatorState::record_violation(ViolationRecord violation) {
    if (violation.timestamp == std::chrono::system_clock::time_point{}) {
        violation.timestamp = std::chrono::system_clock::now();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    violations_.push_back(std::move(violation));
}

nlohmann::json ValidatorState::tool_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t total = 0;
    nlohmann::json by_tool = nlohmann::json::object();
    for (const auto& [name, count] : tool_usage_) {
        total += count;
        by_tool[name] = count;
    }

    nlohmann::json stats;
    stats["total_calls"] = total;
    stats["by_tool"] = by_tool;
    stats["unique_tools"] = tool_usage_.size();
    stats["security_violations"] = violations_.size();
    return stats;
}

std::vector<ViolationRecord> ValidatorState::violations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return violations_;
}

nlohmann::json ValidatorState::user_tool_usage(int64_t user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t count = 0;
    std::set<std::string> types;
    for (const auto& v : violations_) {
        if (v.user_id == user_id) {
            count++;
            types.insert(v.type);
        }
    }

    nlohmann::json usage;
    usage["user_id"] = user_id;
    usage["security_violations"] = count;
    usage["violation_types"] = types;
    return usage;
}

uint64_t ValidatorState::usage_count(const std::string& tool_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tool_usage_.find(tool_name);
    return it == tool_usage_.end() ? 0 : it->second;
}

void ValidatorState::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tool_usage_.clear();
        violations_.clear();
    }
    spdlog::info("Tool validator statistics reset");
}

} // namespace agentgate::security

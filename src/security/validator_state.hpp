#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentgate::security {

// One blocked tool call
struct ViolationRecord {
    std::string type;                 // e.g. "dangerous_command", "directory_boundary_violation"
    std::string tool_name;
    int64_t user_id = 0;
    std::string working_directory;
    nlohmann::json detail = nlohmann::json::object();
    std::chrono::system_clock::time_point timestamp;

    nlohmann::json to_json() const;
};

// Usage counters and violation log shared by every ToolValidator that
// points at it. Appends and reads are serialized by an internal mutex.
class ValidatorState {
public:
    ValidatorState() = default;

    ValidatorState(const ValidatorState&) = delete;
    ValidatorState& operator=(const ValidatorState&) = delete;

    void record_use(const std::string& tool_name);
    void record_violation(ViolationRecord violation);

    // {total_calls, by_tool, unique_tools, security_violations}
    nlohmann::json tool_stats() const;

    std::vector<ViolationRecord> violations() const;

    // {user_id, security_violations, violation_types}
    nlohmann::json user_tool_usage(int64_t user_id) const;

    uint64_t usage_count(const std::string& tool_name) const;

    void reset();

private:
    std::map<std::string, uint64_t> tool_usage_;
    std::vector<ViolationRecord> violations_;
    mutable std::mutex mutex_;
};

} // namespace agentgate::security

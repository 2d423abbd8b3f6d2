#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "session/session_id.hpp"

namespace agentgate::session {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// One conversation with the agent engine, scoped to a user and a directory
struct Session {
    std::string session_id;
    int64_t user_id = 0;
    std::string project_path;           // canonical absolute directory
    TimePoint created_at;
    TimePoint last_used;
    double total_cost = 0.0;
    int message_count = 0;
    std::vector<std::string> tools_used; // first-use order, no duplicates

    // Set only on the copy returned by get_or_create when nothing matched.
    // Never stored.
    bool is_new_session = false;

    // Insertion order inside a store; breaks last_used ties
    uint64_t row_id = 0;

    SessionId id() const { return SessionId::parse(session_id); }
    bool is_placeholder() const { return id().is_pending(); }

    bool is_expired(std::chrono::seconds timeout, TimePoint now) const;

    // Adds names not already present, keeping order
    void merge_tools(const std::vector<std::string>& tools);

    nlohmann::json to_json() const;
    static Session from_json(const nlohmann::json& j);
};

// Timestamps travel as milliseconds since the epoch
int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(int64_t ms);

} // namespace agentgate::session

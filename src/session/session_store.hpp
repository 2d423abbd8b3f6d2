#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "session/session.hpp"

namespace agentgate::session {

// Partial update; unset fields are left alone
struct SessionPatch {
    std::optional<std::string> session_id;
    std::optional<TimePoint> last_used;
    std::optional<double> total_cost;
    std::optional<int> message_count;
    std::optional<std::vector<std::string>> tools_used;
};

// Storage for session records. Each call is atomic on its own; nothing
// spans calls.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    // False when a record with this id already exists
    virtual bool create(const Session& session) = 0;

    virtual std::optional<Session> get(const std::string& session_id) const = 0;

    // False when the id is unknown, or when patch.session_id re-keys the
    // record onto an id that is already taken
    virtual bool update(const std::string& session_id, const SessionPatch& patch) = 0;

    virtual bool erase(const std::string& session_id) = 0;

    virtual std::vector<Session> list_by_user(int64_t user_id) const = 0;

    virtual std::vector<Session> list_all() const = 0;
};

} // namespace agentgate::session

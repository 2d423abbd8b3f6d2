#pragma once
#include <mutex>
#include <unordered_map>
#include "session/session_store.hpp"

namespace agentgate::session {

// Process-lifetime store. Row ids increase monotonically per store.
class InMemorySessionStore : public SessionStore {
public:
    bool create(const Session& session) override;
    std::optional<Session> get(const std::string& session_id) const override;
    bool update(const std::string& session_id, const SessionPatch& patch) override;
    bool erase(const std::string& session_id) override;
    std::vector<Session> list_by_user(int64_t user_id) const override;
    std::vector<Session> list_all() const override;

    size_t size() const;

protected:
    // Insert a record as-is (row id included), replacing any record with the same id
    void restore(const Session& session);

private:
    std::unordered_map<std::string, Session> sessions_;
    uint64_t next_row_id_ = 1;
    mutable std::mutex mutex_;
};

} // namespace agentgate::session

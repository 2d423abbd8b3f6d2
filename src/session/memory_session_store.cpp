#include "session/memory_session_store.hpp"
#include <algorithm>

namespace agentgate::session {

namespace {

void sort_by_row(std::vector<Session>& sessions) {
    std::sort(sessions.begin(), sessions.end(),
              [](const Session& a, const Session& b) { return a.row_id < b.row_id; });
}

} // namespace

bool InMemorySessionStore::create(const Session& session) {
    if (session.session_id.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(session.session_id)) {
        return false;
    }

    Session entry = session;
    entry.is_new_session = false;
    entry.row_id = next_row_id_++;
    sessions_.emplace(entry.session_id, std::move(entry));
    return true;
}

std::optional<Session> InMemorySessionStore::get(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemorySessionStore::update(const std::string& session_id, const SessionPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }

    bool rekey = patch.session_id && *patch.session_id != session_id;
    if (rekey && (patch.session_id->empty() || sessions_.count(*patch.session_id))) {
        return false;
    }

    Session entry = it->second;
    if (patch.last_used) entry.last_used = *patch.last_used;
    if (patch.total_cost) entry.total_cost = *patch.total_cost;
    if (patch.message_count) entry.message_count = *patch.message_count;
    if (patch.tools_used) entry.tools_used = *patch.tools_used;

    if (rekey) {
        sessions_.erase(it);
        entry.session_id = *patch.session_id;
        sessions_.emplace(entry.session_id, std::move(entry));
    } else {
        it->second = std::move(entry);
    }
    return true;
}

bool InMemorySessionStore::erase(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(session_id) > 0;
}

std::vector<Session> InMemorySessionStore::list_by_user(int64_t user_id) const {
    std::vector<Session> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (session.user_id == user_id) {
                result.push_back(session);
            }
        }
    }
    sort_by_row(result);
    return result;
}

std::vector<Session> InMemorySessionStore::list_all() const {
    std::vector<Session> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            result.push_back(session);
        }
    }
    sort_by_row(result);
    return result;
}

size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void InMemorySessionStore::restore(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    Session entry = session;
    entry.is_new_session = false;
    if (entry.row_id == 0) {
        entry.row_id = next_row_id_;
    }
    next_row_id_ = std::max(next_row_id_, entry.row_id + 1);
    sessions_[entry.session_id] = std::move(entry);
}

} // namespace agentgate::session

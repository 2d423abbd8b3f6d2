#include "session/session_manager.hpp"
#include "core/errors.hpp"
#include "security/path_boundary.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

using json = nlohmann::json;

namespace agentgate::session {

std::string canonical_project_path(const std::filesystem::path& directory) {
    return security::path_boundary::canonicalize(directory).string();
}

SessionManager::SessionManager(SessionStore& store, SessionConfig config, ClockFn clock)
    : store_(store), config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
}

Session SessionManager::get_or_create(int64_t user_id,
                                      const std::filesystem::path& directory,
                                      const std::optional<std::string>& explicit_id,
                                      bool force_new) {
    const std::string project_path = canonical_project_path(directory);
    std::lock_guard<std::mutex> lock(mutex_);

    if (explicit_id && !explicit_id->empty() && !SessionId::is_placeholder(*explicit_id)) {
        auto existing = store_.get(*explicit_id);
        if (existing) {
            if (existing->user_id == user_id) {
                spdlog::debug("Using explicit session {} for user {}", *explicit_id, user_id);
                existing->is_new_session = false;
                return *existing;
            }
            spdlog::warn("Session {} belongs to user {}, not {}; starting a new session",
                         *explicit_id, existing->user_id, user_id);
            return create_fresh(user_id, project_path);
        }

        // Unknown to us but possibly known to the engine: continue anyway
        Session shell;
        shell.session_id = *explicit_id;
        shell.user_id = user_id;
        shell.project_path = project_path;
        shell.created_at = clock_();
        shell.last_used = shell.created_at;
        if (!store_.create(shell)) {
            throw SessionError("Failed to store session " + shell.session_id);
        }

        auto stored = store_.get(shell.session_id);
        spdlog::info("Continuing untracked session {} for user {} in {}", *explicit_id, user_id, project_path);
        return stored ? *stored : shell;
    }

    if (!force_new) {
        auto resumable = latest_matching(user_id, project_path, false);
        if (resumable) {
            spdlog::info("Auto-resuming session {} for user {} in {}",
                         resumable->session_id, user_id, project_path);
            return *resumable;
        }
    }

    return create_fresh(user_id, project_path);
}

std::optional<Session> SessionManager::find_resumable(int64_t user_id, const std::filesystem::path& directory) const {
    return latest_matching(user_id, canonical_project_path(directory), false);
}

std::optional<Session> SessionManager::find_latest(int64_t user_id, const std::filesystem::path& directory) const {
    return latest_matching(user_id, canonical_project_path(directory), true);
}

std::optional<Session> SessionManager::update_session(const std::string& session_id,
                                                      const core::AgentResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto current = store_.get(session_id);
    if (!current) {
        spdlog::warn("update_session: unknown session {}", session_id);
        return std::nullopt;
    }

    const TimePoint now = clock_();
    const double cost = std::max(0.0, response.cost);

    std::string target_id = session_id;
    if (current->is_placeholder() && !response.session_id.empty() &&
        !SessionId::is_placeholder(response.session_id)) {
        target_id = response.session_id;
    }

    if (target_id != session_id) {
        auto adopted = store_.get(target_id);
        if (adopted) {
            // Engine id already tracked: fold this turn into it and drop the placeholder
            Session merged = *adopted;
            merged.message_count += 1;
            merged.total_cost += cost;
            merged.merge_tools(current->tools_used);
            merged.merge_tools(response.tool_names());
            merged.last_used = now;

            SessionPatch patch;
            patch.last_used = merged.last_used;
            patch.total_cost = merged.total_cost;
            patch.message_count = merged.message_count;
            patch.tools_used = merged.tools_used;
            if (!store_.update(target_id, patch)) {
                spdlog::error("Failed to merge into session {}", target_id);
                return std::nullopt;
            }
            if (!store_.erase(session_id)) {
                spdlog::warn("Placeholder {} was already gone after merge", session_id);
            }

            spdlog::info("Merged placeholder {} into existing session {}", session_id, target_id);
            return store_.get(target_id);
        }
    }

    Session updated = *current;
    updated.message_count += 1;
    updated.total_cost += cost;
    updated.merge_tools(response.tool_names());
    updated.last_used = now;

    SessionPatch patch;
    patch.last_used = updated.last_used;
    patch.total_cost = updated.total_cost;
    patch.message_count = updated.message_count;
    patch.tools_used = updated.tools_used;
    if (target_id != session_id) {
        patch.session_id = target_id;
    }

    if (!store_.update(session_id, patch)) {
        spdlog::error("Failed to update session {}", session_id);
        return std::nullopt;
    }

    if (target_id != session_id) {
        spdlog::info("Session {} assigned engine id {}", session_id, target_id);
    }
    spdlog::debug("Session {} updated: messages={} cost={:.4f}",
                  target_id, updated.message_count, updated.total_cost);
    return store_.get(target_id);
}

void SessionManager::set_busy_check(BusyFn busy) {
    std::lock_guard<std::mutex> lock(mutex_);
    busy_ = std::move(busy);
}

bool SessionManager::remove_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = store_.erase(session_id);
    if (removed) {
        spdlog::info("Removed session {}", session_id);
    }
    return removed;
}

size_t SessionManager::cleanup_expired_sessions(std::optional<std::chrono::seconds> timeout) {
    const auto limit = timeout.value_or(config_.timeout);
    std::lock_guard<std::mutex> lock(mutex_);

    const TimePoint now = clock_();
    size_t removed = 0;
    for (const auto& session : store_.list_all()) {
        if (session.is_expired(limit, now) && store_.erase(session.session_id)) {
            removed++;
        }
    }

    if (removed > 0) {
        spdlog::info("Cleaned up {} expired sessions", removed);
    }
    return removed;
}

std::vector<Session> SessionManager::get_user_sessions(int64_t user_id) const {
    return store_.list_by_user(user_id);
}

std::optional<json> SessionManager::get_session_info(const std::string& session_id) const {
    auto session = store_.get(session_id);
    if (!session) {
        return std::nullopt;
    }
    json info = session->to_json();
    info["expired"] = session->is_expired(config_.timeout, clock_());
    return info;
}

json SessionManager::get_user_session_summary(int64_t user_id) const {
    const auto sessions = store_.list_by_user(user_id);
    const TimePoint now = clock_();

    size_t active = 0;
    double total_cost = 0.0;
    int64_t total_messages = 0;
    std::set<std::string> projects;

    for (const auto& s : sessions) {
        if (!s.is_expired(config_.timeout, now)) {
            active++;
        }
        total_cost += s.total_cost;
        total_messages += s.message_count;
        projects.insert(s.project_path);
    }

    json summary;
    summary["user_id"] = user_id;
    summary["total_sessions"] = sessions.size();
    summary["active_sessions"] = active;
    summary["total_cost"] = total_cost;
    summary["total_messages"] = total_messages;
    summary["projects"] = projects;
    return summary;
}

Session SessionManager::create_fresh(int64_t user_id, const std::string& project_path) {
    evict_over_limit(user_id, project_path);

    Session session;
    session.session_id = SessionId::pending().str();
    session.user_id = user_id;
    session.project_path = project_path;
    session.created_at = clock_();
    session.last_used = session.created_at;

    if (!store_.create(session)) {
        throw SessionError("Failed to store new session " + session.session_id);
    }

    auto stored = store_.get(session.session_id);
    Session result = stored ? *stored : session;
    result.is_new_session = true;

    spdlog::info("Created session {} for user {} in {}", result.session_id, user_id, project_path);
    return result;
}

void SessionManager::evict_over_limit(int64_t user_id, const std::string& project_path) {
    if (config_.max_sessions_per_user == 0) {
        return;
    }

    auto sessions = store_.list_by_user(user_id);
    if (sessions.size() < config_.max_sessions_per_user) {
        return;
    }
    // Leave room for the session about to be created
    const size_t excess = sessions.size() - config_.max_sessions_per_user + 1;

    // The caller owns project_path; any other directory may have a turn running
    std::vector<Session> candidates;
    for (auto& s : sessions) {
        if (s.project_path != project_path && busy_ && busy_(user_id, s.project_path)) {
            spdlog::debug("Not evicting session {}: turn in flight in {}", s.session_id, s.project_path);
            continue;
        }
        candidates.push_back(std::move(s));
    }

    std::sort(candidates.begin(), candidates.end(), [](const Session& a, const Session& b) {
        if (a.last_used != b.last_used) return a.last_used < b.last_used;
        return a.row_id < b.row_id;
    });

    const size_t count = std::min(excess, candidates.size());
    for (size_t i = 0; i < count; ++i) {
        if (store_.erase(candidates[i].session_id)) {
            spdlog::info("Evicted session {} for user {} (limit {})",
                         candidates[i].session_id, user_id, config_.max_sessions_per_user);
        }
    }
    if (count < excess) {
        spdlog::warn("User {} stays over the session limit ({}) while other turns run",
                     user_id, config_.max_sessions_per_user);
    }
}

std::optional<Session> SessionManager::latest_matching(int64_t user_id,
                                                       const std::string& project_path,
                                                       bool include_expired) const {
    const TimePoint now = clock_();
    std::optional<Session> best;

    for (const auto& s : store_.list_by_user(user_id)) {
        if (s.project_path != project_path || s.is_placeholder()) {
            continue;
        }
        if (!include_expired && s.is_expired(config_.timeout, now)) {
            continue;
        }
        if (!best || s.last_used > best->last_used ||
            (s.last_used == best->last_used && s.row_id > best->row_id)) {
            best = s;
        }
    }
    return best;
}

} // namespace agentgate::session

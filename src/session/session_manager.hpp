#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "session/session.hpp"
#include "session/session_store.hpp"

namespace agentgate::session {

struct SessionConfig {
    std::chrono::seconds timeout = std::chrono::hours(24);
    size_t max_sessions_per_user = 5;   // 0 = unlimited
};

// Resolves, creates and updates sessions on top of a SessionStore.
// Only update_session changes message_count and total_cost.
class SessionManager {
public:
    using ClockFn = std::function<TimePoint()>;

    // True while a turn for (user_id, project_path) is in flight
    using BusyFn = std::function<bool(int64_t user_id, const std::string& project_path)>;

    SessionManager(SessionStore& store, SessionConfig config, ClockFn clock = nullptr);

    // explicit_id set and not a placeholder: load it, or store a bare record
    // under that id when nothing matches. Otherwise auto-resume unless
    // force_new, otherwise a fresh placeholder session (is_new_session = true).
    Session get_or_create(int64_t user_id,
                          const std::filesystem::path& directory,
                          const std::optional<std::string>& explicit_id = std::nullopt,
                          bool force_new = false);

    // Latest non-placeholder, non-expired session for (user, directory).
    // Ties on last_used go to the higher row id.
    std::optional<Session> find_resumable(int64_t user_id, const std::filesystem::path& directory) const;

    // Same, but expired sessions qualify
    std::optional<Session> find_latest(int64_t user_id, const std::filesystem::path& directory) const;

    // Account one finished turn. Calling it twice counts the turn twice.
    // A placeholder session takes the engine id from the response. Returns
    // the stored record, or nullopt when session_id is unknown.
    std::optional<Session> update_session(const std::string& session_id, const core::AgentResponse& response);

    bool remove_session(const std::string& session_id);

    // Defaults to the configured timeout
    size_t cleanup_expired_sessions(std::optional<std::chrono::seconds> timeout = std::nullopt);

    std::vector<Session> get_user_sessions(int64_t user_id) const;

    std::optional<nlohmann::json> get_session_info(const std::string& session_id) const;

    // {total_sessions, active_sessions, total_cost, total_messages, projects}
    nlohmann::json get_user_session_summary(int64_t user_id) const;

    // Sessions reported busy are never evicted by the per-user limit; the
    // limit catches up on a later creation. Pass nullptr to clear.
    void set_busy_check(BusyFn busy);

    const SessionConfig& config() const { return config_; }
    TimePoint now() const { return clock_(); }

private:
    SessionStore& store_;
    SessionConfig config_;
    ClockFn clock_;
    BusyFn busy_;
    mutable std::mutex mutex_;

    Session create_fresh(int64_t user_id, const std::string& project_path);
    void evict_over_limit(int64_t user_id, const std::string& project_path);
    std::optional<Session> latest_matching(int64_t user_id, const std::string& project_path, bool include_expired) const;
};

// Canonical string form used as project_path
std::string canonical_project_path(const std::filesystem::path& directory);

} // namespace agentgate::session

#include <gtest/gtest.h>
#include "session/memory_session_store.hpp"
#include "session/session_id.hpp"
#include "session/session_manager.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;
using namespace agentgate::session;
using agentgate::core::AgentResponse;
using agentgate::testing::FakeClock;

namespace {

AgentResponse response_with(const std::string& engine_id, double cost = 0.0,
                            std::vector<std::string> tools = {}) {
    AgentResponse r;
    r.session_id = engine_id;
    r.cost = cost;
    for (const auto& t : tools) {
        r.tools_used.push_back({t, nlohmann::json::object()});
    }
    return r;
}

} // namespace

class SessionManagerTest : public ::testing::Test {
protected:
    SessionManagerTest() : manager_(store_, config(), clock_.fn()) {}

    static SessionConfig config() {
        SessionConfig c;
        c.timeout = 24h;
        c.max_sessions_per_user = 5;
        return c;
    }

    // Fresh session finalized to a real engine id
    Session finalized(int64_t user, const std::string& dir, const std::string& engine_id) {
        auto s = manager_.get_or_create(user, dir, std::nullopt, true);
        auto updated = manager_.update_session(s.session_id, response_with(engine_id));
        EXPECT_TRUE(updated);
        return *updated;
    }

    FakeClock clock_;
    InMemorySessionStore store_;
    SessionManager manager_;
};

TEST(SessionId, PlaceholderForms) {
    auto pending = SessionId::pending();
    EXPECT_TRUE(pending.is_pending());
    EXPECT_EQ(pending.str().rfind("temp-", 0), 0u);
    EXPECT_NE(pending.str(), SessionId::pending().str());

    EXPECT_TRUE(SessionId::parse("temp-123").is_pending());
    EXPECT_TRUE(SessionId::parse("temp_123").is_pending());
    EXPECT_TRUE(SessionId::parse("").is_pending());
    EXPECT_TRUE(SessionId::parse("abc-123").is_assigned());
    EXPECT_EQ(SessionId::parse("abc-123").str(), "abc-123");
    EXPECT_EQ(SessionId::parse("temp_9"), SessionId::parse("temp_9"));
    EXPECT_NE(SessionId::parse("temp_9"), SessionId::parse("abc-123"));
}

TEST_F(SessionManagerTest, NewSessionIsPlaceholderAndNotResumable) {
    auto s = manager_.get_or_create(1, "/work/app");
    EXPECT_TRUE(s.is_new_session);
    EXPECT_TRUE(s.is_placeholder());
    EXPECT_EQ(s.project_path, "/work/app");
    EXPECT_EQ(s.created_at, clock_.now());

    EXPECT_FALSE(manager_.find_resumable(1, "/work/app"));

    auto again = manager_.get_or_create(1, "/work/app");
    EXPECT_TRUE(again.is_new_session);
    EXPECT_NE(again.session_id, s.session_id);
}

TEST_F(SessionManagerTest, UpdateAdoptsEngineIdAndBecomesResumable) {
    auto s = manager_.get_or_create(1, "/work/app");
    clock_.advance(5s);

    auto updated = manager_.update_session(s.session_id, response_with("engine-1", 0.25, {"Read"}));
    ASSERT_TRUE(updated);
    EXPECT_EQ(updated->session_id, "engine-1");
    EXPECT_EQ(updated->message_count, 1);
    EXPECT_DOUBLE_EQ(updated->total_cost, 0.25);
    EXPECT_EQ(updated->last_used, clock_.now());
    EXPECT_FALSE(updated->is_new_session);
    EXPECT_FALSE(store_.get(s.session_id));

    auto resumed = manager_.find_resumable(1, "/work/app");
    ASSERT_TRUE(resumed);
    EXPECT_EQ(resumed->session_id, "engine-1");

    auto via_get = manager_.get_or_create(1, "/work/app");
    EXPECT_FALSE(via_get.is_new_session);
    EXPECT_EQ(via_get.session_id, "engine-1");
}

TEST_F(SessionManagerTest, FindResumableIsIdempotent) {
    finalized(1, "/work/app", "engine-1");
    auto first = manager_.find_resumable(1, "/work/app");
    auto second = manager_.find_resumable(1, "/work/app");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first->session_id, second->session_id);
}

TEST_F(SessionManagerTest, RealIdIsKeptOnLaterTurns) {
    finalized(1, "/work/app", "engine-1");
    auto updated = manager_.update_session("engine-1", response_with("engine-other"));
    ASSERT_TRUE(updated);
    EXPECT_EQ(updated->session_id, "engine-1");
    EXPECT_FALSE(store_.get("engine-other"));
}

TEST_F(SessionManagerTest, LatestSessionWins) {
    finalized(1, "/work/app", "older");
    clock_.advance(1min);
    finalized(1, "/work/app", "newer");

    EXPECT_EQ(manager_.find_resumable(1, "/work/app")->session_id, "newer");

    clock_.advance(1min);
    manager_.update_session("older", response_with(""));
    EXPECT_EQ(manager_.find_resumable(1, "/work/app")->session_id, "older");
}

TEST_F(SessionManagerTest, TieOnLastUsedGoesToLaterRow) {
    finalized(1, "/work/app", "first");
    finalized(1, "/work/app", "second");
    EXPECT_EQ(manager_.find_resumable(1, "/work/app")->session_id, "second");
}

TEST_F(SessionManagerTest, ResumeIsScopedToUserAndDirectory) {
    finalized(1, "/work/app", "engine-1");
    EXPECT_FALSE(manager_.find_resumable(2, "/work/app"));
    EXPECT_FALSE(manager_.find_resumable(1, "/work/other"));
    EXPECT_TRUE(manager_.find_resumable(1, "/work/app/"));
    EXPECT_TRUE(manager_.find_resumable(1, "/work/lib/../app"));
}

TEST_F(SessionManagerTest, ExpiredSessionsAreNotResumed) {
    finalized(1, "/work/app", "engine-1");
    clock_.advance(24h);
    EXPECT_TRUE(manager_.find_resumable(1, "/work/app"));

    clock_.advance(1s);
    EXPECT_FALSE(manager_.find_resumable(1, "/work/app"));
    EXPECT_TRUE(manager_.find_latest(1, "/work/app"));

    auto s = manager_.get_or_create(1, "/work/app");
    EXPECT_TRUE(s.is_new_session);
}

TEST_F(SessionManagerTest, ForceNewSkipsResume) {
    finalized(1, "/work/app", "engine-1");
    auto s = manager_.get_or_create(1, "/work/app", std::nullopt, true);
    EXPECT_TRUE(s.is_new_session);
    EXPECT_TRUE(s.is_placeholder());
}

TEST_F(SessionManagerTest, ExplicitIdIsLoaded) {
    finalized(1, "/work/app", "engine-1");
    finalized(1, "/work/app", "engine-2");

    auto s = manager_.get_or_create(1, "/work/app", std::string("engine-1"));
    EXPECT_EQ(s.session_id, "engine-1");
    EXPECT_FALSE(s.is_new_session);
}

TEST_F(SessionManagerTest, UnknownExplicitIdIsContinuedAnyway) {
    auto s = manager_.get_or_create(1, "/work/app", std::string("from-elsewhere"));
    EXPECT_EQ(s.session_id, "from-elsewhere");
    EXPECT_FALSE(s.is_new_session);
    EXPECT_EQ(s.message_count, 0);
    ASSERT_TRUE(store_.get("from-elsewhere"));
    EXPECT_EQ(store_.get("from-elsewhere")->user_id, 1);
}

TEST_F(SessionManagerTest, ExplicitIdOfAnotherUserStartsFresh) {
    finalized(1, "/work/app", "engine-1");
    auto s = manager_.get_or_create(2, "/work/app", std::string("engine-1"));
    EXPECT_TRUE(s.is_new_session);
    EXPECT_NE(s.session_id, "engine-1");
    EXPECT_EQ(store_.get("engine-1")->user_id, 1);
}

TEST_F(SessionManagerTest, PlaceholderExplicitIdFallsBackToResume) {
    finalized(1, "/work/app", "engine-1");
    auto s = manager_.get_or_create(1, "/work/app", std::string("temp_abc"));
    EXPECT_EQ(s.session_id, "engine-1");
}

TEST_F(SessionManagerTest, CallingUpdateTwiceDoubleCounts) {
    finalized(1, "/work/app", "engine-1");
    manager_.update_session("engine-1", response_with("engine-1", 0.5));
    auto s = manager_.update_session("engine-1", response_with("engine-1", 0.5));

    ASSERT_TRUE(s);
    EXPECT_EQ(s->message_count, 3);
    EXPECT_DOUBLE_EQ(s->total_cost, 1.0);
}

TEST_F(SessionManagerTest, NegativeCostDoesNotReduceTotal) {
    finalized(1, "/work/app", "engine-1");
    manager_.update_session("engine-1", response_with("", 0.75));
    auto s = manager_.update_session("engine-1", response_with("", -0.5));
    EXPECT_DOUBLE_EQ(s->total_cost, 0.75);
}

TEST_F(SessionManagerTest, ToolsAreUnioned) {
    finalized(1, "/work/app", "engine-1");
    manager_.update_session("engine-1", response_with("", 0, {"Read", "Bash", "Read"}));
    auto s = manager_.update_session("engine-1", response_with("", 0, {"Bash", "Edit"}));
    EXPECT_EQ(s->tools_used, (std::vector<std::string>{"Read", "Bash", "Edit"}));
}

TEST_F(SessionManagerTest, UpdateUnknownSessionReturnsNothing) {
    EXPECT_FALSE(manager_.update_session("nope", response_with("x")));
}

TEST_F(SessionManagerTest, AdoptingExistingIdMerges) {
    finalized(1, "/work/app", "engine-1");
    auto pending = manager_.get_or_create(1, "/work/app", std::nullopt, true);

    auto merged = manager_.update_session(pending.session_id, response_with("engine-1", 0.1, {"Grep"}));
    ASSERT_TRUE(merged);
    EXPECT_EQ(merged->session_id, "engine-1");
    EXPECT_EQ(merged->message_count, 2);
    EXPECT_EQ(merged->tools_used, std::vector<std::string>{"Grep"});
    EXPECT_FALSE(store_.get(pending.session_id));
    EXPECT_EQ(store_.list_by_user(1).size(), 1u);
}

TEST_F(SessionManagerTest, RemoveSession) {
    finalized(1, "/work/app", "engine-1");
    EXPECT_TRUE(manager_.remove_session("engine-1"));
    EXPECT_FALSE(manager_.remove_session("engine-1"));
    EXPECT_FALSE(manager_.find_resumable(1, "/work/app"));
}

TEST_F(SessionManagerTest, CleanupRemovesOnlyExpired) {
    finalized(1, "/work/app", "old");
    clock_.advance(20h);
    finalized(2, "/work/app", "recent");
    clock_.advance(5h);

    EXPECT_EQ(manager_.cleanup_expired_sessions(), 1u);
    EXPECT_FALSE(store_.get("old"));
    EXPECT_TRUE(store_.get("recent"));

    EXPECT_EQ(manager_.cleanup_expired_sessions(std::chrono::seconds(1h)), 1u);
    EXPECT_TRUE(store_.list_all().empty());
}

TEST_F(SessionManagerTest, PerUserLimitEvictsLeastRecentlyUsed) {
    SessionConfig c;
    c.max_sessions_per_user = 2;
    SessionManager limited(store_, c, clock_.fn());

    auto a = limited.get_or_create(1, "/work/a");
    clock_.advance(1s);
    auto b = limited.get_or_create(1, "/work/b");
    clock_.advance(1s);
    auto other = limited.get_or_create(2, "/work/a");
    clock_.advance(1s);
    auto c3 = limited.get_or_create(1, "/work/c");

    auto mine = store_.list_by_user(1);
    ASSERT_EQ(mine.size(), 2u);
    EXPECT_FALSE(store_.get(a.session_id));
    EXPECT_TRUE(store_.get(b.session_id));
    EXPECT_TRUE(store_.get(c3.session_id));
    EXPECT_TRUE(store_.get(other.session_id));
}

TEST_F(SessionManagerTest, BusySessionsAreNotEvicted) {
    SessionConfig c;
    c.max_sessions_per_user = 1;
    SessionManager limited(store_, c, clock_.fn());
    limited.set_busy_check([](int64_t, const std::string& project_path) {
        return project_path == "/work/a";
    });

    auto a = limited.get_or_create(1, "/work/a");
    clock_.advance(1s);
    auto b = limited.get_or_create(1, "/work/b");

    // Over the limit while /work/a is busy
    EXPECT_TRUE(store_.get(a.session_id));
    EXPECT_TRUE(store_.get(b.session_id));
    auto updated = limited.update_session(a.session_id, response_with("engine-a", 0.5));
    ASSERT_TRUE(updated);
    EXPECT_EQ(updated->message_count, 1);

    // Once idle, the next creation trims back to the limit
    limited.set_busy_check(nullptr);
    clock_.advance(1s);
    auto c3 = limited.get_or_create(1, "/work/c");
    ASSERT_EQ(store_.list_by_user(1).size(), 1u);
    EXPECT_TRUE(store_.get(c3.session_id));
}

TEST_F(SessionManagerTest, SessionInfoAndSummary) {
    finalized(1, "/work/app", "engine-1");
    manager_.update_session("engine-1", response_with("", 0.5));
    clock_.advance(30h);
    finalized(1, "/work/lib", "engine-2");

    auto info = manager_.get_session_info("engine-1");
    ASSERT_TRUE(info);
    EXPECT_EQ((*info)["session_id"], "engine-1");
    EXPECT_EQ((*info)["expired"], true);
    EXPECT_FALSE(manager_.get_session_info("missing"));

    auto summary = manager_.get_user_session_summary(1);
    EXPECT_EQ(summary["total_sessions"], 2);
    EXPECT_EQ(summary["active_sessions"], 1);
    EXPECT_EQ(summary["total_messages"], 3);
    EXPECT_DOUBLE_EQ(summary["total_cost"].get<double>(), 0.5);
    EXPECT_EQ(summary["projects"].size(), 2u);
}

#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "session/json_file_session_store.hpp"
#include "session/memory_session_store.hpp"
#include "test_helpers.hpp"

using namespace agentgate::session;
using agentgate::testing::TempDir;

namespace {

Session make_session(const std::string& id, int64_t user, const std::string& dir = "/work/app") {
    Session s;
    s.session_id = id;
    s.user_id = user;
    s.project_path = dir;
    s.created_at = from_epoch_ms(1700000000000);
    s.last_used = from_epoch_ms(1700000100000);
    return s;
}

} // namespace

TEST(InMemorySessionStore, CreateRejectsDuplicateIds) {
    InMemorySessionStore store;
    EXPECT_TRUE(store.create(make_session("s1", 1)));
    EXPECT_FALSE(store.create(make_session("s1", 2)));
    EXPECT_FALSE(store.create(make_session("", 2)));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get("s1")->user_id, 1);
}

TEST(InMemorySessionStore, RowIdsIncrease) {
    InMemorySessionStore store;
    store.create(make_session("b", 1));
    store.create(make_session("a", 1));
    store.create(make_session("c", 2));

    auto mine = store.list_by_user(1);
    ASSERT_EQ(mine.size(), 2u);
    EXPECT_EQ(mine[0].session_id, "b");
    EXPECT_EQ(mine[1].session_id, "a");
    EXPECT_LT(mine[0].row_id, mine[1].row_id);
    EXPECT_EQ(store.list_all().size(), 3u);
}

TEST(InMemorySessionStore, UpdateAppliesOnlySetFields) {
    InMemorySessionStore store;
    store.create(make_session("s1", 1));

    SessionPatch patch;
    patch.message_count = 4;
    patch.tools_used = std::vector<std::string>{"Read"};
    EXPECT_TRUE(store.update("s1", patch));

    auto s = store.get("s1");
    ASSERT_TRUE(s);
    EXPECT_EQ(s->message_count, 4);
    EXPECT_EQ(s->tools_used, std::vector<std::string>{"Read"});
    EXPECT_DOUBLE_EQ(s->total_cost, 0.0);
    EXPECT_FALSE(store.update("missing", patch));
}

TEST(InMemorySessionStore, UpdateCanRekey) {
    InMemorySessionStore store;
    store.create(make_session("temp-1", 1));
    store.create(make_session("taken", 1));
    const uint64_t row = store.get("temp-1")->row_id;

    SessionPatch collide;
    collide.session_id = "taken";
    EXPECT_FALSE(store.update("temp-1", collide));
    EXPECT_TRUE(store.get("temp-1"));

    SessionPatch rekey;
    rekey.session_id = "real-1";
    EXPECT_TRUE(store.update("temp-1", rekey));
    EXPECT_FALSE(store.get("temp-1"));
    ASSERT_TRUE(store.get("real-1"));
    EXPECT_EQ(store.get("real-1")->row_id, row);
}

TEST(InMemorySessionStore, EraseReportsWhetherRemoved) {
    InMemorySessionStore store;
    store.create(make_session("s1", 1));
    EXPECT_TRUE(store.erase("s1"));
    EXPECT_FALSE(store.erase("s1"));
    EXPECT_TRUE(store.list_all().empty());
}

TEST(JsonFileSessionStore, PersistsAcrossInstances) {
    TempDir dir;
    const auto file = dir.path() / "state" / "sessions.json";

    {
        JsonFileSessionStore store(file);
        Session s = make_session("s1", 1);
        s.total_cost = 1.25;
        s.message_count = 3;
        s.tools_used = {"Read", "Bash"};
        s.is_new_session = true;
        ASSERT_TRUE(store.create(s));
        ASSERT_TRUE(store.create(make_session("s2", 2)));
        ASSERT_TRUE(store.erase("s2"));
    }
    EXPECT_TRUE(std::filesystem::exists(file));
    EXPECT_FALSE(std::filesystem::exists(file.string() + ".tmp"));

    JsonFileSessionStore reopened(file);
    auto all = reopened.list_all();
    ASSERT_EQ(all.size(), 1u);
    const auto& s = all[0];
    EXPECT_EQ(s.session_id, "s1");
    EXPECT_EQ(s.user_id, 1);
    EXPECT_EQ(s.project_path, "/work/app");
    EXPECT_DOUBLE_EQ(s.total_cost, 1.25);
    EXPECT_EQ(s.message_count, 3);
    EXPECT_EQ(s.tools_used, (std::vector<std::string>{"Read", "Bash"}));
    EXPECT_EQ(to_epoch_ms(s.last_used), 1700000100000);
    EXPECT_FALSE(s.is_new_session);
}

TEST(JsonFileSessionStore, RowIdsContinueAfterReload) {
    TempDir dir;
    const auto file = dir.path() / "sessions.json";
    uint64_t first_row = 0;
    {
        JsonFileSessionStore store(file);
        store.create(make_session("s1", 1));
        first_row = store.get("s1")->row_id;
    }

    JsonFileSessionStore store(file);
    store.create(make_session("s2", 1));
    EXPECT_GT(store.get("s2")->row_id, first_row);
}

TEST(JsonFileSessionStore, RekeyIsPersisted) {
    TempDir dir;
    const auto file = dir.path() / "sessions.json";
    {
        JsonFileSessionStore store(file);
        store.create(make_session("temp-x", 1));
        SessionPatch patch;
        patch.session_id = "engine-x";
        patch.total_cost = 0.5;
        ASSERT_TRUE(store.update("temp-x", patch));
    }

    JsonFileSessionStore store(file);
    EXPECT_FALSE(store.get("temp-x"));
    ASSERT_TRUE(store.get("engine-x"));
    EXPECT_DOUBLE_EQ(store.get("engine-x")->total_cost, 0.5);
}

TEST(JsonFileSessionStore, CorruptFileThrows) {
    TempDir dir;
    auto file = dir.write("sessions.json", "{ not json");
    EXPECT_THROW(JsonFileSessionStore store(file), agentgate::SessionError);

    auto wrong_shape = dir.write("other.json", R"({"sessions": 5})");
    EXPECT_THROW(JsonFileSessionStore store(wrong_shape), agentgate::SessionError);
}

TEST(JsonFileSessionStore, MissingFileStartsEmpty) {
    TempDir dir;
    JsonFileSessionStore store(dir.path() / "none.json");
    EXPECT_TRUE(store.list_all().empty());
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "none.json"));
}

TEST(JsonFileSessionStore, FailedCreateLeavesNothingBehind) {
    TempDir dir;
    // A regular file where the parent directory should be
    dir.write("blocked", "");
    JsonFileSessionStore store(dir.path() / "blocked" / "sessions.json");

    EXPECT_THROW(store.create(make_session("s1", 1)), agentgate::SessionError);
    EXPECT_FALSE(store.get("s1"));
    EXPECT_EQ(store.size(), 0u);
}

TEST(JsonFileSessionStore, FailedUpdateAndEraseAreRolledBack) {
    TempDir dir;
    const auto state_dir = dir.mkdir("state");
    JsonFileSessionStore store(state_dir / "sessions.json");
    ASSERT_TRUE(store.create(make_session("s1", 1)));
    const uint64_t row = store.get("s1")->row_id;

    std::filesystem::remove_all(state_dir);
    dir.write("state", "");

    SessionPatch patch;
    patch.total_cost = 9.0;
    patch.message_count = 4;
    EXPECT_THROW(store.update("s1", patch), agentgate::SessionError);
    auto s = store.get("s1");
    ASSERT_TRUE(s);
    EXPECT_DOUBLE_EQ(s->total_cost, 0.0);
    EXPECT_EQ(s->message_count, 0);

    SessionPatch rekey;
    rekey.session_id = "engine-1";
    EXPECT_THROW(store.update("s1", rekey), agentgate::SessionError);
    EXPECT_FALSE(store.get("engine-1"));
    ASSERT_TRUE(store.get("s1"));
    EXPECT_EQ(store.get("s1")->row_id, row);

    EXPECT_THROW(store.erase("s1"), agentgate::SessionError);
    EXPECT_TRUE(store.get("s1"));
    EXPECT_EQ(store.size(), 1u);
}

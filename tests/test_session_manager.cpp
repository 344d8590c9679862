#include <gtest/gtest.h>
#include "client/session_manager.hpp"
#include "fakes.hpp"

using namespace relaysync;
using namespace relaysync::client;
using relaysync::testing::FakeSessionEndpoint;

namespace {

class SessionManagerTest : public ::testing::Test {
protected:
    SessionManagerTest() {
        auto owned = std::make_unique<FakeSessionEndpoint>();
        endpoint = owned.get();
        manager = std::make_unique<SessionManager>(std::move(owned));
    }

    FakeSessionEndpoint* endpoint = nullptr;
    std::unique_ptr<SessionManager> manager;
};

} // namespace

TEST_F(SessionManagerTest, StartsEmpty) {
    EXPECT_FALSE(manager->id().has_value());
    EXPECT_FALSE(manager->info().has_value());
    EXPECT_FALSE(manager->client_id().has_value());
    EXPECT_FALSE(manager->is_server_issued());
}

TEST_F(SessionManagerTest, CreateStoresServerIssuedSession) {
    bool called = false;
    manager->create({{"tutorial", "intro"}}, [&](std::expected<SessionInfo, SyncError> result) {
        called = true;
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result->id, "s-1");
    });
    EXPECT_EQ(endpoint->last_metadata()["tutorial"], "intro");

    endpoint->complete_create(FakeSessionEndpoint::session("s-1"));
    EXPECT_TRUE(called);
    EXPECT_EQ(manager->id(), std::optional<std::string>("s-1"));
    ASSERT_TRUE(manager->info().has_value());
    EXPECT_EQ(manager->info()->status, "active");
    EXPECT_TRUE(manager->is_server_issued());
}

TEST_F(SessionManagerTest, CreateFailureKeepsNoSession) {
    std::optional<SyncError> error;
    manager->create(nlohmann::json::object(), [&](std::expected<SessionInfo, SyncError> result) {
        if (!result) error = result.error();
    });
    endpoint->complete_create(std::unexpected(make_sync_error(SyncErrorType::SERVER_ERROR, "HTTP 500")));

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->type, SyncErrorType::SERVER_ERROR);
    EXPECT_FALSE(manager->id().has_value());
}

TEST_F(SessionManagerTest, CancelledResultsAreDropped) {
    bool called = false;
    manager->create(nlohmann::json::object(), [&](auto) { called = true; });
    manager->cancel_pending();
    EXPECT_EQ(endpoint->cancel_count(), 1);

    endpoint->complete_create(FakeSessionEndpoint::session("late"));
    EXPECT_FALSE(called);
    EXPECT_FALSE(manager->id().has_value());
}

TEST_F(SessionManagerTest, SuppliedSessionSurvivesClose) {
    manager->supply("host-session");
    manager->on_handshake("c-1", std::string("host-session"));
    EXPECT_EQ(manager->client_id(), std::optional<std::string>("c-1"));
    EXPECT_FALSE(manager->is_server_issued());

    manager->on_connection_lost();
    EXPECT_FALSE(manager->client_id().has_value());
    EXPECT_EQ(manager->id(), std::optional<std::string>("host-session"));

    manager->on_connection_closed();
    EXPECT_EQ(manager->id(), std::optional<std::string>("host-session"));
}

TEST_F(SessionManagerTest, ServerIssuedSessionIsConnectionScoped) {
    manager->on_handshake("c-1", std::string("relay-session"));
    EXPECT_EQ(manager->id(), std::optional<std::string>("relay-session"));
    EXPECT_TRUE(manager->is_server_issued());

    manager->on_connection_lost();
    EXPECT_EQ(manager->id(), std::optional<std::string>("relay-session"));

    manager->on_connection_closed();
    EXPECT_FALSE(manager->id().has_value());
    EXPECT_FALSE(manager->client_id().has_value());
}

TEST_F(SessionManagerTest, RelayMayMoveUsToAnotherSession) {
    manager->supply("wanted");
    manager->on_handshake("c-1", std::string("other"));
    EXPECT_EQ(manager->id(), std::optional<std::string>("other"));
    EXPECT_TRUE(manager->is_server_issued());
}

TEST_F(SessionManagerTest, RefreshUpdatesInfo) {
    manager->supply("s-9");
    std::optional<SessionInfo> seen;
    manager->refresh([&](std::expected<std::optional<SessionInfo>, SyncError> result) {
        ASSERT_TRUE(result.has_value());
        seen = *result;
    });
    EXPECT_EQ(endpoint->last_id(), "s-9");

    auto info = FakeSessionEndpoint::session("s-9");
    info.client_count = 2;
    endpoint->complete_get(std::optional<SessionInfo>(info));

    ASSERT_TRUE(seen.has_value());
    ASSERT_TRUE(manager->info().has_value());
    EXPECT_EQ(manager->info()->client_count, 2u);
}

TEST_F(SessionManagerTest, RefreshWithoutSessionAnswersEmpty) {
    bool empty = false;
    manager->refresh([&](std::expected<std::optional<SessionInfo>, SyncError> result) {
        empty = result.has_value() && !result->has_value();
    });
    EXPECT_TRUE(empty);
    EXPECT_EQ(endpoint->pending_gets(), 0u);
}

TEST_F(SessionManagerTest, RemoveClearsSession) {
    manager->supply("s-3");
    bool removed = false;
    manager->remove([&](std::expected<bool, SyncError> result) { removed = result.value_or(false); });
    EXPECT_EQ(endpoint->last_id(), "s-3");

    endpoint->complete_delete(true);
    EXPECT_TRUE(removed);
    EXPECT_FALSE(manager->id().has_value());
}

TEST_F(SessionManagerTest, ListPassesThrough) {
    size_t count = 0;
    manager->list([&](std::expected<std::vector<SessionInfo>, SyncError> result) {
        if (result) count = result->size();
    });
    endpoint->complete_list(std::vector<SessionInfo>{FakeSessionEndpoint::session("a"),
                                                     FakeSessionEndpoint::session("b")});
    EXPECT_EQ(count, 2u);
}

TEST(SessionInfoTest, JsonRoundTrip) {
    auto parsed = SessionInfo::from_json(nlohmann::json{
        {"id", "abc"}, {"clientCount", 2}, {"status", "active"}, {"activeClientId", "c-1"},
        {"metadata", {{"tutorial", "intro"}}}});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->id, "abc");
    EXPECT_EQ(parsed->client_count, 2u);
    EXPECT_EQ(parsed->active_client_id, std::optional<std::string>("c-1"));
    EXPECT_EQ(parsed->metadata["tutorial"], "intro");

    EXPECT_FALSE(SessionInfo::from_json(nlohmann::json{{"status", "active"}}).has_value());
}

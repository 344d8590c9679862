#include <gtest/gtest.h>
#include "client_fixture.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace relaysync;
using namespace relaysync::client;
using namespace relaysync::testing;

// ============================================================================
// Construction
// ============================================================================

TEST(RelayClientTest, FreshClientIsDisconnected) {
    boost::asio::io_context ioc;
    RelayClientConfig config;
    config.server_url = "ws://localhost:9999";
    RelayClient client(ioc, config);

    EXPECT_EQ(client.current_phase(), SyncPhase::DISCONNECTED);
    EXPECT_EQ(client.connection_status(), ConnectionStatus::DISCONNECTED);
    EXPECT_FALSE(client.session.id().has_value());
    EXPECT_FALSE(client.session.info().has_value());
    EXPECT_FALSE(client.tutorial.last_state().has_value());
    EXPECT_FALSE(client.client_id().has_value());
    EXPECT_FALSE(client.is.connected());
    EXPECT_FALSE(client.is.active());
    EXPECT_FALSE(client.is.passive());
    EXPECT_FALSE(client.is.idle());
}

TEST(RelayClientTest, RejectsUnusableServerUrl) {
    boost::asio::io_context ioc;
    RelayClientConfig config;
    EXPECT_THROW(std::make_unique<RelayClient>(ioc, config), std::invalid_argument);

    config.server_url = "localhost:9999";
    EXPECT_THROW(std::make_unique<RelayClient>(ioc, config), std::invalid_argument);

    config.server_url = "https://localhost:9999";
    EXPECT_THROW(std::make_unique<RelayClient>(ioc, config), std::invalid_argument);
}

// ============================================================================
// Phase-driven scenarios without a relay
// ============================================================================

class RelayClientPhaseTest : public RelayClientFixture {};

TEST_F(RelayClientPhaseTest, DrivingPhasesDirectly) {
    client->phases().set_phase(SyncPhase::CONNECTING, "start");
    client->phases().set_phase(SyncPhase::CONNECTED_IDLE, "open");
    client->phases().set_phase(SyncPhase::ACTIVE, "claim");

    EXPECT_EQ(client->current_phase(), SyncPhase::ACTIVE);
    EXPECT_TRUE(client->is.active());
    EXPECT_FALSE(client->is.passive());
    EXPECT_TRUE(client->is.connected());
}

TEST_F(RelayClientPhaseTest, PassiveCannotSendButMayRequest) {
    client->phases().set_phase(SyncPhase::CONNECTING, "start");
    client->phases().set_phase(SyncPhase::CONNECTED_IDLE, "open");
    client->phases().set_phase(SyncPhase::ACTIVE, "claim");
    client->phases().set_phase(SyncPhase::PASSIVE, "handoff");

    try {
        client->tutorial.send_state(sample_state());
        FAIL() << "send_state succeeded while passive";
    } catch (const SyncException& e) {
        EXPECT_NE(std::string(e.what()).find("active clients"), std::string::npos);
        EXPECT_EQ(e.type(), SyncErrorType::INVALID_OPERATION);
    }
    EXPECT_NO_THROW(client->tutorial.request_state());
}

TEST_F(RelayClientPhaseTest, SendStateNeedsActiveInEveryOtherPhase) {
    auto expect_rejected = [&]() {
        try {
            client->tutorial.send_state(sample_state());
            ADD_FAILURE() << "accepted in " << sync_phase_name(client->current_phase());
        } catch (const SyncException& e) {
            EXPECT_STREQ(e.what(), "Only active clients can send tutorial state");
        }
        EXPECT_FALSE(client->tutorial.last_state().has_value());
    };

    expect_rejected();
    client->phases().set_phase(SyncPhase::CONNECTING, "start");
    expect_rejected();
    client->phases().set_phase(SyncPhase::CONNECTED_IDLE, "open");
    expect_rejected();
    client->phases().set_phase(SyncPhase::PASSIVE, "follow");
    expect_rejected();
}

TEST_F(RelayClientPhaseTest, RequestStateNeedsConnection) {
    EXPECT_THROW(client->tutorial.request_state(), SyncException);
    client->phases().set_phase(SyncPhase::CONNECTING, "start");
    try {
        client->tutorial.request_state();
        FAIL() << "request_state succeeded while connecting";
    } catch (const SyncException& e) {
        EXPECT_STREQ(e.what(), "Not connected to relay server");
    }

    client->phases().set_phase(SyncPhase::CONNECTED_IDLE, "open");
    EXPECT_NO_THROW(client->tutorial.request_state());
    client->phases().set_phase(SyncPhase::ACTIVE, "claim");
    EXPECT_NO_THROW(client->tutorial.request_state());
    client->phases().set_phase(SyncPhase::PASSIVE, "handoff");
    EXPECT_NO_THROW(client->tutorial.request_state());
}

TEST_F(RelayClientPhaseTest, IllegalPhaseRequestLeavesPhase) {
    EXPECT_THROW(client->phases().set_phase(SyncPhase::ACTIVE, "skip"), SyncException);
    EXPECT_EQ(client->current_phase(), SyncPhase::DISCONNECTED);
}

// ============================================================================
// Connection lifecycle against a scripted relay
// ============================================================================

class RelayClientConnectionTest : public RelayClientFixture {};

TEST_F(RelayClientConnectionTest, HandshakeReachesIdle) {
    client->connect("s-1");
    EXPECT_EQ(transport->last_url(), "ws://localhost:9999/ws?session=s-1");
    EXPECT_EQ(client->current_phase(), SyncPhase::CONNECTING);

    transport->open();
    EXPECT_EQ(client->connection_status(), ConnectionStatus::CONNECTED);
    EXPECT_EQ(client->current_phase(), SyncPhase::CONNECTING);
    EXPECT_FALSE(client->is.connected());

    transport->emit_message(handshake_frame("c-42", "s-1"));
    EXPECT_EQ(client->current_phase(), SyncPhase::CONNECTED_IDLE);
    EXPECT_TRUE(client->is.idle());
    EXPECT_EQ(client->client_id(), std::optional<std::string>("c-42"));

    auto connected = events.all<ConnectedEvent>();
    ASSERT_EQ(connected.size(), 1u);
    EXPECT_EQ(connected[0].client_id, "c-42");
    EXPECT_EQ(connected[0].session_id, "s-1");

    auto phases = events.all<PhaseChangedEvent>();
    ASSERT_EQ(phases.size(), 2u);
    EXPECT_EQ(phases[0].phase, SyncPhase::CONNECTING);
    EXPECT_EQ(phases[1].phase, SyncPhase::CONNECTED_IDLE);
    EXPECT_EQ(phases[1].previous, SyncPhase::CONNECTING);
}

TEST_F(RelayClientConnectionTest, ConnectWithoutSessionCreatesOne) {
    client->connect();
    EXPECT_EQ(endpoint->pending_creates(), 1u);
    EXPECT_EQ(transport->connect_count(), 0);
    EXPECT_EQ(client->current_phase(), SyncPhase::DISCONNECTED);
    EXPECT_THROW(client->connect(), SyncException);

    endpoint->complete_create(FakeSessionEndpoint::session("fresh"));
    EXPECT_EQ(events.count<SessionCreatedEvent>(), 1u);
    EXPECT_EQ(client->session.id(), std::optional<std::string>("fresh"));
    EXPECT_EQ(transport->connect_count(), 1);
    EXPECT_EQ(transport->last_url(), "ws://localhost:9999/ws?session=fresh");
}

TEST_F(RelayClientConnectionTest, SessionCreationFailureIsReported) {
    client->connect();
    endpoint->complete_create(std::unexpected(make_sync_error(SyncErrorType::SERVER_ERROR, "HTTP 503")));

    EXPECT_EQ(events.errors_of(SyncErrorType::SERVER_ERROR), 1u);
    EXPECT_EQ(transport->connect_count(), 0);
    EXPECT_EQ(client->current_phase(), SyncPhase::DISCONNECTED);
    EXPECT_NO_THROW(client->connect("s-2"));
}

TEST_F(RelayClientConnectionTest, ConnectWhileConnectedThrows) {
    connect_as();
    try {
        client->connect("s-9");
        FAIL() << "second connect accepted";
    } catch (const SyncException& e) {
        EXPECT_EQ(e.type(), SyncErrorType::INVALID_OPERATION);
    }
    EXPECT_EQ(transport->connect_count(), 1);
}

TEST_F(RelayClientConnectionTest, DisconnectKeepsSuppliedSessionAndCachedState) {
    connect_as();
    client->sync.as_active();
    assign("ACTIVE");
    client->tutorial.send_state(sample_state(2));

    client->disconnect();
    EXPECT_EQ(client->current_phase(), SyncPhase::DISCONNECTED);
    EXPECT_FALSE(client->client_id().has_value());
    EXPECT_EQ(client->session.id(), std::optional<std::string>("s-1"));
    ASSERT_TRUE(client->tutorial.last_state().has_value());
    EXPECT_EQ(*client->tutorial.last_state(), sample_state(2));

    auto disconnected = events.all<DisconnectedEvent>();
    ASSERT_EQ(disconnected.size(), 1u);
    EXPECT_FALSE(disconnected[0].will_reconnect);

    EXPECT_NO_THROW(client->disconnect());
    EXPECT_EQ(events.count<DisconnectedEvent>(), 1u);
}

TEST_F(RelayClientConnectionTest, ServerIssuedSessionEndsWithDisconnect) {
    client->connect();
    endpoint->complete_create(FakeSessionEndpoint::session("srv-1"));
    transport->open();
    transport->emit_message(handshake_frame(ME, "srv-1"));
    ASSERT_TRUE(client->is.idle());

    client->disconnect();
    EXPECT_FALSE(client->session.id().has_value());
}

TEST_F(RelayClientConnectionTest, LossReconnectsToSameSession) {
    connect_as();
    transport->drop();

    EXPECT_EQ(client->current_phase(), SyncPhase::DISCONNECTED);
    EXPECT_FALSE(client->client_id().has_value());
    EXPECT_EQ(events.errors_of(SyncErrorType::CONNECTION_LOST), 1u);
    auto disconnected = events.all<DisconnectedEvent>();
    ASSERT_EQ(disconnected.size(), 1u);
    EXPECT_TRUE(disconnected[0].will_reconnect);
    auto reconnecting = events.all<ReconnectingEvent>();
    ASSERT_EQ(reconnecting.size(), 1u);
    EXPECT_EQ(reconnecting[0].attempt, 1u);

    drain(ioc);
    EXPECT_EQ(transport->connect_count(), 2);
    EXPECT_EQ(transport->last_url(), "ws://localhost:9999/ws?session=s-1");

    transport->open();
    transport->emit_message(handshake_frame("me-again", "s-1"));
    EXPECT_TRUE(client->is.idle());
    EXPECT_EQ(client->client_id(), std::optional<std::string>("me-again"));
}

TEST_F(RelayClientConnectionTest, GivesUpAfterMaxReconnectAttempts) {
    auto config = default_config();
    config.max_reconnect_attempts = 2;
    config.reconnect_delay = std::chrono::milliseconds(0);
    build(config);

    transport->set_auto_fail(true);
    client->connect("s-1");
    drain(ioc);

    EXPECT_EQ(transport->connect_count(), 3);
    EXPECT_EQ(events.errors_of(SyncErrorType::MAX_RECONNECT_ATTEMPTS_EXCEEDED), 1u);
    EXPECT_EQ(client->current_phase(), SyncPhase::DISCONNECTED);

    auto max_errors = events.all<ErrorEvent>();
    for (const auto& e : max_errors) {
        if (e.error.type == SyncErrorType::MAX_RECONNECT_ATTEMPTS_EXCEEDED) {
            EXPECT_FALSE(e.error.recoverable);
            EXPECT_TRUE(e.error.action.has_value());
        }
    }

    drain(ioc);
    EXPECT_EQ(transport->connect_count(), 3);
}

TEST_F(RelayClientConnectionTest, MalformedFramesAreReportedAndDropped) {
    connect_as();
    events.clear();

    transport->emit_message("{this is not json");
    transport->emit_message(R"({"type":"warp_drive","data":{}})");
    transport->emit_message(R"({"type":"state_update","data":{"tutorialId":42}})");

    EXPECT_EQ(events.errors_of(SyncErrorType::INVALID_MESSAGE), 3u);
    EXPECT_EQ(client->current_phase(), SyncPhase::CONNECTED_IDLE);
    EXPECT_EQ(client->connection_status(), ConnectionStatus::CONNECTED);
}

TEST_F(RelayClientConnectionTest, OtherProtocolVersionIsReported) {
    connect_as();
    transport->emit_message(R"({"type":"request_sync","clientId":"peer","protocol_version":7,"data":{}})");
    EXPECT_EQ(events.errors_of(SyncErrorType::PROTOCOL_VERSION), 1u);
    EXPECT_TRUE(client->is.idle());
}

TEST_F(RelayClientConnectionTest, HandlerExceptionsStayInside) {
    client.reset();
    auto config = default_config();
    config.event_handler = [](const RelayClientEvent&) { throw std::runtime_error("host bug"); };
    transport = std::make_shared<FakeTransport>(ioc);
    auto owned = std::make_unique<FakeSessionEndpoint>();
    endpoint = owned.get();
    client = std::make_unique<RelayClient>(ioc, config, transport, std::move(owned));

    EXPECT_NO_THROW(client->connect("s-1"));
    EXPECT_NO_THROW(transport->open());
    EXPECT_NO_THROW(transport->emit_message(handshake_frame(ME, "s-1")));
    EXPECT_NO_THROW(transport->emit_message("garbage"));
    EXPECT_TRUE(client->is.idle());
}

TEST_F(RelayClientConnectionTest, PeerPresenceAndServerErrors) {
    connect_as();
    deliver("client_connected", "", {{"clientId", PEER}});
    deliver("client_disconnected", "", {{"clientId", PEER}});
    deliver("error", "", {{"message", "Session is full"}, {"code", "SESSION_FULL"}});

    auto joined = events.all<ClientConnectedEvent>();
    ASSERT_EQ(joined.size(), 1u);
    EXPECT_EQ(joined[0].client_id, PEER);
    EXPECT_EQ(events.count<ClientDisconnectedEvent>(), 1u);

    auto errors = events.all<ErrorEvent>();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error.type, SyncErrorType::SERVER_ERROR);
    EXPECT_EQ(errors[0].error.message, "Session is full");
}

TEST_F(RelayClientConnectionTest, OutgoingFramesCarryClientId) {
    connect_as();
    client->tutorial.request_state();

    auto requests = sent(protocol::MessageType::REQUEST_SYNC);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].client_id, ME);
    EXPECT_EQ(requests[0].protocol_version, protocol::PROTOCOL_VERSION);
    EXPECT_GT(requests[0].timestamp, 0);
}

// ============================================================================
// Session operations
// ============================================================================

class RelayClientSessionTest : public RelayClientFixture {};

TEST_F(RelayClientSessionTest, CreateOnlyWhileDisconnected) {
    client->session.create({{"tutorial", "intro"}});
    EXPECT_EQ(endpoint->last_metadata()["tutorial"], "intro");
    endpoint->complete_create(FakeSessionEndpoint::session("made"));
    EXPECT_EQ(client->session.id(), std::optional<std::string>("made"));
    EXPECT_EQ(events.count<SessionCreatedEvent>(), 1u);

    client->connect();
    EXPECT_EQ(transport->last_url(), "ws://localhost:9999/ws?session=made");
    EXPECT_THROW(client->session.create(), SyncException);
}

TEST_F(RelayClientSessionTest, RemoveDeletesAndDisconnects) {
    connect_as();
    bool removed = false;
    client->session.remove([&](std::expected<bool, SyncError> result) { removed = result.value_or(false); });
    EXPECT_EQ(endpoint->last_id(), "s-1");

    endpoint->complete_delete(true);
    EXPECT_TRUE(removed);
    EXPECT_FALSE(client->session.id().has_value());
    EXPECT_EQ(client->current_phase(), SyncPhase::DISCONNECTED);
    auto disconnected = events.all<DisconnectedEvent>();
    ASSERT_EQ(disconnected.size(), 1u);
    EXPECT_EQ(disconnected[0].reason, "Session removed");
}

TEST_F(RelayClientSessionTest, RefreshAndList) {
    connect_as();
    client->session.refresh([](auto) {});
    auto info = FakeSessionEndpoint::session("s-1");
    info.client_count = 2;
    endpoint->complete_get(std::optional<SessionInfo>(info));
    ASSERT_TRUE(client->session.info().has_value());
    EXPECT_EQ(client->session.info()->client_count, 2u);

    size_t listed = 0;
    client->session.list([&](std::expected<std::vector<SessionInfo>, SyncError> result) {
        if (result) listed = result->size();
    });
    endpoint->complete_list(std::vector<SessionInfo>{info});
    EXPECT_EQ(listed, 1u);
}

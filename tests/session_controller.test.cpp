#include <catch2/catch_all.hpp>
#include "remotectl/core/controller/session_controller.hpp"
#include "remotectl/core/strategies/linear_backoff.hpp"
#include "peer_harness.hpp"

namespace {

    struct ControllerHarness {
        std::shared_ptr<MockTransport>   transport = std::make_shared<MockTransport>();
        std::shared_ptr<ManualScheduler> scheduler = std::make_shared<ManualScheduler>();
        SessionController                controller;

        std::vector<SessionSnapshot> snapshots;
        std::vector<RemoteCommand>   commands;

        explicit ControllerHarness(ControllerOptions options = {})
            : controller(transport, scheduler, DeviceIdentity{ "Phone", "android" }, options, PeerOptions{}, lanInterfaces) {
            controller.setSnapshotCallback([this](const SessionSnapshot& s) { snapshots.push_back(s); });
            controller.setCommandCallback([this](const RemoteCommand& c) { commands.push_back(c); });
        }

        /// Join and complete the handshake; returns the connection id.
        ConnectionId joinAndAuthenticate() {
            auto join = controller.joinSession("abcd1234", "123456", "192.168.1.20");
            ConnectionId id = transport->lastConnectId;
            transport->open(id);
            transport->deliver(id, Frame{ AuthSuccessFrame{} });
            join.get();
            return id;
        }

        /// Let the next reconnect timer fire and fail the dial it starts.
        void failNextAttempt(std::chrono::milliseconds delay) {
            const auto before = transport->dialled.size();
            scheduler->advance(delay);
            REQUIRE(transport->dialled.size() == before + 1);
            transport->drop(transport->lastConnectId, 1006, "unreachable");
        }

        void deliverCommand(ConnectionId id, const RemoteCommand& c) {
            transport->deliver(id, transport->codec.encode(c));
        }
    };

}

TEST_CASE("Joining tracks status and the host's identity", "[controller]") {
    ControllerHarness h;
    auto join = h.controller.joinSession("abcd1234", "123456", "192.168.1.20");

    auto s = h.controller.snapshot();
    REQUIRE(s.role == SessionRole::Remote);
    REQUIRE(s.status == SessionStatus::Connecting);
    REQUIRE(s.sessionId == "ABCD1234");

    ConnectionId id = h.transport->lastConnectId;
    h.transport->open(id);
    h.transport->deliver(id, Frame{ AuthSuccessFrame{} });
    REQUIRE_NOTHROW(join.get());

    s = h.controller.snapshot();
    REQUIRE(s.isConnected());
    REQUIRE(s.connectedDevice == RemoteDevice{ "host", "Desktop", "desktop" });

    h.deliverCommand(id, RemoteCommand(CommandType::DeviceInfo, {
        { "id", std::string("host-ABCD1234") }, { "name", std::string("Living Room") }, { "platform", std::string("linux") } }));
    REQUIRE(h.controller.snapshot().connectedDevice == RemoteDevice{ "host-ABCD1234", "Living Room", "linux" });
    REQUIRE(h.commands.empty());
}

TEST_CASE("deviceInfo without fields falls back to placeholders", "[controller]") {
    ControllerHarness h;
    auto id = h.joinAndAuthenticate();
    h.deliverCommand(id, RemoteCommand(CommandType::DeviceInfo));
    REQUIRE(h.controller.snapshot().connectedDevice == RemoteDevice{ "unknown", "Unknown Device", "unknown" });
}

TEST_CASE("syncState updates the player flag and is not forwarded", "[controller]") {
    ControllerHarness h;
    auto id = h.joinAndAuthenticate();

    h.deliverCommand(id, RemoteCommand(CommandType::SyncState, { { "playerActive", true } }));
    REQUIRE(h.controller.snapshot().playerActive);

    h.deliverCommand(id, RemoteCommand(CommandType::SyncState));
    REQUIRE_FALSE(h.controller.snapshot().playerActive);
    REQUIRE(h.commands.empty());
}

TEST_CASE("Liveness traffic is filtered, playback commands are forwarded", "[controller]") {
    ControllerHarness h;
    auto id = h.joinAndAuthenticate();

    h.deliverCommand(id, RemoteCommand(CommandType::Ping));
    h.deliverCommand(id, RemoteCommand(CommandType::Pong));
    h.deliverCommand(id, RemoteCommand(CommandType::Ack));
    h.deliverCommand(id, RemoteCommand(CommandType::Pause));
    h.deliverCommand(id, RemoteCommand::fromName("toggleSubtitles"));

    REQUIRE(h.commands.size() == 2);
    REQUIRE(h.commands[0].type() == CommandType::Pause);
    REQUIRE(h.commands[1].name() == "toggleSubtitles");
}

TEST_CASE("sendCommand is refused until connected", "[controller]") {
    ControllerHarness h;
    REQUIRE_FALSE(h.controller.sendCommand(CommandType::Play));

    auto id = h.joinAndAuthenticate();
    h.transport->clearSent();
    REQUIRE(h.controller.sendCommand(CommandType::Seek, { { "position", std::int64_t{ 5000 } } }));
    REQUIRE(h.transport->typesTo(id) == std::vector<std::string>{ "seek" });
}

TEST_CASE("A lost host is redialled with exponential backoff", "[controller][reconnect]") {
    ControllerHarness h;
    auto id = h.joinAndAuthenticate();

    h.transport->drop(id, 1006, "network changed");

    auto s = h.controller.snapshot();
    REQUIRE(s.status == SessionStatus::Reconnecting);
    REQUIRE(s.reconnectAttempts == 1);
    REQUIRE_FALSE(s.connectedDevice.has_value());

    h.scheduler->advance(999ms);
    REQUIRE(h.transport->dialled.size() == 1);

    h.transport->clearSent();
    h.scheduler->advance(1ms);
    REQUIRE(h.transport->dialled.size() == 2);
    REQUIRE(h.transport->dialled.back() == Endpoint{ "192.168.1.20", 48632, "/ws", false });

    // first attempt fails: the second one waits two seconds
    h.transport->drop(h.transport->lastConnectId, 1006, "unreachable");
    s = h.controller.snapshot();
    REQUIRE(s.status == SessionStatus::Reconnecting);
    REQUIRE(s.reconnectAttempts == 2);
    REQUIRE(s.errorMessage.has_value());

    h.scheduler->advance(1999ms);
    REQUIRE(h.transport->dialled.size() == 2);
    h.scheduler->advance(1ms);
    REQUIRE(h.transport->dialled.size() == 3);

    ConnectionId retry = h.transport->lastConnectId;
    h.transport->open(retry);
    auto auth = h.transport->framesTo(retry);
    REQUIRE(std::get<AuthFrame>(auth.at(0)).sessionId == "ABCD1234");
    h.transport->deliver(retry, Frame{ AuthSuccessFrame{} });

    s = h.controller.snapshot();
    REQUIRE(s.status == SessionStatus::Connected);
    REQUIRE(s.reconnectAttempts == 0);
    REQUIRE_FALSE(s.errorMessage.has_value());
    REQUIRE(h.controller.sendCommand(CommandType::Play));
}

TEST_CASE("Reconnect gives up after five failed attempts", "[controller][reconnect]") {
    ControllerHarness h;
    auto id = h.joinAndAuthenticate();
    h.transport->drop(id);

    h.failNextAttempt(1s);
    h.failNextAttempt(2s);
    h.failNextAttempt(4s);
    h.failNextAttempt(8s);
    h.failNextAttempt(16s);

    auto s = h.controller.snapshot();
    REQUIRE(s.status == SessionStatus::Error);
    REQUIRE(s.errorMessage == "Connection lost after 5 attempts");
    REQUIRE(h.transport->dialled.size() == 6);

    h.scheduler->advance(120s);
    REQUIRE(h.transport->dialled.size() == 6);
}

TEST_CASE("Reconnect honours a custom backoff strategy and attempt limit", "[controller][reconnect]") {
    ControllerOptions options;
    options.maxReconnectAttempts = 2;
    options.backoffStrategy = std::make_shared<LinearBackoff>(500ms, 5s);
    ControllerHarness h(options);

    auto id = h.joinAndAuthenticate();
    h.transport->drop(id);

    h.failNextAttempt(500ms);
    h.failNextAttempt(1000ms);

    REQUIRE(h.controller.snapshot().errorMessage == "Connection lost after 2 attempts");
    REQUIRE(h.controller.snapshot().status == SessionStatus::Error);
}

TEST_CASE("Rejected credentials stop reconnecting", "[controller][reconnect]") {
    ControllerHarness h;
    auto id = h.joinAndAuthenticate();
    h.transport->drop(id);

    h.scheduler->advance(1s);
    ConnectionId retry = h.transport->lastConnectId;
    h.transport->open(retry);
    h.transport->deliver(retry, Frame{ AuthFailedFrame{ "Invalid session ID or PIN" } });

    auto s = h.controller.snapshot();
    REQUIRE(s.status == SessionStatus::Error);
    REQUIRE(s.errorMessage == "Invalid session ID or PIN");

    const auto dials = h.transport->dialled.size();
    h.scheduler->advance(60s);
    REQUIRE(h.transport->dialled.size() == dials);
}

TEST_CASE("Being replaced by another controller ends the session", "[controller][reconnect]") {
    ControllerHarness h;
    auto id = h.joinAndAuthenticate();

    h.transport->drop(id, close_code::Replaced, "Replaced by new connection");

    auto s = h.controller.snapshot();
    REQUIRE(s.status == SessionStatus::Disconnected);
    REQUIRE(s.errorMessage == "Replaced by another controller");
    REQUIRE(s.reconnectAttempts == 0);
    REQUIRE_FALSE(s.isConnected());

    h.scheduler->advance(60s);
    REQUIRE(h.transport->dialled.size() == 1);
}

TEST_CASE("Rejection and rate-limit closes are not redialled", "[controller][reconnect]") {
    auto [code, message] = GENERATE(table<int, std::string>({
        { close_code::InvalidCredentials, "Invalid session ID or PIN" },
        { close_code::RateLimited,        "Too many attempts. Try again later." } }));
    ControllerHarness h;
    auto id = h.joinAndAuthenticate();

    h.transport->drop(id, code, "closed by host");

    auto s = h.controller.snapshot();
    REQUIRE(s.status == SessionStatus::Disconnected);
    REQUIRE(s.errorMessage == message);
    h.scheduler->advance(60s);
    REQUIRE(h.transport->dialled.size() == 1);
}

TEST_CASE("retryReconnectNow skips the backoff wait", "[controller][reconnect]") {
    ControllerHarness h;
    REQUIRE_THROWS_AS(h.controller.retryReconnectNow(), RemotePeerError);

    auto id = h.joinAndAuthenticate();
    h.transport->drop(id);
    REQUIRE(h.transport->dialled.size() == 1);

    h.controller.retryReconnectNow();
    REQUIRE(h.transport->dialled.size() == 2);
    REQUIRE(h.controller.snapshot().status == SessionStatus::Reconnecting);

    // the pending backoff timer was dropped
    h.scheduler->advance(1s);
    REQUIRE(h.transport->dialled.size() == 2);
}

TEST_CASE("cancelReconnect stops redialling", "[controller][reconnect]") {
    ControllerHarness h;
    auto id = h.joinAndAuthenticate();
    h.transport->drop(id);

    h.controller.cancelReconnect();

    REQUIRE(h.controller.snapshot().status == SessionStatus::Disconnected);
    h.scheduler->advance(60s);
    REQUIRE(h.transport->dialled.size() == 1);
}

TEST_CASE("leaveSession is intentional and clears the snapshot", "[controller]") {
    ControllerHarness h;
    auto id = h.joinAndAuthenticate();

    h.controller.leaveSession();

    auto s = h.controller.snapshot();
    REQUIRE_FALSE(s.role.has_value());
    REQUIRE(s.status == SessionStatus::Disconnected);
    REQUIRE_FALSE(s.sessionId.has_value());
    REQUIRE(h.transport->lastClose(id)->code == close_code::Normal);

    h.transport->confirmClose(id);
    h.scheduler->advance(60s);
    REQUIRE(h.transport->dialled.size() == 1);
    REQUIRE(h.controller.snapshot().status == SessionStatus::Disconnected);
}

TEST_CASE("Host waits for its controller to come back", "[controller][host]") {
    ControllerHarness h;
    auto info = h.controller.createSession();

    auto s = h.controller.snapshot();
    REQUIRE(s.role == SessionRole::Host);
    REQUIRE(s.status == SessionStatus::Connecting);
    REQUIRE(s.sessionId == info.sessionId);
    REQUIRE(s.pin == info.pin);
    REQUIRE(s.hostAddress == info.address);

    auto a = h.transport->accept();
    h.transport->deliver(a, Frame{ AuthFrame{ info.sessionId, info.pin, "Tablet", "android" } });
    s = h.controller.snapshot();
    REQUIRE(s.status == SessionStatus::Connected);
    REQUIRE(s.connectedDevice == RemoteDevice{ "remote-client", "Tablet", "android" });

    h.transport->drop(a);
    s = h.controller.snapshot();
    REQUIRE(s.status == SessionStatus::Reconnecting);
    REQUIRE_FALSE(s.connectedDevice.has_value());
    REQUIRE(h.transport->listening);
    REQUIRE(h.transport->dialled.empty());

    auto b = h.transport->accept();
    h.transport->deliver(b, Frame{ AuthFrame{ info.sessionId, info.pin, "Tablet", "android" } });
    REQUIRE(h.controller.snapshot().status == SessionStatus::Connected);
}

TEST_CASE("Failed hosting surfaces the error in the snapshot", "[controller][host]") {
    ControllerHarness h;
    h.transport->failingPorts = { 48632, 0 };

    REQUIRE_THROWS_AS(h.controller.createSession(), RemotePeerError);
    auto s = h.controller.snapshot();
    REQUIRE(s.status == SessionStatus::Error);
    REQUIRE(s.errorMessage.has_value());
}

TEST_CASE("A throwing application callback does not break the session", "[controller]") {
    ControllerHarness h;
    auto id = h.joinAndAuthenticate();
    h.controller.setCommandCallback([](const RemoteCommand&) { throw std::runtime_error("ui gone"); });

    h.deliverCommand(id, RemoteCommand(CommandType::Play));
    REQUIRE(h.controller.snapshot().isConnected());
}

#include <catch2/catch_all.hpp>
#include "peer_harness.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <future>

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string wrongPin(const std::string& pin) {
        return pin == "000000" ? "111111" : "000000";
    }
}

TEST_CASE("createSession binds the preferred port and reports connecting", "[peer][host]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");

    REQUIRE(info.sessionId.size() == 8);
    REQUIRE(std::all_of(info.sessionId.begin(), info.sessionId.end(),
                        [](char c) { return std::isupper(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)); }));
    REQUIRE(info.pin.size() == 6);
    REQUIRE(std::all_of(info.pin.begin(), info.pin.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }));
    REQUIRE(info.address == "192.168.1.20:48632");

    REQUIRE(h.transport->listenCalls == std::vector<uint16_t>{ 48632 });
    REQUIRE(h.transport->listenPath == "/ws");
    REQUIRE(h.peer->isHost());
    REQUIRE(h.peer->myPeerId() == "host-" + info.sessionId);
    REQUIRE(h.peer->hostAddress() == info.address);
    REQUIRE_FALSE(h.peer->isConnected());
    REQUIRE(h.states == std::vector<SessionStatus>{ SessionStatus::Connecting });
}

TEST_CASE("createSession falls back to an OS-assigned port silently", "[peer][host]") {
    PeerHarness h;
    h.transport->failingPorts = { 48632 };

    auto info = h.peer->createSession("Living Room", "linux");

    REQUIRE(h.transport->listenCalls == std::vector<uint16_t>{ 48632, 0 });
    REQUIRE(info.address == "192.168.1.20:50123");
    REQUIRE(h.errors.empty());
}

TEST_CASE("createSession throws ServerError when both binds fail", "[peer][host]") {
    PeerHarness h;
    h.transport->failingPorts = { 48632, 0 };

    try {
        h.peer->createSession("Living Room", "linux");
        FAIL("expected ServerError");
    } catch (const RemotePeerError& e) {
        REQUIRE(e.kind() == PeerErr::ServerError);
    }
    REQUIRE_FALSE(h.peer->role().has_value());
    REQUIRE_FALSE(h.peer->sessionId().has_value());
}

TEST_CASE("createSession without a LAN interface throws NetworkError and stops listening", "[peer][host]") {
    PeerHarness h([] { return std::vector<InterfaceAddress>{ { "lo", "127.0.0.1", true } }; });

    try {
        h.peer->createSession("Living Room", "linux");
        FAIL("expected NetworkError");
    } catch (const RemotePeerError& e) {
        REQUIRE(e.kind() == PeerErr::NetworkError);
        REQUIRE(e.message() == "No network interface found");
    }
    REQUIRE_FALSE(h.transport->listening);
    REQUIRE(h.errors.size() == 1);
    REQUIRE(h.errors[0].kind() == PeerErr::NetworkError);
}

TEST_CASE("createSession on a transport without listening support touches no socket", "[peer][host]") {
    PeerHarness h;
    h.transport->hosting = false;

    try {
        h.peer->createSession("Phone", "ios");
        FAIL("expected ServerError");
    } catch (const RemotePeerError& e) {
        REQUIRE(e.kind() == PeerErr::ServerError);
        REQUIRE(e.message() == "Hosting is not supported on this platform");
    }
    REQUIRE(h.transport->listenCalls.empty());
    REQUIRE(h.transport->dialled.empty());
}

TEST_CASE("disconnect while createSession is binding stops the new listener", "[peer][host]") {
    PeerHarness h;
    h.transport->onListen = [&](uint16_t) { h.peer->disconnect(); };

    try {
        h.peer->createSession("Living Room", "linux");
        FAIL("expected ServerError");
    } catch (const RemotePeerError& e) {
        REQUIRE(e.kind() == PeerErr::ServerError);
        REQUIRE(e.message() == "Session creation was cancelled");
    }
    REQUIRE_FALSE(h.transport->listening);
    REQUIRE(h.transport->stopListeningCalls == 1);
    REQUIRE_FALSE(h.peer->role().has_value());
}

TEST_CASE("An overlapping createSession keeps the newer listener", "[peer][host]") {
    PeerHarness h;
    std::atomic<int> binds{ 0 };
    std::promise<void> secondBinding, releaseSecond;
    auto secondStarted = secondBinding.get_future();
    auto released = releaseSecond.get_future().share();
    std::future<SessionInfo> second;

    h.transport->onListen = [&](uint16_t) {
        if (++binds == 1) {
            second = std::async(std::launch::async, [&] { return h.peer->createSession("Bedroom", "linux"); });
            secondStarted.wait();
        } else {
            secondBinding.set_value();
            released.wait();
        }
    };

    // the first call resolves while the second is still binding
    REQUIRE_THROWS_AS(h.peer->createSession("Living Room", "linux"), RemotePeerError);
    REQUIRE(h.transport->stopListeningCalls == 0);

    releaseSecond.set_value();
    auto info = second.get();
    REQUIRE(h.peer->isHost());
    REQUIRE(h.peer->sessionId() == info.sessionId);
    REQUIRE(h.transport->listening);
    REQUIRE(h.transport->stopListeningCalls == 0);
}

TEST_CASE("A cancelled bind is released when the newer createSession fails", "[peer][host]") {
    PeerHarness h;
    std::atomic<int> binds{ 0 };
    std::promise<void> secondBinding, releaseSecond;
    auto secondStarted = secondBinding.get_future();
    auto released = releaseSecond.get_future().share();
    std::future<SessionInfo> second;

    h.transport->onListen = [&](uint16_t) {
        const int n = ++binds;
        if (n == 1) {
            second = std::async(std::launch::async, [&] { return h.peer->createSession("Bedroom", "linux"); });
            secondStarted.wait();
        } else if (n == 2) {
            secondBinding.set_value();
            released.wait();
        }
    };

    REQUIRE_THROWS_AS(h.peer->createSession("Living Room", "linux"), RemotePeerError);
    REQUIRE(h.transport->listening);

    h.transport->failingPorts = { 48632, 0 };
    releaseSecond.set_value();
    try {
        second.get();
        FAIL("expected ServerError");
    } catch (const RemotePeerError& e) {
        REQUIRE(e.kind() == PeerErr::ServerError);
    }
    REQUIRE_FALSE(h.transport->listening);
    REQUIRE(h.transport->stopListeningCalls == 1);
    REQUIRE_FALSE(h.peer->role().has_value());
}

TEST_CASE("createSession regenerates credentials and resets the failure counter", "[peer][host]") {
    PeerHarness h;
    auto first = h.peer->createSession("Living Room", "linux");
    h.authenticate(first.sessionId, wrongPin(first.pin));
    REQUIRE(h.peer->failedAuthAttempts() == 1);

    auto second = h.peer->createSession("Living Room", "linux");
    REQUIRE(h.peer->failedAuthAttempts() == 0);
    REQUIRE(h.transport->stopListeningCalls >= 1);
    REQUIRE(h.peer->sessionId() == second.sessionId);
}

TEST_CASE("Lower-case session id authenticates with exactly one deviceConnected", "[peer][host][auth]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");

    auto id = h.authenticate(lower(info.sessionId), info.pin);

    REQUIRE(h.connected.size() == 1);
    REQUIRE(h.connected[0] == RemoteDevice{ "remote-client", "Phone", "android" });
    REQUIRE(h.peer->isConnected());
    REQUIRE(h.peer->status() == SessionStatus::Connected);
    REQUIRE(h.transport->typesTo(id) == std::vector<std::string>{ "authSuccess", "deviceInfo" });

    auto frames = h.transport->framesTo(id);
    const auto& info2 = std::get<RemoteCommand>(frames[1]);
    REQUIRE(info2.getString("id") == "host-" + info.sessionId);
    REQUIRE(info2.getString("name") == "Living Room");
    REQUIRE(info2.getString("platform") == "linux");
    REQUIRE(info2.getString("role") == "host");
    REQUIRE_FALSE(h.transport->lastClose(id).has_value());
}

TEST_CASE("Missing device name and platform get placeholders", "[peer][host][auth]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");
    h.authenticate(info.sessionId, info.pin, "", "");

    REQUIRE(h.connected.size() == 1);
    REQUIRE(h.connected[0] == RemoteDevice{ "remote-client", "Unknown Device", "unknown" });
}

TEST_CASE("Four wrong PINs do not lock out", "[peer][host][auth]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");

    for (int i = 0; i < 4; ++i) {
        auto id = h.authenticate(info.sessionId, wrongPin(info.pin));
        auto frames = h.transport->framesTo(id);
        REQUIRE(frames.size() == 1);
        REQUIRE(std::get<AuthFailedFrame>(frames[0]).message == "Invalid session ID or PIN");
        REQUIRE(h.transport->lastClose(id)->code == close_code::InvalidCredentials);
    }
    REQUIRE(h.peer->failedAuthAttempts() == 4);

    auto ok = h.authenticate(info.sessionId, info.pin);
    REQUIRE(h.transport->typesTo(ok).front() == "authSuccess");
    REQUIRE(h.peer->failedAuthAttempts() == 0);
}

TEST_CASE("Fifth failure locks out even correct credentials for 30 seconds", "[peer][host][auth]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");

    for (int i = 0; i < 5; ++i) h.authenticate(info.sessionId, wrongPin(info.pin));
    REQUIRE(h.peer->failedAuthAttempts() == 5);

    auto blocked = h.authenticate(info.sessionId, info.pin);
    auto frames = h.transport->framesTo(blocked);
    REQUIRE(frames.size() == 1);
    REQUIRE(std::get<AuthFailedFrame>(frames[0]).message == "Too many attempts. Try again later.");
    REQUIRE(h.transport->lastClose(blocked)->code == close_code::RateLimited);
    REQUIRE(h.peer->failedAuthAttempts() == 5);
    REQUIRE(h.connected.empty());

    h.scheduler->advance(29s);
    auto stillBlocked = h.authenticate(info.sessionId, info.pin);
    REQUIRE(h.transport->lastClose(stillBlocked)->code == close_code::RateLimited);

    h.scheduler->advance(2s);
    auto ok = h.authenticate(info.sessionId, info.pin);
    REQUIRE(h.transport->typesTo(ok).front() == "authSuccess");
    REQUIRE(h.connected.size() == 1);
}

TEST_CASE("A second controller evicts the first", "[peer][host][auth]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");

    auto a = h.authenticate(info.sessionId, info.pin, "Phone A");
    auto b = h.authenticate(info.sessionId, info.pin, "Phone B");

    auto closeA = h.transport->lastClose(a);
    REQUIRE(closeA);
    REQUIRE(closeA->code == close_code::Replaced);
    REQUIRE(closeA->reason == "Replaced by new connection");
    REQUIRE(h.connected.size() == 2);

    // the evicted socket's close is silent
    h.transport->confirmClose(a);
    REQUIRE(h.disconnected == 0);
    REQUIRE(h.peer->isConnected());

    h.transport->clearSent();
    h.peer->sendCommand(RemoteCommand(CommandType::SyncState, { { "playerActive", true } }));
    REQUIRE(h.transport->textsTo(a).empty());
    REQUIRE(h.transport->typesTo(b) == std::vector<std::string>{ "syncState" });

    h.transport->drop(b, 1001);
    REQUIRE(h.disconnected == 1);
    REQUIRE(h.peer->status() == SessionStatus::Disconnected);
    REQUIRE_FALSE(h.peer->isConnected());
    // still hosting: the next controller can come in
    REQUIRE(h.peer->role() == SessionRole::Host);
    auto c = h.authenticate(info.sessionId, info.pin);
    REQUIRE(h.transport->typesTo(c).front() == "authSuccess");
}

TEST_CASE("Unauthenticated connection is closed after the auth timeout", "[peer][host][auth]") {
    PeerHarness h;
    h.peer->createSession("Living Room", "linux");

    auto id = h.transport->accept();
    h.scheduler->advance(9s);
    REQUIRE_FALSE(h.transport->lastClose(id).has_value());

    h.scheduler->advance(1s);
    auto c = h.transport->lastClose(id);
    REQUIRE(c);
    REQUIRE(c->code == close_code::AuthTimeout);
    REQUIRE(h.connected.empty());
    REQUIRE(h.errors.empty());
}

TEST_CASE("Auth timeout is cancelled by a successful auth", "[peer][host][auth]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");
    auto id = h.authenticate(info.sessionId, info.pin);

    h.scheduler->advance(30s);
    REQUIRE_FALSE(h.transport->lastClose(id).has_value());
    REQUIRE(h.peer->isConnected());
}

TEST_CASE("A non-auth first frame is rejected with 4002", "[peer][host][auth]") {
    PeerHarness h;
    h.peer->createSession("Living Room", "linux");

    auto id = h.transport->accept();
    h.sendCommandFrom(id, RemoteCommand(CommandType::Play));

    auto c = h.transport->lastClose(id);
    REQUIRE(c);
    REQUIRE(c->code == close_code::AuthRequired);
    REQUIRE(c->reason == "Authentication required");
    REQUIRE(h.commands.empty());
}

TEST_CASE("An undecodable frame before auth is ignored", "[peer][host][auth]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");

    auto id = h.transport->accept();
    h.transport->deliver(id, std::string("{not json"));
    REQUIRE_FALSE(h.transport->lastClose(id).has_value());

    h.transport->deliver(id, Frame{ AuthFrame{ info.sessionId, info.pin, "Phone", "android" } });
    REQUIRE(h.peer->isConnected());
}

TEST_CASE("Ping is answered with one pong and no ack", "[peer][host][commands]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");
    auto id = h.authenticate(info.sessionId, info.pin);
    h.transport->clearSent();

    h.sendCommandFrom(id, RemoteCommand(CommandType::Ping));

    REQUIRE(h.transport->typesTo(id) == std::vector<std::string>{ "pong" });
    REQUIRE(h.commands.size() == 1);
    REQUIRE(h.commands[0].type() == CommandType::Ping);
}

TEST_CASE("Playback commands are acked before they are forwarded", "[peer][host][commands]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");
    auto id = h.authenticate(info.sessionId, info.pin);
    h.transport->clearSent();

    std::vector<std::string> sentAtCallback;
    h.peer->setCommandCallback([&](const RemoteCommand&) { sentAtCallback = h.transport->typesTo(id); });

    h.sendCommandFrom(id, RemoteCommand(CommandType::Seek, { { "position", std::int64_t{ 90'000 } } }));

    REQUIRE(sentAtCallback == std::vector<std::string>{ "ack" });
    REQUIRE(h.transport->typesTo(id) == std::vector<std::string>{ "ack" });
}

TEST_CASE("Control traffic is not acked", "[peer][host][commands]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");
    auto id = h.authenticate(info.sessionId, info.pin);
    h.transport->clearSent();

    h.sendCommandFrom(id, RemoteCommand(CommandType::Pong));
    h.sendCommandFrom(id, RemoteCommand(CommandType::Ack));
    h.sendCommandFrom(id, RemoteCommand(CommandType::DeviceInfo, { { "name", std::string("Phone") } }));
    REQUIRE(h.transport->textsTo(id).empty());
    REQUIRE(h.commands.size() == 3);

    h.sendCommandFrom(id, RemoteCommand::fromName("openSubtitles", { { "lang", std::string("en") } }));
    REQUIRE(h.transport->typesTo(id) == std::vector<std::string>{ "ack" });
    REQUIRE(h.commands.back().type() == CommandType::Custom);
    REQUIRE(h.commands.back().name() == "openSubtitles");
}

TEST_CASE("Malformed frames after auth keep the connection open", "[peer][host][commands]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");
    auto id = h.authenticate(info.sessionId, info.pin);

    h.transport->deliver(id, std::string("]]"));
    h.transport->deliver(id, std::string("[1,2,3]"));
    h.transport->deliver(id, std::string(R"({"data":{}})"));
    h.transport->deliver(id, std::string(R"({"type":"seek","data":{"position":[1]}})"));

    REQUIRE_FALSE(h.transport->lastClose(id).has_value());
    REQUIRE(h.commands.empty());

    h.sendCommandFrom(id, RemoteCommand(CommandType::Play));
    REQUIRE(h.commands.size() == 1);
    REQUIRE(h.peer->isConnected());
}

TEST_CASE("A throwing command callback is reported as Unknown", "[peer][host][commands]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");
    auto id = h.authenticate(info.sessionId, info.pin);

    h.peer->setCommandCallback([](const RemoteCommand&) { throw std::runtime_error("player crashed"); });
    h.sendCommandFrom(id, RemoteCommand(CommandType::Play));

    REQUIRE(h.errors.size() == 1);
    REQUIRE(h.errors[0].kind() == PeerErr::Unknown);
    REQUIRE(h.errors[0].message() == "player crashed");
    REQUIRE(h.peer->isConnected());
}

TEST_CASE("sendCommand without a controller sends nothing", "[peer][host][commands]") {
    PeerHarness h;
    h.peer->createSession("Living Room", "linux");
    h.peer->sendCommand(RemoteCommand(CommandType::Play));
    REQUIRE(h.transport->sent.empty());
    REQUIRE(h.errors.empty());
}

TEST_CASE("A failed write is reported as DataChannelError", "[peer][host][commands]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");
    h.authenticate(info.sessionId, info.pin);

    h.transport->failSends = true;
    h.peer->sendCommand(RemoteCommand(CommandType::Play));
    REQUIRE(h.errors.size() == 1);
    REQUIRE(h.errors[0].kind() == PeerErr::DataChannelError);
}

TEST_CASE("Host disconnect is idempotent", "[peer][host][disconnect]") {
    PeerHarness h;
    auto info = h.peer->createSession("Living Room", "linux");
    auto pending = h.transport->accept();
    auto active = h.authenticate(info.sessionId, info.pin);
    h.states.clear();

    h.peer->disconnect();

    REQUIRE(h.transport->lastClose(active)->code == close_code::Normal);
    REQUIRE(h.transport->lastClose(pending)->code == close_code::Normal);
    REQUIRE_FALSE(h.transport->listening);
    REQUIRE_FALSE(h.peer->sessionId().has_value());
    REQUIRE_FALSE(h.peer->pin().has_value());
    REQUIRE_FALSE(h.peer->myPeerId().has_value());
    REQUIRE_FALSE(h.peer->hostAddress().has_value());
    REQUIRE_FALSE(h.peer->role().has_value());
    REQUIRE(h.states == std::vector<SessionStatus>{ SessionStatus::Disconnected });

    const auto closes = h.transport->closed.size();
    h.peer->disconnect();
    REQUIRE(h.transport->closed.size() == closes);
    REQUIRE(h.states.size() == 1);

    // late closes of the sockets we ended are silent
    h.transport->confirmClose(active);
    h.transport->confirmClose(pending);
    REQUIRE(h.disconnected == 0);

    // the pending auth timer was cancelled with its connection
    h.scheduler->advance(15s);
    REQUIRE(h.transport->closed.size() == closes);
}

TEST_CASE("Connections arriving after disconnect are refused", "[peer][host][disconnect]") {
    PeerHarness h;
    h.peer->createSession("Living Room", "linux");
    h.peer->disconnect();

    auto stray = h.transport->accept();
    REQUIRE(h.transport->lastClose(stray).has_value());
    REQUIRE(h.scheduler->pending() == 0);
}

/**
 * @file session_controller.cpp
 * @brief Implementation of SessionController.
 *
 * Lock order is peer → controller: peer callbacks arrive with the peer
 * mutex held and take the controller mutex, so the controller never calls
 * into the peer while holding its own mutex.
 */
#include "remotectl/core/controller/session_controller.hpp"
#include "remotectl/core/strategies/exponential_backoff.hpp"
#include "remotectl/core/util/error_types.hpp"
#include "remotectl/core/util/logger.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <optional>
#include <string>

namespace remotectl {

    namespace {
        std::string toUpper(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }

        /// Message for close codes that end a joined session for good, std::nullopt otherwise.
        std::optional<std::string> terminalCloseMessage(int code) {
            switch (code) {
                case close_code::InvalidCredentials: return "Invalid session ID or PIN";
                case close_code::Replaced:           return "Replaced by another controller";
                case close_code::RateLimited:        return "Too many attempts. Try again later.";
                default:                             return std::nullopt;
            }
        }
    }

    class SessionController::Impl : public std::enable_shared_from_this<SessionController::Impl> {
    public:
        Impl(std::shared_ptr<ITransport> transport,
             std::shared_ptr<IScheduler> scheduler,
             DeviceIdentity identity,
             ControllerOptions options,
             PeerOptions peerOptions,
             InterfaceProvider interfaces)
            : scheduler_(scheduler),
              identity_(std::move(identity)),
              opts_(std::move(options)),
              peer_(std::make_shared<RemotePeer>(std::move(transport), std::move(scheduler),
                                                 std::move(peerOptions), std::move(interfaces))) {
            if (!opts_.backoffStrategy)
                opts_.backoffStrategy = std::make_shared<ExponentialBackoff>(
                    std::chrono::seconds(1), std::chrono::seconds(16));
        }

        void attach() {
            std::weak_ptr<Impl> weak = weak_from_this();
            peer_->setCommandCallback([weak](const RemoteCommand& c) {
                if (auto self = weak.lock()) self->onPeerCommand(c);
            });
            peer_->setDeviceConnectedCallback([weak](const RemoteDevice& d) {
                if (auto self = weak.lock()) self->onPeerDeviceConnected(d);
            });
            peer_->setDeviceDisconnectedCallback([weak](int code, const std::string& reason) {
                if (auto self = weak.lock()) self->onPeerDeviceDisconnected(code, reason);
            });
            peer_->setErrorCallback([weak](const RemotePeerError& e) {
                if (auto self = weak.lock()) self->onPeerError(e);
            });
            peer_->setStateCallback([weak](SessionStatus s) {
                if (auto self = weak.lock()) self->onPeerState(s);
            });
        }

        void shutdown() {
            std::shared_ptr<RemotePeer> peer;
            {
                std::lock_guard<std::mutex> lk(mx_);
                if (closed_) return;
                closed_ = true;
                cancelTimerLocked();
                snapCb_ = nullptr;
                commandCb_ = nullptr;
                peer = std::move(peer_);
            }
            // ~RemotePeer disconnects and silences its callbacks
            peer.reset();
        }

        // ------------------------------------------------------------------
        // session lifecycle
        // ------------------------------------------------------------------

        SessionInfo createSession() {
            leaveSession();

            std::shared_ptr<RemotePeer> peer;
            {
                std::lock_guard<std::mutex> lk(mx_);
                last_.reset();
                snap_.role = SessionRole::Host;
                peer = peer_;
            }
            LOG_INFO("SessionController: creating session as host");

            SessionInfo info;
            try {
                info = peer->createSession(identity_.name, identity_.platform);
            } catch (const RemotePeerError& e) {
                LOG_ERROR("SessionController: failed to create session: " + e.message());
                std::unique_lock<std::mutex> lk(mx_);
                snap_.status = SessionStatus::Error;
                snap_.errorMessage = e.message();
                publish(lk);
                throw;
            }

            std::unique_lock<std::mutex> lk(mx_);
            snap_.sessionId = info.sessionId;
            snap_.pin = info.pin;
            snap_.hostAddress = info.address;
            publish(lk);
            return info;
        }

        std::future<void> joinSession(const std::string& sessionId,
                                      const std::string& pin,
                                      const std::string& hostAddress) {
            leaveSession();

            std::shared_ptr<RemotePeer> peer;
            {
                std::unique_lock<std::mutex> lk(mx_);
                last_ = Credentials{ sessionId, pin, hostAddress };
                snap_.role = SessionRole::Remote;
                snap_.sessionId = toUpper(sessionId);
                snap_.pin = pin;
                snap_.hostAddress = hostAddress;
                snap_.status = SessionStatus::Connecting;
                peer = peer_;
                publish(lk);
            }
            LOG_INFO("SessionController: joining session " + toUpper(sessionId) + " at " + hostAddress);
            return peer->joinSession(sessionId, pin, identity_.name, identity_.platform, hostAddress);
        }

        void leaveSession() {
            std::shared_ptr<RemotePeer> peer;
            {
                std::lock_guard<std::mutex> lk(mx_);
                if (closed_) return;
                intentional_ = true;
                cancelTimerLocked();
                ++reconnectGen_;
                attempts_ = 0;
                reconnecting_ = false;
                peer = peer_;
            }

            LOG_DEBUG("SessionController: leaving session");
            peer->disconnect();

            std::unique_lock<std::mutex> lk(mx_);
            intentional_ = false;
            snap_ = SessionSnapshot{};
            publish(lk);
        }

        bool sendCommand(const RemoteCommand& command) {
            std::shared_ptr<RemotePeer> peer;
            {
                std::lock_guard<std::mutex> lk(mx_);
                if (!snap_.isConnected() || !peer_) {
                    LOG_WARN("SessionController: cannot send " + command.name() + ", not connected");
                    return false;
                }
                peer = peer_;
            }
            LOG_DEBUG("SessionController: sending " + command.name());
            peer->sendCommand(command);
            return true;
        }

        // ------------------------------------------------------------------
        // reconnect
        // ------------------------------------------------------------------

        void retryReconnectNow() {
            uint64_t gen = 0;
            {
                std::unique_lock<std::mutex> lk(mx_);
                if (!last_)
                    throw RemotePeerError(PeerErr::InvalidSession, "No previous session to reconnect to");
                cancelTimerLocked();
                attempts_ = 0;
                reconnecting_ = true;
                gen = ++reconnectGen_;
                snap_.role = SessionRole::Remote;
                snap_.status = SessionStatus::Reconnecting;
                snap_.reconnectAttempts = 0;
                publish(lk);
            }
            LOG_INFO("SessionController: reconnecting now");
            attemptReconnect(gen);
        }

        void cancelReconnect() {
            std::shared_ptr<RemotePeer> peer;
            {
                std::lock_guard<std::mutex> lk(mx_);
                if (closed_) return;
                cancelTimerLocked();
                ++reconnectGen_;
                attempts_ = 0;
                reconnecting_ = false;
                intentional_ = true;
                peer = peer_;
            }

            LOG_INFO("SessionController: reconnect cancelled");
            peer->disconnect();

            std::unique_lock<std::mutex> lk(mx_);
            intentional_ = false;
            snap_.status = SessionStatus::Disconnected;
            snap_.connectedDevice.reset();
            snap_.reconnectAttempts = 0;
            publish(lk);
        }

        // ------------------------------------------------------------------
        // accessors
        // ------------------------------------------------------------------

        SessionSnapshot snapshot() const { std::lock_guard<std::mutex> lk(mx_); return snap_; }
        const DeviceIdentity& identity() const noexcept { return identity_; }
        std::shared_ptr<RemotePeer> peer() const { std::lock_guard<std::mutex> lk(mx_); return peer_; }

        void setSnapshotCallback(SnapshotCallback cb) { std::lock_guard<std::mutex> lk(mx_); snapCb_ = std::move(cb); }
        void setCommandCallback(CommandCallback cb) { std::lock_guard<std::mutex> lk(mx_); commandCb_ = std::move(cb); }

    private:
        struct Credentials {
            std::string sessionId;
            std::string pin;
            std::string hostAddress;
        };

        // ------------------------------------------------------------------
        // peer events
        // ------------------------------------------------------------------

        void onPeerCommand(const RemoteCommand& command) {
            std::unique_lock<std::mutex> lk(mx_);
            if (closed_ || intentional_) return;

            switch (command.type()) {
            case CommandType::DeviceInfo: {
                RemoteDevice device{ command.getString("id").value_or("unknown"),
                                     command.getString("name").value_or("Unknown Device"),
                                     command.getString("platform").value_or("unknown") };
                LOG_DEBUG("SessionController: device info " + device.name + " (" + device.platform + ")");
                snap_.connectedDevice = std::move(device);
                publish(lk);
                return;
            }
            case CommandType::SyncState: {
                const bool active = command.getBool("playerActive").value_or(false);
                if (active == snap_.playerActive) return;
                snap_.playerActive = active;
                publish(lk);
                return;
            }
            case CommandType::Ping:
            case CommandType::Pong:
            case CommandType::Ack:
                return;
            default:
                break;
            }

            auto cb = commandCb_;
            lk.unlock();
            if (!cb) return;
            try {
                cb(command);
            } catch (const std::exception& e) {
                LOG_ERROR("SessionController: command callback threw: " + std::string(e.what()));
            }
        }

        void onPeerDeviceConnected(const RemoteDevice& device) {
            std::unique_lock<std::mutex> lk(mx_);
            if (closed_ || intentional_) return;
            LOG_INFO("SessionController: device connected: " + device.name);
            snap_.connectedDevice = device;
            if (reconnecting_) reconnectedLocked();
            snap_.status = SessionStatus::Connected;
            publish(lk);
        }

        void onPeerDeviceDisconnected(int code, const std::string& reason) {
            std::unique_lock<std::mutex> lk(mx_);
            if (closed_ || intentional_) return;

            snap_.connectedDevice.reset();
            if (snap_.role == SessionRole::Remote) {
                if (auto message = terminalCloseMessage(code)) {
                    // host-initiated close: no automatic rejoin
                    LOG_WARN("SessionController: host ended the session (code " + std::to_string(code) +
                             (reason.empty() ? "" : ": " + reason) + "), not reconnecting");
                    cancelTimerLocked();
                    ++reconnectGen_;
                    reconnecting_ = false;
                    attempts_ = 0;
                    snap_.reconnectAttempts = 0;
                    snap_.status = SessionStatus::Disconnected;
                    snap_.errorMessage = *message;
                    publish(lk);
                    return;
                }
            }

            snap_.status = SessionStatus::Reconnecting;
            reconnecting_ = true;
            if (snap_.role == SessionRole::Host) {
                // the listener stays up; the controller comes back on its own
                LOG_INFO("SessionController: controller lost, waiting for it to reconnect");
                snap_.errorMessage.reset();
            } else {
                LOG_WARN("SessionController: connection to host lost");
                attempts_ = 0;
                scheduleReconnectLocked();
            }
            publish(lk);
        }

        void onPeerError(const RemotePeerError& error) {
            std::unique_lock<std::mutex> lk(mx_);
            if (closed_ || intentional_) return;
            LOG_WARN("SessionController: " + std::string(toString(error.kind())) + ": " + error.message());
            lastErrorKind_ = error.kind();
            snap_.errorMessage = error.message();
            if (!reconnecting_) snap_.status = SessionStatus::Error;
            publish(lk);
        }

        void onPeerState(SessionStatus status) {
            std::unique_lock<std::mutex> lk(mx_);
            if (closed_ || intentional_) return;

            if (!reconnecting_) {
                if (snap_.status == status) return;
                snap_.status = status;
                publish(lk);
                return;
            }

            if (status == SessionStatus::Connected) {
                reconnectedLocked();
                snap_.status = SessionStatus::Connected;
                publish(lk);
            } else if (status == SessionStatus::Error && snap_.role == SessionRole::Remote) {
                if (lastErrorKind_ == PeerErr::AuthFailed) {
                    LOG_WARN("SessionController: host rejected the stored credentials, giving up");
                    reconnecting_ = false;
                    attempts_ = 0;
                    snap_.reconnectAttempts = 0;
                    snap_.status = SessionStatus::Error;
                } else {
                    scheduleReconnectLocked();
                }
                publish(lk);
            }
        }

        // ------------------------------------------------------------------
        // reconnect helpers, mx_ held unless noted
        // ------------------------------------------------------------------

        void reconnectedLocked() {
            LOG_INFO("SessionController: reconnected");
            cancelTimerLocked();
            ++reconnectGen_;
            reconnecting_ = false;
            attempts_ = 0;
            snap_.reconnectAttempts = 0;
            snap_.errorMessage.reset();
        }

        void scheduleReconnectLocked() {
            if (attempts_ >= opts_.maxReconnectAttempts) {
                LOG_WARN("SessionController: max reconnect attempts reached");
                reconnecting_ = false;
                attempts_ = 0;
                snap_.reconnectAttempts = 0;
                snap_.status = SessionStatus::Error;
                snap_.errorMessage = "Connection lost after " + std::to_string(opts_.maxReconnectAttempts) + " attempts";
                return;
            }

            ++attempts_;
            snap_.reconnectAttempts = attempts_;
            const auto delay = opts_.backoffStrategy->nextDelay(attempts_);
            LOG_DEBUG("SessionController: reconnect attempt " + std::to_string(attempts_) +
                      " in " + std::to_string(delay.count()) + "ms");

            cancelTimerLocked();
            const uint64_t gen = ++reconnectGen_;
            std::weak_ptr<Impl> weak = weak_from_this();
            reconnectTimer_ = scheduler_->schedule(delay, [weak, gen] {
                if (auto self = weak.lock()) self->attemptReconnect(gen);
            });
        }

        /// Runs without mx_.
        void attemptReconnect(uint64_t gen) {
            std::shared_ptr<RemotePeer> peer;
            Credentials creds;
            {
                std::unique_lock<std::mutex> lk(mx_);
                if (closed_ || gen != reconnectGen_ || !reconnecting_) return;
                reconnectTimer_ = 0;
                if (!last_) {
                    LOG_WARN("SessionController: no stored credentials for reconnect");
                    reconnecting_ = false;
                    snap_.status = SessionStatus::Error;
                    snap_.errorMessage = "Connection lost";
                    publish(lk);
                    return;
                }
                creds = *last_;
                peer = peer_;
                lastErrorKind_.reset();
            }

            LOG_DEBUG("SessionController: attempting reconnect");
            try {
                // the outcome arrives through the state callback
                std::future<void> pending = peer->joinSession(creds.sessionId, creds.pin,
                                                              identity_.name, identity_.platform,
                                                              creds.hostAddress);
            } catch (const RemotePeerError& e) {
                LOG_ERROR("SessionController: reconnect failed: " + e.message());
                std::unique_lock<std::mutex> lk(mx_);
                if (closed_ || !reconnecting_) return;
                scheduleReconnectLocked();
                publish(lk);
            }
        }

        void cancelTimerLocked() {
            if (reconnectTimer_) {
                scheduler_->cancel(reconnectTimer_);
                reconnectTimer_ = 0;
            }
        }

        /// Deliver the current snapshot; releases @p lk.
        void publish(std::unique_lock<std::mutex>& lk) {
            SessionSnapshot copy = snap_;
            auto cb = snapCb_;
            lk.unlock();
            if (!cb) return;
            try {
                cb(copy);
            } catch (const std::exception& e) {
                LOG_ERROR("SessionController: snapshot callback threw: " + std::string(e.what()));
            }
        }

        std::shared_ptr<IScheduler> scheduler_;
        DeviceIdentity              identity_;
        ControllerOptions           opts_;

        mutable std::mutex           mx_;
        std::shared_ptr<RemotePeer>  peer_;
        SessionSnapshot              snap_;
        bool                         closed_{ false };
        bool                         intentional_{ false };

        std::optional<Credentials>   last_;
        bool                         reconnecting_{ false };
        uint32_t                     attempts_{ 0 };
        TimerId                      reconnectTimer_{ 0 };
        uint64_t                     reconnectGen_{ 0 };
        std::optional<PeerErr>       lastErrorKind_;

        SnapshotCallback             snapCb_;
        CommandCallback              commandCb_;
    };

    SessionController::SessionController(std::shared_ptr<ITransport> transport,
                                         std::shared_ptr<IScheduler> scheduler,
                                         DeviceIdentity identity,
                                         ControllerOptions options,
                                         PeerOptions peerOptions,
                                         InterfaceProvider interfaces)
        : pImpl_(std::make_shared<Impl>(std::move(transport), std::move(scheduler), std::move(identity),
                                        std::move(options), std::move(peerOptions), std::move(interfaces))) {
        pImpl_->attach();
    }

    SessionController::~SessionController() {
        pImpl_->shutdown();
    }

    SessionInfo SessionController::createSession() { return pImpl_->createSession(); }

    std::future<void> SessionController::joinSession(const std::string& sessionId,
                                                     const std::string& pin,
                                                     const std::string& hostAddress) {
        return pImpl_->joinSession(sessionId, pin, hostAddress);
    }

    void SessionController::leaveSession() { pImpl_->leaveSession(); }

    bool SessionController::sendCommand(const RemoteCommand& command) { return pImpl_->sendCommand(command); }
    bool SessionController::sendCommand(CommandType type, CommandData data) {
        return pImpl_->sendCommand(RemoteCommand(type, std::move(data)));
    }

    void SessionController::retryReconnectNow() { pImpl_->retryReconnectNow(); }
    void SessionController::cancelReconnect() { pImpl_->cancelReconnect(); }

    SessionSnapshot SessionController::snapshot() const { return pImpl_->snapshot(); }
    const DeviceIdentity& SessionController::identity() const noexcept { return pImpl_->identity(); }
    std::shared_ptr<RemotePeer> SessionController::peer() const { return pImpl_->peer(); }

    void SessionController::setSnapshotCallback(SnapshotCallback cb) { pImpl_->setSnapshotCallback(std::move(cb)); }
    void SessionController::setCommandCallback(CommandCallback cb) { pImpl_->setCommandCallback(std::move(cb)); }

}

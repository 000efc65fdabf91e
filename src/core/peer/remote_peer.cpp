/**
 * @file remote_peer.cpp
 * @brief Implementation of the RemotePeer session engine.
 */
#include "remotectl/core/peer/remote_peer.hpp"
#include "remotectl/core/auth/auth_guard.hpp"
#include "remotectl/core/liveness/liveness_monitor.hpp"
#include "remotectl/core/net/endpoint.hpp"
#include "remotectl/core/protocol/session_codec.hpp"
#include "remotectl/core/util/logger.hpp"
#include "internal/core/util/random.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <unordered_map>

namespace remotectl {

    namespace {
        constexpr const char* kRateLimitedMessage = "Too many attempts. Try again later.";
        constexpr const char* kInvalidCredentialsMessage = "Invalid session ID or PIN";

        std::string toUpper(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }

        bool shouldAck(const RemoteCommand& command) {
            return !command.isControlTraffic();
        }
    }

    class RemotePeer::Impl : public std::enable_shared_from_this<RemotePeer::Impl> {
    public:
        Impl(std::shared_ptr<ITransport> transport,
             std::shared_ptr<IScheduler> scheduler,
             PeerOptions options,
             InterfaceProvider interfaces)
            : transport_(std::move(transport)),
              scheduler_(std::move(scheduler)),
              opts_(std::move(options)),
              interfaces_(std::move(interfaces)),
              authGuard_(opts_.maxFailedAuthAttempts, opts_.authLockout) {
            if (!transport_) throw std::invalid_argument("RemotePeer: transport is null");
            if (!scheduler_) throw std::invalid_argument("RemotePeer: scheduler is null");
            if (!interfaces_) interfaces_ = listIPv4Interfaces;
        }

        /// Registers transport callbacks; they hold only a weak reference.
        void attach() {
            std::weak_ptr<Impl> weak = weak_from_this();
            transport_->setOpenCallback([weak](ConnectionId id) {
                if (auto self = weak.lock()) self->onOpen(id);
            });
            transport_->setMessageCallback([weak](ConnectionId id, const std::string& text) {
                if (auto self = weak.lock()) self->onMessage(id, text);
            });
            transport_->setCloseCallback([weak](ConnectionId id, int code, const std::string& reason) {
                if (auto self = weak.lock()) self->onClose(id, code, reason);
            });
            transport_->setErrorCallback([weak](ConnectionId id, const std::string& message) {
                if (auto self = weak.lock()) self->onTransportError(id, message);
            });
        }

        /// Called from ~RemotePeer: silence every callback, then tear down.
        void detach() {
            std::lock_guard<std::recursive_mutex> lk(mx_);
            commandCb_ = nullptr;
            connectedCb_ = nullptr;
            disconnectedCb_ = nullptr;
            errorCb_ = nullptr;
            stateCb_ = nullptr;
            disconnectLocked();
            detached_ = true;
        }

        // ------------------------------------------------------------------
        // host role
        // ------------------------------------------------------------------

        SessionInfo createSession(const std::string& deviceName, const std::string& platform) {
            std::unique_lock<std::recursive_mutex> lk(mx_);

            if (!transport_->canListen()) {
                LOG_ERROR("RemotePeer: hosting requested on a transport without listening support");
                throw RemotePeerError(PeerErr::ServerError, "Hosting is not supported on this platform");
            }

            if (role_) disconnectLocked();

            role_ = SessionRole::Host;
            sessionId_ = generateSessionId();
            pin_ = generatePin();
            myPeerId_ = "host-" + *sessionId_;
            identity_ = DeviceIdentity{ deviceName, platform };
            authGuard_.reset();
            const uint64_t generation = ++hostGeneration_;
            ++hostBindsInFlight_;

            // listen() may wait on the transport thread, which needs this lock to deliver events
            lk.unlock();
            uint16_t port = 0;
            std::string bindError;
            try {
                port = transport_->listen(opts_.preferredPort, opts_.wsPath);
                LOG_DEBUG("RemotePeer: server bound to port " + std::to_string(port));
            } catch (const TransportError& e) {
                LOG_WARN("RemotePeer: port " + std::to_string(opts_.preferredPort) +
                         " unavailable (" + e.what() + "), using an OS-assigned port");
                try {
                    port = transport_->listen(0, opts_.wsPath);
                } catch (const TransportError& e2) {
                    bindError = e2.what();
                }
            }
            lk.lock();
            --hostBindsInFlight_;

            if (generation != hostGeneration_) {
                // disconnect() or another createSession() ran while we were binding
                LOG_DEBUG("RemotePeer: session creation superseded while binding");
                if (bindError.empty()) strayListener_ = true;
                releaseStrayListenerLocked();
                throw RemotePeerError(PeerErr::ServerError, "Session creation was cancelled");
            }
            if (!bindError.empty()) {
                releaseStrayListenerLocked();
                failHosting(PeerErr::ServerError, "Failed to create server: " + bindError);
            }
            listening_ = true;
            strayListener_ = false;

            std::optional<std::string> ip;
            try {
                ip = selectLanAddress(interfaces_());
            } catch (const RemotePeerError& e) {
                failHosting(PeerErr::NetworkError, e.message());
            }
            if (!ip) {
                failHosting(PeerErr::NetworkError, "No network interface found");
            }

            hostAddress_ = *ip + ":" + std::to_string(port);
            LOG_INFO("RemotePeer: hosting session " + *sessionId_ + " at " + *hostAddress_ +
                     " (pin " + maskSecret(*pin_) + ")");

            setStatus(SessionStatus::Connecting);
            return SessionInfo{ *sessionId_, *pin_, *hostAddress_ };
        }

        // ------------------------------------------------------------------
        // remote role
        // ------------------------------------------------------------------

        std::future<void> joinSession(const std::string& sessionId,
                                      const std::string& pin,
                                      const std::string& deviceName,
                                      const std::string& platform,
                                      const std::string& hostAddress) {
            std::lock_guard<std::recursive_mutex> lk(mx_);

            if (role_) disconnectLocked();

            role_ = SessionRole::Remote;
            sessionId_ = toUpper(sessionId);
            pin_ = pin;
            hostAddress_ = hostAddress;
            myPeerId_ = "remote-" + std::to_string(randomBelow(99999));
            identity_ = DeviceIdentity{ deviceName, platform };
            authRequest_ = AuthFrame{ *sessionId_, pin, deviceName, platform };
            authenticated_ = false;

            std::promise<void> promise;
            auto future = promise.get_future();
            joinPromise_ = std::move(promise);
            const uint64_t seq = ++joinSeq_;

            setStatus(SessionStatus::Connecting);

            Endpoint endpoint;
            try {
                endpoint = parseHostAddress(hostAddress, opts_.preferredPort, opts_.wsPath);
            } catch (const RemotePeerError& e) {
                failJoin(PeerErr::ConnectionFailed, "Failed to connect: " + e.message());
                return future;
            }

            LOG_INFO("RemotePeer: joining session " + *sessionId_ + " at " + endpoint.url() +
                     " (pin " + maskSecret(pin) + ")");

            std::weak_ptr<Impl> weak = weak_from_this();
            joinTimer_ = scheduler_->schedule(opts_.joinTimeout, [weak, seq] {
                if (auto self = weak.lock()) self->onJoinTimeout(seq);
            });

            try {
                remoteConn_ = transport_->connect(endpoint);
            } catch (const TransportError& e) {
                failJoin(PeerErr::ConnectionFailed, std::string("Failed to connect: ") + e.what());
            }
            return future;
        }

        // ------------------------------------------------------------------
        // both roles
        // ------------------------------------------------------------------

        void sendCommand(const RemoteCommand& command) {
            std::lock_guard<std::recursive_mutex> lk(mx_);

            std::optional<ConnectionId> target;
            if (role_ == SessionRole::Host) target = activeController_;
            else if (role_ == SessionRole::Remote && authenticated_) target = remoteConn_;

            if (!target) {
                LOG_DEBUG("RemotePeer: no connection to send " + command.name());
                return;
            }
            if (!transport_->send(*target, codec_.encode(command))) {
                LOG_ERROR("RemotePeer: failed to send " + command.name());
                emitError(PeerErr::DataChannelError, "Failed to send command: " + command.name());
                return;
            }
            LOG_DEBUG("RemotePeer: sent " + command.name());
        }

        void sendDeviceInfo(const std::string& deviceName, const std::string& platform) {
            std::lock_guard<std::recursive_mutex> lk(mx_);
            CommandData data{
                { "id", myPeerId_.value_or("") },
                { "name", deviceName },
                { "platform", platform },
            };
            if (role_) data.emplace("role", std::string(toString(*role_)));
            sendCommand(RemoteCommand(CommandType::DeviceInfo, std::move(data)));
        }

        void disconnect() {
            std::lock_guard<std::recursive_mutex> lk(mx_);
            disconnectLocked();
        }

        // ------------------------------------------------------------------
        // accessors
        // ------------------------------------------------------------------

        std::optional<std::string> sessionId() const { std::lock_guard<std::recursive_mutex> lk(mx_); return sessionId_; }
        std::optional<std::string> pin() const { std::lock_guard<std::recursive_mutex> lk(mx_); return pin_; }
        std::optional<std::string> myPeerId() const { std::lock_guard<std::recursive_mutex> lk(mx_); return myPeerId_; }
        std::optional<std::string> hostAddress() const { std::lock_guard<std::recursive_mutex> lk(mx_); return hostAddress_; }
        std::optional<SessionRole> role() const { std::lock_guard<std::recursive_mutex> lk(mx_); return role_; }
        SessionStatus status() const { std::lock_guard<std::recursive_mutex> lk(mx_); return status_; }
        uint32_t failedAuthAttempts() const { std::lock_guard<std::recursive_mutex> lk(mx_); return authGuard_.failedAttempts(); }

        bool isConnected() const {
            std::lock_guard<std::recursive_mutex> lk(mx_);
            if (role_ == SessionRole::Host) return activeController_.has_value();
            if (role_ == SessionRole::Remote) return authenticated_ && remoteConn_.has_value();
            return false;
        }

        void setCommandCallback(CommandCallback cb) { std::lock_guard<std::recursive_mutex> lk(mx_); commandCb_ = std::move(cb); }
        void setDeviceConnectedCallback(DeviceConnectedCallback cb) { std::lock_guard<std::recursive_mutex> lk(mx_); connectedCb_ = std::move(cb); }
        void setDeviceDisconnectedCallback(DeviceDisconnectedCallback cb) { std::lock_guard<std::recursive_mutex> lk(mx_); disconnectedCb_ = std::move(cb); }
        void setErrorCallback(PeerErrorCallback cb) { std::lock_guard<std::recursive_mutex> lk(mx_); errorCb_ = std::move(cb); }
        void setStateCallback(StateCallback cb) { std::lock_guard<std::recursive_mutex> lk(mx_); stateCb_ = std::move(cb); }

    private:
        /// An accepted connection that has not authenticated yet.
        struct PendingConn {
            TimerId authTimer{ 0 };
        };

        // ------------------------------------------------------------------
        // transport events
        // ------------------------------------------------------------------

        void onOpen(ConnectionId id) {
            std::lock_guard<std::recursive_mutex> lk(mx_);
            if (detached_) return;

            if (role_ == SessionRole::Remote && remoteConn_ == id) {
                LOG_DEBUG("RemotePeer: connected to host, sending auth");
                if (!transport_->send(id, codec_.encode(authRequest_))) {
                    failJoin(PeerErr::ConnectionFailed, "Failed to send authentication");
                }
                return;
            }

            if (role_ == SessionRole::Host && listening_) {
                LOG_DEBUG("RemotePeer: new connection " + std::to_string(id));
                std::weak_ptr<Impl> weak = weak_from_this();
                PendingConn pc;
                pc.authTimer = scheduler_->schedule(opts_.authTimeout, [weak, id] {
                    if (auto self = weak.lock()) self->onAuthTimeout(id);
                });
                pending_[id] = pc;
                return;
            }

            LOG_DEBUG("RemotePeer: closing stray connection " + std::to_string(id));
            transport_->close(id, close_code::Normal, "No active session");
        }

        void onMessage(ConnectionId id, const std::string& text) {
            std::lock_guard<std::recursive_mutex> lk(mx_);
            if (detached_) return;

            if (role_ == SessionRole::Host) {
                if (pending_.contains(id)) handlePreAuth(id, text);
                else if (activeController_ == id) handleCommandText(text);
                else LOG_DEBUG("RemotePeer: frame from inactive connection " + std::to_string(id) + " ignored");
            } else if (role_ == SessionRole::Remote && remoteConn_ == id) {
                handleFromHost(text);
            }
        }

        void onClose(ConnectionId id, int code, const std::string& reason) {
            std::lock_guard<std::recursive_mutex> lk(mx_);
            if (detached_) return;

            if (auto it = pending_.find(id); it != pending_.end()) {
                scheduler_->cancel(it->second.authTimer);
                pending_.erase(it);
                LOG_DEBUG("RemotePeer: unauthenticated connection " + std::to_string(id) + " closed");
                return;
            }

            if (role_ == SessionRole::Host && activeController_ == id) {
                LOG_INFO("RemotePeer: controller disconnected (code " + std::to_string(code) + ")");
                activeController_.reset();
                emitDeviceDisconnected(code, reason);
                setStatus(SessionStatus::Disconnected);
                return;
            }

            if (role_ == SessionRole::Remote && remoteConn_ == id) {
                remoteConn_.reset();
                if (authenticated_) {
                    LOG_INFO("RemotePeer: connection to host closed (code " + std::to_string(code) + ")");
                    authenticated_ = false;
                    stopLiveness();
                    emitDeviceDisconnected(code, reason);
                    setStatus(SessionStatus::Disconnected);
                } else if (joinPromise_) {
                    std::string msg = "Connection closed before authentication";
                    if (code != 0) msg += " (code " + std::to_string(code) + (reason.empty() ? "" : ": " + reason) + ")";
                    failJoin(PeerErr::ConnectionFailed, msg);
                } else {
                    LOG_DEBUG("RemotePeer: connection closed after failed handshake");
                }
            }
        }

        void onTransportError(ConnectionId id, const std::string& message) {
            std::lock_guard<std::recursive_mutex> lk(mx_);
            if (detached_) return;

            LOG_ERROR("RemotePeer: transport error on connection " + std::to_string(id) + ": " + message);
            if (role_ == SessionRole::Host && activeController_ == id) {
                emitError(PeerErr::DataChannelError, "WebSocket error: " + message);
            } else if (role_ == SessionRole::Remote && remoteConn_ == id) {
                if (joinPromise_) {
                    failJoin(PeerErr::ConnectionFailed, "Connection error: " + message);
                } else {
                    emitError(PeerErr::ConnectionFailed, "Connection error: " + message);
                }
            }
        }

        // ------------------------------------------------------------------
        // host handshake
        // ------------------------------------------------------------------

        void handlePreAuth(ConnectionId id, const std::string& text) {
            auto decoded = codec_.decode(text);
            if (!decoded.ok()) {
                LOG_WARN("RemotePeer: undecodable frame before auth ignored: " + decoded.error);
                return;
            }

            const auto* auth = std::get_if<AuthFrame>(&*decoded.frame);
            if (!auth) {
                LOG_WARN("RemotePeer: expected auth, got another frame");
                dropPending(id, close_code::AuthRequired, "Authentication required");
                return;
            }

            const auto now = scheduler_->now();
            if (authGuard_.isLockedOut(now)) {
                LOG_WARN("RemotePeer: auth attempt rejected (rate limited, " +
                         std::to_string(authGuard_.lockoutRemaining(now).count()) + "ms left)");
                sendHandshake(id, codec_.encode(AuthFailedFrame{ kRateLimitedMessage }));
                dropPending(id, close_code::RateLimited, "Rate limited");
                return;
            }

            if (toUpper(auth->sessionId) != sessionId_ || auth->pin != pin_) {
                authGuard_.recordFailure(now);
                LOG_WARN("RemotePeer: invalid credentials (attempt " +
                         std::to_string(authGuard_.failedAttempts()) + "/" +
                         std::to_string(authGuard_.maxFailures()) + ")");
                sendHandshake(id, codec_.encode(AuthFailedFrame{ kInvalidCredentialsMessage }));
                dropPending(id, close_code::InvalidCredentials, "Invalid credentials");
                return;
            }

            authGuard_.recordSuccess();
            if (auto it = pending_.find(id); it != pending_.end()) {
                scheduler_->cancel(it->second.authTimer);
                pending_.erase(it);
            }

            if (activeController_ && *activeController_ != id) {
                LOG_INFO("RemotePeer: replacing existing controller connection");
                transport_->close(*activeController_, close_code::Replaced, "Replaced by new connection");
            }
            activeController_ = id;

            RemoteDevice device{ "remote-client",
                                 auth->deviceName.empty() ? "Unknown Device" : auth->deviceName,
                                 auth->platform.empty() ? "unknown" : auth->platform };
            LOG_INFO("RemotePeer: controller authenticated: " + device.name + " (" + device.platform + ")");

            if (!transport_->send(id, codec_.encode(AuthSuccessFrame{}))) {
                LOG_ERROR("RemotePeer: failed to send authSuccess");
                emitError(PeerErr::DataChannelError, "Failed to send authSuccess");
            }
            emitDeviceConnected(device);
            sendDeviceInfo(identity_.name, identity_.platform);
            setStatus(SessionStatus::Connected);
        }

        void sendHandshake(ConnectionId id, const std::string& text) {
            if (!transport_->send(id, text))
                LOG_DEBUG("RemotePeer: connection " + std::to_string(id) + " gone before handshake reply");
        }

        void dropPending(ConnectionId id, int code, const std::string& reason) {
            if (auto it = pending_.find(id); it != pending_.end()) {
                scheduler_->cancel(it->second.authTimer);
                pending_.erase(it);
            }
            transport_->close(id, code, reason);
        }

        void onAuthTimeout(ConnectionId id) {
            std::lock_guard<std::recursive_mutex> lk(mx_);
            if (detached_ || !pending_.contains(id)) return;
            LOG_WARN("RemotePeer: authentication timeout on connection " + std::to_string(id));
            pending_.erase(id);
            transport_->close(id, close_code::AuthTimeout, "Authentication timeout");
        }

        // ------------------------------------------------------------------
        // remote handshake
        // ------------------------------------------------------------------

        void handleFromHost(const std::string& text) {
            auto decoded = codec_.decode(text);
            if (!decoded.ok()) {
                LOG_WARN("RemotePeer: failed to parse message: " + decoded.error);
                return;
            }
            Frame& frame = *decoded.frame;

            if (std::holds_alternative<AuthSuccessFrame>(frame)) {
                if (authenticated_) return;
                onAuthSuccess();
                return;
            }
            if (auto* failed = std::get_if<AuthFailedFrame>(&frame)) {
                if (authenticated_) return;
                const std::string msg = failed->message.empty() ? "Authentication failed" : failed->message;
                LOG_WARN("RemotePeer: " + msg);
                failJoin(PeerErr::AuthFailed, msg);
                return;
            }
            if (auto* command = std::get_if<RemoteCommand>(&frame)) {
                if (!authenticated_) {
                    LOG_DEBUG("RemotePeer: " + command->name() + " before authSuccess ignored");
                    return;
                }
                handleCommand(*command);
                return;
            }
            LOG_DEBUG("RemotePeer: unexpected auth frame from host ignored");
        }

        void onAuthSuccess() {
            LOG_INFO("RemotePeer: authentication successful");
            authenticated_ = true;
            scheduler_->cancel(joinTimer_);
            joinTimer_ = 0;
            if (joinPromise_) {
                joinPromise_->set_value();
                joinPromise_.reset();
            }

            setStatus(SessionStatus::Connected);
            emitDeviceConnected(RemoteDevice{ "host", "Desktop", "desktop" });
            sendDeviceInfo(identity_.name, identity_.platform);
            startLiveness();
        }

        void onJoinTimeout(uint64_t seq) {
            std::lock_guard<std::recursive_mutex> lk(mx_);
            if (detached_ || seq != joinSeq_ || !joinPromise_) return;
            LOG_WARN("RemotePeer: timed out joining session");
            joinTimer_ = 0;
            if (remoteConn_) {
                transport_->close(*remoteConn_, close_code::Normal, "Join timed out");
                remoteConn_.reset();
            }
            failJoin(PeerErr::Timeout, "Timed out joining session");
        }

        void failJoin(PeerErr kind, const std::string& message) {
            if (joinTimer_) {
                scheduler_->cancel(joinTimer_);
                joinTimer_ = 0;
            }
            if (joinPromise_) {
                joinPromise_->set_exception(std::make_exception_ptr(RemotePeerError(kind, message)));
                joinPromise_.reset();
            }
            emitError(kind, message);
            setStatus(SessionStatus::Error);
        }

        void startLiveness() {
            if (!liveness_) {
                std::weak_ptr<Impl> weak = weak_from_this();
                liveness_ = std::make_unique<LivenessMonitor>(
                    *scheduler_, opts_.pingInterval,
                    [weak] { if (auto self = weak.lock()) self->sendCommand(RemoteCommand(CommandType::Ping)); },
                    [weak] { auto self = weak.lock(); return self && self->isConnected(); });
            }
            liveness_->start();
        }

        void stopLiveness() {
            if (liveness_) liveness_->stop();
        }

        // ------------------------------------------------------------------
        // commands
        // ------------------------------------------------------------------

        void handleCommandText(const std::string& text) {
            auto decoded = codec_.decode(text);
            if (!decoded.ok()) {
                LOG_WARN("RemotePeer: failed to process message: " + decoded.error);
                return;
            }
            if (auto* command = std::get_if<RemoteCommand>(&*decoded.frame)) {
                handleCommand(*command);
            } else {
                LOG_DEBUG("RemotePeer: handshake frame after authentication ignored");
            }
        }

        void handleCommand(const RemoteCommand& command) {
            LOG_DEBUG("RemotePeer: received " + command.name());
            if (shouldAck(command)) sendCommand(RemoteCommand(CommandType::Ack));
            emitCommand(command);
            if (command.type() == CommandType::Ping) sendCommand(RemoteCommand(CommandType::Pong));
        }

        // ------------------------------------------------------------------
        // teardown
        // ------------------------------------------------------------------

        void disconnectLocked() {
            const bool active = role_.has_value() || status_ != SessionStatus::Disconnected;
            if (active) LOG_DEBUG("RemotePeer: disconnecting");

            stopLiveness();
            ++joinSeq_;
            ++hostGeneration_;

            for (auto& [id, pc] : pending_) {
                scheduler_->cancel(pc.authTimer);
                transport_->close(id, close_code::Normal, "Session ended");
            }
            pending_.clear();

            if (activeController_) {
                transport_->close(*activeController_, close_code::Normal, "Session ended");
                activeController_.reset();
            }
            if (remoteConn_) {
                transport_->close(*remoteConn_, close_code::Normal, "Disconnected");
                remoteConn_.reset();
            }
            if (listening_) {
                transport_->stopListening();
                listening_ = false;
            }
            if (joinTimer_) {
                scheduler_->cancel(joinTimer_);
                joinTimer_ = 0;
            }
            if (joinPromise_) {
                joinPromise_->set_exception(std::make_exception_ptr(
                    RemotePeerError(PeerErr::ConnectionFailed, "Disconnected")));
                joinPromise_.reset();
            }

            authenticated_ = false;
            sessionId_.reset();
            pin_.reset();
            myPeerId_.reset();
            hostAddress_.reset();
            role_.reset();

            if (active) {
                status_ = SessionStatus::Disconnected;
                emitState(SessionStatus::Disconnected);
            }
        }

        /// Undo a half-built hosting session, report it and throw.
        /// The transport keeps one listener; stop it once no createSession() is still binding.
        void releaseStrayListenerLocked() {
            if (!strayListener_ || hostBindsInFlight_ > 0 || listening_) return;
            LOG_DEBUG("RemotePeer: stopping listener of a cancelled session");
            transport_->stopListening();
            strayListener_ = false;
        }

        [[noreturn]] void failHosting(PeerErr kind, const std::string& message) {
            LOG_ERROR("RemotePeer: " + message);
            if (listening_) {
                transport_->stopListening();
                listening_ = false;
            }
            sessionId_.reset();
            pin_.reset();
            myPeerId_.reset();
            hostAddress_.reset();
            role_.reset();
            emitError(kind, message);
            status_ = SessionStatus::Disconnected;
            throw RemotePeerError(kind, message);
        }

        // ------------------------------------------------------------------
        // event emission; application exceptions stop here
        // ------------------------------------------------------------------

        void setStatus(SessionStatus s) {
            if (status_ == s) return;
            status_ = s;
            emitState(s);
        }

        void emitState(SessionStatus s) {
            LOG_DEBUG("RemotePeer: state " + std::string(toString(s)));
            if (!stateCb_) return;
            try {
                stateCb_(s);
            } catch (const std::exception& e) {
                reportCallbackFailure("state", e);
            }
        }

        void emitCommand(const RemoteCommand& command) {
            if (!commandCb_) return;
            try {
                commandCb_(command);
            } catch (const std::exception& e) {
                reportCallbackFailure("command", e);
            }
        }

        void emitDeviceConnected(const RemoteDevice& device) {
            if (!connectedCb_) return;
            try {
                connectedCb_(device);
            } catch (const std::exception& e) {
                reportCallbackFailure("deviceConnected", e);
            }
        }

        void emitDeviceDisconnected(int code, const std::string& reason) {
            if (!disconnectedCb_) return;
            try {
                disconnectedCb_(code, reason);
            } catch (const std::exception& e) {
                reportCallbackFailure("deviceDisconnected", e);
            }
        }

        void emitError(PeerErr kind, const std::string& message) {
            if (!errorCb_) return;
            try {
                errorCb_(RemotePeerError(kind, message));
            } catch (const std::exception& e) {
                LOG_ERROR("RemotePeer: error callback threw: " + std::string(e.what()));
            }
        }

        void reportCallbackFailure(const char* which, const std::exception& e) {
            LOG_ERROR("RemotePeer: " + std::string(which) + " callback threw: " + e.what());
            emitError(PeerErr::Unknown, e.what());
        }

        // ---- collaborators ----
        std::shared_ptr<ITransport> transport_;
        std::shared_ptr<IScheduler> scheduler_;
        PeerOptions                 opts_;
        InterfaceProvider           interfaces_;
        SessionCodec                codec_;

        mutable std::recursive_mutex mx_;
        bool                         detached_{ false };

        // ---- identity ----
        std::optional<SessionRole>   role_;
        std::optional<std::string>   sessionId_;
        std::optional<std::string>   pin_;
        std::optional<std::string>   myPeerId_;
        std::optional<std::string>   hostAddress_;
        DeviceIdentity               identity_;
        SessionStatus                status_{ SessionStatus::Disconnected };

        // ---- host ----
        AuthGuard                                    authGuard_;
        bool                                         listening_{ false };
        uint64_t                                     hostGeneration_{ 0 };
        int                                          hostBindsInFlight_{ 0 };
        bool                                         strayListener_{ false };   ///< bound by a cancelled createSession
        std::unordered_map<ConnectionId, PendingConn> pending_;
        std::optional<ConnectionId>                  activeController_;

        // ---- remote ----
        AuthFrame                           authRequest_;
        std::optional<ConnectionId>         remoteConn_;
        bool                                authenticated_{ false };
        std::optional<std::promise<void>>   joinPromise_;
        TimerId                             joinTimer_{ 0 };
        uint64_t                            joinSeq_{ 0 };
        std::unique_ptr<LivenessMonitor>    liveness_;

        // ---- events ----
        CommandCallback             commandCb_;
        DeviceConnectedCallback     connectedCb_;
        DeviceDisconnectedCallback  disconnectedCb_;
        PeerErrorCallback           errorCb_;
        StateCallback               stateCb_;
    };

    RemotePeer::RemotePeer(std::shared_ptr<ITransport> transport,
                           std::shared_ptr<IScheduler> scheduler,
                           PeerOptions options,
                           InterfaceProvider interfaces)
        : pImpl_(std::make_shared<Impl>(std::move(transport), std::move(scheduler),
                                        std::move(options), std::move(interfaces))) {
        pImpl_->attach();
    }

    RemotePeer::~RemotePeer() {
        pImpl_->detach();
    }

    SessionInfo RemotePeer::createSession(const std::string& deviceName, const std::string& platform) {
        return pImpl_->createSession(deviceName, platform);
    }

    std::future<void> RemotePeer::joinSession(const std::string& sessionId,
                                              const std::string& pin,
                                              const std::string& deviceName,
                                              const std::string& platform,
                                              const std::string& hostAddress) {
        return pImpl_->joinSession(sessionId, pin, deviceName, platform, hostAddress);
    }

    void RemotePeer::sendCommand(const RemoteCommand& command) { pImpl_->sendCommand(command); }
    void RemotePeer::sendDeviceInfo(const std::string& deviceName, const std::string& platform) {
        pImpl_->sendDeviceInfo(deviceName, platform);
    }
    void RemotePeer::disconnect() { pImpl_->disconnect(); }

    std::optional<std::string> RemotePeer::sessionId() const { return pImpl_->sessionId(); }
    std::optional<std::string> RemotePeer::pin() const { return pImpl_->pin(); }
    std::optional<std::string> RemotePeer::myPeerId() const { return pImpl_->myPeerId(); }
    std::optional<std::string> RemotePeer::hostAddress() const { return pImpl_->hostAddress(); }
    std::optional<SessionRole> RemotePeer::role() const { return pImpl_->role(); }
    bool RemotePeer::isHost() const { return pImpl_->role() == SessionRole::Host; }
    bool RemotePeer::isConnected() const { return pImpl_->isConnected(); }
    SessionStatus RemotePeer::status() const { return pImpl_->status(); }
    uint32_t RemotePeer::failedAuthAttempts() const { return pImpl_->failedAuthAttempts(); }

    void RemotePeer::setCommandCallback(CommandCallback cb) { pImpl_->setCommandCallback(std::move(cb)); }
    void RemotePeer::setDeviceConnectedCallback(DeviceConnectedCallback cb) { pImpl_->setDeviceConnectedCallback(std::move(cb)); }
    void RemotePeer::setDeviceDisconnectedCallback(DeviceDisconnectedCallback cb) { pImpl_->setDeviceDisconnectedCallback(std::move(cb)); }
    void RemotePeer::setErrorCallback(PeerErrorCallback cb) { pImpl_->setErrorCallback(std::move(cb)); }
    void RemotePeer::setStateCallback(StateCallback cb) { pImpl_->setStateCallback(std::move(cb)); }

}

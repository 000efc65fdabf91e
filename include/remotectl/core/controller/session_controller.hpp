/**
 * @file session_controller.hpp
 * @brief Application-facing session state on top of RemotePeer.
 *
 * The controller owns one RemotePeer for as long as the remote-control
 * feature is alive. It folds the peer's events into a single snapshot,
 * filters liveness and identity traffic out of the command stream and
 * reconnects a controller that lost its host.
 */
#pragma once
#include "remotectl/core/peer/remote_peer.hpp"
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace remotectl {

    /**
     * @struct SessionSnapshot
     * @brief Everything a UI needs to render the session.
     */
    struct SessionSnapshot {
        std::optional<SessionRole>  role;
        SessionStatus               status{ SessionStatus::Disconnected };
        std::optional<std::string>  sessionId;
        std::optional<std::string>  pin;
        std::optional<std::string>  hostAddress;
        std::optional<RemoteDevice> connectedDevice;
        std::optional<std::string>  errorMessage;
        bool                        playerActive{ false };
        uint32_t                    reconnectAttempts{ 0 };

        bool isConnected() const noexcept { return status == SessionStatus::Connected; }
    };

    using SnapshotCallback = std::function<void(const SessionSnapshot&)>;

    /**
     * @class SessionController
     * @brief Session lifecycle, reconnect policy and command filtering.
     *
     * Thread-safe. Snapshot and command callbacks are invoked without the
     * controller lock and may call back into the controller.
     */
    class SessionController {
    public:
        SessionController(std::shared_ptr<ITransport> transport,
                          std::shared_ptr<IScheduler> scheduler,
                          DeviceIdentity identity,
                          ControllerOptions options = {},
                          PeerOptions peerOptions = {},
                          InterfaceProvider interfaces = listIPv4Interfaces);
        ~SessionController();

        SessionController(const SessionController&) = delete;
        SessionController& operator=(const SessionController&) = delete;

        /**
         * @brief Leave any current session and host a new one.
         * @throws RemotePeerError as RemotePeer::createSession
         */
        SessionInfo createSession();

        /**
         * @brief Leave any current session and join a host.
         *
         * The credentials are remembered for reconnecting.
         * @return The peer's join future
         */
        std::future<void> joinSession(const std::string& sessionId,
                                      const std::string& pin,
                                      const std::string& hostAddress);

        /**
         * @brief Intentionally end the session; no reconnect follows.
         */
        void leaveSession();

        /**
         * @brief Send a command to the peer.
         * @return false, with a warning logged, when no peer is connected
         */
        bool sendCommand(const RemoteCommand& command);
        /// @throws std::invalid_argument for CommandType::Custom; use RemoteCommand::fromName
        bool sendCommand(CommandType type, CommandData data = {});

        /**
         * @brief Skip the backoff wait and reconnect with the last credentials now.
         * @throws RemotePeerError InvalidSession when no session was joined before
         */
        void retryReconnectNow();

        /**
         * @brief Stop reconnecting and report the session as disconnected.
         */
        void cancelReconnect();

        SessionSnapshot snapshot() const;
        const DeviceIdentity& identity() const noexcept;

        /// The engine underneath, for diagnostics.
        std::shared_ptr<RemotePeer> peer() const;

        void setSnapshotCallback(SnapshotCallback cb);

        /// Playback and custom commands only; ping, pong, ack, deviceInfo and syncState are consumed here.
        void setCommandCallback(CommandCallback cb);

    private:
        class Impl;
        std::shared_ptr<Impl> pImpl_;
    };

}

/**
 * @file remote_peer.hpp
 * @brief Session engine for both the host and the controller role.
 *
 * One RemotePeer either hosts a session (createSession) or joins one
 * (joinSession). The socket layer is an ITransport and timers come from an
 * IScheduler, so the same engine runs over uWebSockets/Boost.Beast in
 * production and over in-memory fakes in tests.
 */
#pragma once
#include "remotectl/core/command/remote_command.hpp"
#include "remotectl/core/interfaces/ischeduler.hpp"
#include "remotectl/core/interfaces/itransport.hpp"
#include "remotectl/core/net/network_interfaces.hpp"
#include "remotectl/core/types.hpp"
#include "remotectl/core/util/error_types.hpp"
#include "remotectl/core/util/peer_options.hpp"
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace remotectl {

    /**
     * @typedef CommandCallback
     * @brief A decoded command arrived from the peer (control traffic included).
     */
    using CommandCallback = std::function<void(const RemoteCommand&)>;
    /**
     * @typedef DeviceConnectedCallback
     * @brief The peer authenticated; carries its claimed or placeholder identity.
     */
    using DeviceConnectedCallback = std::function<void(const RemoteDevice&)>;
    /**
     * @typedef DeviceDisconnectedCallback
     * @brief The authenticated peer went away.
     *
     * Carries the WebSocket close code and reason; 1006 (no close frame)
     * for a dropped socket. See close_code for the codes a host sends.
     */
    using DeviceDisconnectedCallback = std::function<void(int closeCode, const std::string& reason)>;
    /**
     * @typedef PeerErrorCallback
     * @brief A failure worth showing to the user.
     */
    using PeerErrorCallback = std::function<void(const RemotePeerError&)>;
    /**
     * @typedef StateCallback
     * @brief The connection status changed.
     */
    using StateCallback = std::function<void(SessionStatus)>;

    /**
     * @class RemotePeer
     * @brief Companion-remote session engine.
     *
     * Host role: binds a WebSocket listener, authenticates controllers by
     * session id and PIN, keeps a single active controller and acknowledges
     * its commands. Remote role: dials a host, authenticates, pings it
     * periodically and exchanges commands.
     *
     * Thread-safe. Transport and timer callbacks and all public methods are
     * serialized by one recursive mutex per instance; application callbacks
     * run under that mutex and may call back into the peer. Do not call
     * createSession() from inside a transport callback.
     */
    class RemotePeer {
    public:
        /**
         * @param transport  Socket layer; shared with the application, which shuts it down
         * @param scheduler  Timer source for auth, join and liveness deadlines
         * @param options    Protocol settings
         * @param interfaces Source of local IPv4 addresses for the host address
         */
        RemotePeer(std::shared_ptr<ITransport> transport,
                   std::shared_ptr<IScheduler> scheduler,
                   PeerOptions options = {},
                   InterfaceProvider interfaces = listIPv4Interfaces);

        /**
         * @brief Disconnects; no callback fires after the destructor returns.
         */
        ~RemotePeer();

        RemotePeer(const RemotePeer&) = delete;
        RemotePeer& operator=(const RemotePeer&) = delete;

        // ---- host role ----

        /**
         * @brief Start hosting a fresh session.
         *
         * Tears down any previous session, generates a new session id and
         * PIN, binds the preferred port (falling back to an OS-assigned one)
         * and resolves the LAN address.
         *
         * @return Credentials and "ip:port" to show to the user
         * @throws RemotePeerError ServerError when hosting is unsupported or
         *         both binds fail, NetworkError when no LAN address exists
         */
        SessionInfo createSession(const std::string& deviceName, const std::string& platform);

        // ---- remote role ----

        /**
         * @brief Dial a host and authenticate.
         *
         * @param hostAddress "ip:port", optionally prefixed with http:// or https://
         * @return Future that becomes ready on authSuccess, or holds a
         *         RemotePeerError (AuthFailed, ConnectionFailed or Timeout)
         */
        std::future<void> joinSession(const std::string& sessionId,
                                      const std::string& pin,
                                      const std::string& deviceName,
                                      const std::string& platform,
                                      const std::string& hostAddress);

        // ---- both roles ----

        /**
         * @brief Send a command to the peer. Without a peer this only logs.
         */
        void sendCommand(const RemoteCommand& command);

        /**
         * @brief Announce this device: deviceInfo{id, name, platform, role}.
         */
        void sendDeviceInfo(const std::string& deviceName, const std::string& platform);

        /**
         * @brief End the session in either role. Idempotent.
         *
         * Closes the connection(s), stops listening, clears the identity
         * fields, fails a pending join and emits Disconnected.
         */
        void disconnect();

        // ---- accessors ----

        std::optional<std::string> sessionId() const;
        std::optional<std::string> pin() const;
        std::optional<std::string> myPeerId() const;
        std::optional<std::string> hostAddress() const;
        std::optional<SessionRole> role() const;
        bool isHost() const;

        /**
         * @brief Host: a controller is authenticated. Remote: authenticated and the socket is open.
         */
        bool isConnected() const;

        SessionStatus status() const;

        /// Failed authentication attempts counted by the host in this hosting period.
        uint32_t failedAuthAttempts() const;

        // ---- events ----

        void setCommandCallback(CommandCallback cb);
        void setDeviceConnectedCallback(DeviceConnectedCallback cb);
        void setDeviceDisconnectedCallback(DeviceDisconnectedCallback cb);
        void setErrorCallback(PeerErrorCallback cb);
        void setStateCallback(StateCallback cb);

    private:
        class Impl;
        std::shared_ptr<Impl> pImpl_;
    };

}

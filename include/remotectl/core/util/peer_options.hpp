/**
 * @file peer_options.hpp
 * @brief Configuration structures for remotectl.
 *
 * Every timing and limit of the session protocol lives here with its
 * default, so tests and embedders can shorten or tighten them.
 */
#pragma once
#include "remotectl/core/interfaces/IBackoffStrategy.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace remotectl {

    /**
     * @struct PeerOptions
     * @brief Protocol settings for one RemotePeer.
     */
    struct PeerOptions {
        uint16_t                  preferredPort{ 48632 };          ///< host port tried before an OS-assigned one
        std::string               wsPath{ "/ws" };                 ///< WebSocket endpoint path
        std::chrono::milliseconds authTimeout{ 10'000 };           ///< host: time allowed to send a valid auth
        std::chrono::milliseconds joinTimeout{ 15'000 };           ///< remote: time allowed for the whole join
        std::chrono::milliseconds pingInterval{ 5'000 };           ///< remote: liveness ping period
        uint32_t                  maxFailedAuthAttempts{ 5 };      ///< failures before lockout
        std::chrono::milliseconds authLockout{ 30'000 };           ///< lockout window
    };

    /**
     * @struct TransportOptions
     * @brief Settings of the WebSocket transport.
     */
    struct TransportOptions {
        std::string bindAddress{ "0.0.0.0" };       ///< listen address for hosting
        uint16_t    idleTimeoutSec{ 120 };          ///< server-side idle timeout, 0 disables
        uint32_t    maxPayloadBytes{ 64 * 1024 };   ///< largest accepted frame
        bool        enableHosting{ true };          ///< false models a platform without listening sockets
        bool        verifyPeer{ false };            ///< verify the host certificate on wss connections
    };

    /**
     * @struct ControllerOptions
     * @brief Reconnect policy of the SessionController.
     */
    struct ControllerOptions {
        uint32_t maxReconnectAttempts{ 5 };                  ///< attempts before giving up
        std::shared_ptr<IBackoffStrategy> backoffStrategy;   ///< null selects exponential 1 s .. 16 s
    };

}

/**
 * @file types.hpp
 * @brief Shared value types for remotectl sessions.
 *
 * Session role and status enums, the peer device identity and the opaque
 * handles used between the engine, its transport and its scheduler.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace remotectl {

    /// Handle of one WebSocket connection, assigned by the transport. 0 is never used.
    using ConnectionId = std::uint64_t;

    /// Handle of one scheduled timer. 0 is never used.
    using TimerId = std::uint64_t;

    /**
     * @enum SessionRole
     * @brief Which side of the session this instance plays.
     */
    enum class SessionRole : uint8_t {
        Host,   ///< binds the socket and accepts one controller
        Remote  ///< dials out and issues commands
    };

    /**
     * @enum SessionStatus
     * @brief Connection state shared by host and remote.
     *
     * disconnected → connecting → connected → (error | disconnected).
     * Reconnecting is only reported by the SessionController.
     */
    enum class SessionStatus : uint8_t {
        Disconnected,
        Connecting,
        Connected,
        Reconnecting,
        Error
    };

    /**
     * @struct RemoteDevice
     * @brief Self-reported identity of the peer on the other end.
     */
    struct RemoteDevice {
        std::string id;
        std::string name;
        std::string platform;

        [[nodiscard]] bool operator==(const RemoteDevice& o) const noexcept = default;
    };

    /**
     * @struct DeviceIdentity
     * @brief Identity of the local device, supplied by the host application.
     */
    struct DeviceIdentity {
        std::string name{ "Unknown Device" };
        std::string platform{ "unknown" };
    };

    /**
     * @struct SessionInfo
     * @brief What createSession hands back for out-of-band display.
     */
    struct SessionInfo {
        std::string sessionId;
        std::string pin;
        std::string address;   ///< "ip:port"
    };

    std::string_view toString(SessionRole role) noexcept;
    std::string_view toString(SessionStatus status) noexcept;

}

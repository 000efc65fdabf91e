/**
 * @file error_types.hpp
 * @brief Error type definitions for remotectl.
 *
 * PeerErr classifies every failure the session engine can report. The same
 * RemotePeerError value is thrown from createSession, stored in a failed
 * join future and delivered through the error callback.
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace remotectl {

    /**
     * @enum PeerErr
     * @brief Error kinds reported by the session engine.
     */
    enum class PeerErr : int {
        ConnectionFailed = 1,  ///< socket-level connect, close or error
        PeerDisconnected,      ///< reserved for application-level signalling
        DataChannelError,      ///< send failure on a live socket
        ServerError,           ///< listener setup failed or hosting unsupported
        Timeout,               ///< join handshake exceeded its deadline
        InvalidSession,        ///< session cannot be joined (no address on record)
        AuthFailed,            ///< host rejected the credentials or is locked out
        NetworkError,          ///< no usable local network interface
        Unknown = 99           ///< unexpected failure while handling a message
    };

    std::string_view toString(PeerErr kind) noexcept;

    /**
     * @class RemotePeerError
     * @brief Structured error with a kind and a human-readable message.
     */
    class RemotePeerError : public std::runtime_error {
    public:
        RemotePeerError(PeerErr kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        PeerErr kind() const noexcept { return kind_; }
        std::string message() const { return what(); }

    private:
        PeerErr kind_;
    };

    /**
     * @class TransportError
     * @brief Thrown by transports when a listener cannot be set up.
     */
    class TransportError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief WebSocket close codes the host uses to tell a controller why it was dropped.
     */
    namespace close_code {
        constexpr int Normal             = 1000;
        constexpr int AuthTimeout        = 4001;
        constexpr int AuthRequired       = 4002;
        constexpr int InvalidCredentials = 4003;
        constexpr int Replaced           = 4004;
        constexpr int RateLimited        = 4005;
    }

}

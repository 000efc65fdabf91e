/**
 * @file session_codec.hpp
 * @brief JSON text-frame codec for the remotectl session protocol.
 *
 * One JSON object per WebSocket text frame, discriminated by "type".
 * Handshake frames carry their fields next to "type"; command frames carry
 * their payload under "data":
 *
 *     {"type":"auth","sessionId":"ABCD1234","pin":"123456","deviceName":"Phone","platform":"android"}
 *     {"type":"authFailed","message":"Invalid session ID or PIN"}
 *     {"type":"seek","data":{"position":120000}}
 */
#pragma once
#include "remotectl/core/command/remote_command.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace remotectl {

    /// Controller → host handshake request.
    struct AuthFrame {
        std::string sessionId;
        std::string pin;
        std::string deviceName;   ///< empty when the peer did not send one
        std::string platform;     ///< empty when the peer did not send one

        bool operator==(const AuthFrame&) const = default;
    };

    /// Host → controller handshake acceptance.
    struct AuthSuccessFrame {
        bool operator==(const AuthSuccessFrame&) const = default;
    };

    /// Host → controller handshake rejection.
    struct AuthFailedFrame {
        std::string message;

        bool operator==(const AuthFailedFrame&) const = default;
    };

    /// Any decoded frame. Handshake frames never appear as RemoteCommand.
    using Frame = std::variant<AuthFrame, AuthSuccessFrame, AuthFailedFrame, RemoteCommand>;

    /**
     * @struct DecodeResult
     * @brief Either a frame or the reason the text could not be decoded.
     */
    struct DecodeResult {
        std::optional<Frame> frame;
        std::string          error;

        bool ok() const noexcept { return frame.has_value(); }
    };

    /**
     * @class SessionCodec
     * @brief Converts frames to and from single-line JSON text.
     *
     * Encoding never throws. Decoding never throws either: malformed JSON,
     * a non-object root, a missing or non-string "type", or a non-primitive
     * value under "data" all yield a DecodeResult without a frame.
     */
    class SessionCodec {
    public:
        std::string encode(const RemoteCommand& command) const;
        std::string encode(const AuthFrame& auth) const;
        std::string encode(const AuthSuccessFrame& ok) const;
        std::string encode(const AuthFailedFrame& failed) const;

        /// Dispatches on the variant alternative.
        std::string encode(const Frame& frame) const;

        DecodeResult decode(std::string_view text) const;
    };

}

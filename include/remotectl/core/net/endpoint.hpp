/**
 * @file endpoint.hpp
 * @brief Parsed address of a session host.
 */
#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace remotectl {

    /**
     * @struct Endpoint
     * @brief Where a controller dials: ws(s)://host:port/path.
     */
    struct Endpoint {
        std::string host;
        uint16_t    port{ 0 };
        std::string path{ "/ws" };
        bool        secure{ false };   ///< wss over TLS

        /// "ws://host:port/path" or "wss://..."
        std::string url() const;

        bool operator==(const Endpoint&) const = default;
    };

    /**
     * @brief Parse a host address as typed by a user or stored in a recent session.
     *
     * Accepts "host" and "host:port", optionally behind an "http://", "https://",
     * "ws://" or "wss://" scheme and followed by a path, which is discarded in
     * favour of @p path. "https://" and "wss://" select TLS. Bracketed IPv6 literals ("[::1]:48632")
     * are accepted.
     *
     * @throws RemotePeerError (ConnectionFailed) for an empty host or a port
     *         outside 1..65535
     */
    Endpoint parseHostAddress(std::string_view address,
                              uint16_t defaultPort = 48632,
                              std::string_view path = "/ws");

}

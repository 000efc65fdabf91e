/**
 * @file itransport.hpp
 * @brief Transport capability consumed by the session engine.
 *
 * The engine never touches sockets. A transport owns the listener and the
 * outbound connections and reports their lifecycle through callbacks keyed
 * by ConnectionId. Inbound (accepted) and outbound (dialled) connections
 * share one id space and one set of callbacks.
 */
#pragma once
#include "remotectl/core/net/endpoint.hpp"
#include "remotectl/core/types.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace remotectl {

    /**
     * @typedef OpenCallback
     * @brief A connection is ready for traffic: an accepted upgrade on the
     * listener, or an outbound dial that completed its handshake.
     */
    using OpenCallback = std::function<void(ConnectionId)>;
    /**
     * @typedef MessageCallback
     * @brief One text frame arrived on a connection.
     */
    using MessageCallback = std::function<void(ConnectionId, const std::string&)>;
    /**
     * @typedef CloseCallback
     * @brief A connection is gone. Fired exactly once per opened or dialled id,
     * including dials that never opened.
     */
    using CloseCallback = std::function<void(ConnectionId, int code, const std::string& reason)>;
    /**
     * @typedef ErrorCallback
     * @brief A socket-level failure on a connection. A close callback follows.
     */
    using TransportErrorCallback = std::function<void(ConnectionId, const std::string&)>;

    /**
     * @class ITransport
     * @brief Interface for the socket layer underneath RemotePeer.
     *
     * Callbacks may run on any transport thread. Methods may be called from
     * inside a callback; implementations must not deliver a callback
     * synchronously from inside send(), close() or connect().
     */
    class ITransport {
    public:
        virtual ~ITransport() = default;

        /**
         * @brief Whether this platform can accept inbound connections at all.
         */
        virtual bool canListen() const = 0;

        /**
         * @brief Start accepting WebSocket upgrades on @p path.
         * @param port Port to bind, 0 for an OS-assigned one
         * @param path Upgrade path; any other path answers HTTP 404
         * @return The port actually bound
         * @throws TransportError when the bind fails
         *
         * Blocks until the socket is bound. Callers must not hold a lock that
         * transport callbacks also take.
         */
        virtual uint16_t listen(uint16_t port, const std::string& path) = 0;

        /**
         * @brief Stop accepting and close every accepted connection. Idempotent.
         *
         * Does not block; close callbacks for accepted connections arrive later.
         */
        virtual void stopListening() = 0;

        /**
         * @brief Start dialling @p endpoint.
         * @return Id of the new connection; open or close is reported later
         */
        virtual ConnectionId connect(const Endpoint& endpoint) = 0;

        /**
         * @brief Queue a text frame on a connection.
         * @return false when the connection is unknown or already closing
         */
        virtual bool send(ConnectionId id, const std::string& text) = 0;

        /**
         * @brief Close a connection with a WebSocket close code. Unknown ids are ignored.
         */
        virtual void close(ConnectionId id, int code, const std::string& reason) = 0;

        /**
         * @brief Stop listening, drop every connection and join transport threads.
         *
         * Never call from inside a transport callback.
         */
        virtual void shutdown() = 0;

        virtual void setOpenCallback(OpenCallback cb) = 0;
        virtual void setMessageCallback(MessageCallback cb) = 0;
        virtual void setCloseCallback(CloseCallback cb) = 0;
        virtual void setErrorCallback(TransportErrorCallback cb) = 0;
    };
}

/**
 * @file websocket_transport.hpp
 * @brief WebSocket transport layer for remotectl.
 */
#pragma once

#include "remotectl/core/interfaces/itransport.hpp"
#include "remotectl/core/util/peer_options.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace remotectl {

    /**
     * @class WebSocketTransport
     * @brief ITransport implementation using uWebSockets for hosting and Boost.Beast for dialling.
     *
     * Each listen() runs a uWebSockets event loop on its own thread. Sends and
     * closes for accepted connections are handed to that loop with
     * Loop::defer, so they are safe from any thread, callbacks included.
     * Outbound connections (connect) go through a Boost.Beast client running
     * on a separate io_context thread; ws:// and wss:// are supported.
     */
    class WebSocketTransport : public ITransport {
    public:
    /**
     * @brief Constructs a WebSocketTransport instance.
     * @param options Bind address, idle timeout, payload limit and TLS settings.
     */
        explicit WebSocketTransport(TransportOptions options = {});

    /**
     * @brief Destructor. Calls shutdown().
     */
        ~WebSocketTransport() override;

        WebSocketTransport(const WebSocketTransport&) = delete;
        WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    /**
     * @brief False when hosting was disabled in the options.
     */
        bool canListen() const override;

    /**
     * @brief Starts a uWebSockets loop and binds it.
     *
     * Blocks until the bind has succeeded or failed. A previous listener is
     * stopped first. The port is bound exclusively, so a port held by
     * another process fails instead of being shared.
     *
     * @throws TransportError when hosting is disabled or the bind fails
     */
        uint16_t listen(uint16_t port, const std::string& path) override;

    /**
     * @brief Closes the listen socket and every accepted connection. Does not block.
     */
        void stopListening() override;

        ConnectionId connect(const Endpoint& endpoint) override;
        bool send(ConnectionId id, const std::string& text) override;
        void close(ConnectionId id, int code, const std::string& reason) override;

    /**
     * @brief Stops listening, drops outbound connections and joins every transport thread.
     *
     * Must not be called from a transport callback.
     */
        void shutdown() override;

        void setOpenCallback(OpenCallback cb) override;
        void setMessageCallback(MessageCallback cb) override;
        void setCloseCallback(CloseCallback cb) override;
        void setErrorCallback(TransportErrorCallback cb) override;

    private:
    /**
     * @brief Private implementation (PIMPL) keeping uWebSockets and Boost out of this header.
     */
        class Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}

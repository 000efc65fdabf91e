/**
 * @file websocket_client_transport.hpp
 * @brief Dial-only WebSocket transport.
 */
#pragma once

#include "remotectl/core/interfaces/itransport.hpp"
#include "remotectl/core/util/peer_options.hpp"
#include <memory>

namespace remotectl {

    /**
     * @class WebSocketClientTransport
     * @brief ITransport for runtimes that cannot accept inbound connections.
     *
     * canListen() is always false and listen() throws, so a RemotePeer on top
     * of it refuses createSession() with ServerError without touching the
     * network. joinSession() works as with WebSocketTransport.
     */
    class WebSocketClientTransport : public ITransport {
    public:
        explicit WebSocketClientTransport(TransportOptions options = {});
        ~WebSocketClientTransport() override;

        WebSocketClientTransport(const WebSocketClientTransport&) = delete;
        WebSocketClientTransport& operator=(const WebSocketClientTransport&) = delete;

        bool canListen() const override { return false; }

        /// @throws TransportError always
        uint16_t listen(uint16_t port, const std::string& path) override;
        void stopListening() override {}

        ConnectionId connect(const Endpoint& endpoint) override;
        bool send(ConnectionId id, const std::string& text) override;
        void close(ConnectionId id, int code, const std::string& reason) override;
        void shutdown() override;

        void setOpenCallback(OpenCallback cb) override;
        void setMessageCallback(MessageCallback cb) override;
        void setCloseCallback(CloseCallback cb) override;
        void setErrorCallback(TransportErrorCallback cb) override;

    private:
        class Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}

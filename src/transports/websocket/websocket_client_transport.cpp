#include "remotectl/transports/websocket/websocket_client_transport.hpp"
#include "remotectl/core/util/error_types.hpp"
#include "internal/transports/websocket/ws_client_connector.hpp"
#include <atomic>

namespace remotectl {

    class WebSocketClientTransport::Impl {
    public:
        explicit Impl(TransportOptions o)
            : client(std::move(o), [this] { return nextId.fetch_add(1, std::memory_order_relaxed); }, events) {}

        std::atomic<ConnectionId> nextId{ 1 };
        TransportEvents events;
        WsClientConnector client;
    };

    WebSocketClientTransport::WebSocketClientTransport(TransportOptions options)
        : pImpl_(std::make_unique<Impl>(std::move(options))) {}

    WebSocketClientTransport::~WebSocketClientTransport() { shutdown(); }

    uint16_t WebSocketClientTransport::listen(uint16_t, const std::string&) {
        throw TransportError("Listening sockets are not available on this platform");
    }

    ConnectionId WebSocketClientTransport::connect(const Endpoint& endpoint) {
        return pImpl_->client.connect(endpoint);
    }

    bool WebSocketClientTransport::send(ConnectionId id, const std::string& text) {
        return pImpl_->client.send(id, text);
    }

    void WebSocketClientTransport::close(ConnectionId id, int code, const std::string& reason) {
        pImpl_->client.close(id, code, reason);
    }

    void WebSocketClientTransport::shutdown() {
        pImpl_->client.shutdown();
    }

    void WebSocketClientTransport::setOpenCallback(OpenCallback cb) { pImpl_->events.setOpen(std::move(cb)); }
    void WebSocketClientTransport::setMessageCallback(MessageCallback cb) { pImpl_->events.setMessage(std::move(cb)); }
    void WebSocketClientTransport::setCloseCallback(CloseCallback cb) { pImpl_->events.setClose(std::move(cb)); }
    void WebSocketClientTransport::setErrorCallback(TransportErrorCallback cb) { pImpl_->events.setError(std::move(cb)); }

}

/**
 * @file websocket_transport.cpp
 * @brief Implementation of the WebSocketTransport class for remotectl.
 *
 * Hosting runs on uWebSockets: one event loop thread per listen() call, a
 * WebSocket route on the session path and a 404 for everything else.
 * Accepted sockets are only touched on their loop thread; other threads
 * reach them through Loop::defer keyed by ConnectionId. Dialling is
 * delegated to WsClientConnector.
 */
#include "remotectl/transports/websocket/websocket_transport.hpp"
#include "remotectl/core/util/error_types.hpp"
#include "remotectl/core/util/logger.hpp"
#include "internal/transports/websocket/ws_client_connector.hpp"
#include <uwebsockets/App.h>
#include <atomic>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace remotectl {

    struct PerSocketData {
        ConnectionId id{ 0 };
    };

    using WS = uWS::WebSocket<false, true, PerSocketData>;

    /**
     * @brief One uWebSockets loop with its listen socket and accepted connections.
     *
     * loop, listenSocket and conns are owned by the loop thread; running is
     * guarded by the transport mutex and tells other threads whether defer()
     * may still be used.
     */
    struct ServerLoop {
        uWS::Loop*                             loop{ nullptr };
        us_listen_socket_t*                    listenSocket{ nullptr };
        std::unordered_map<ConnectionId, WS*>  conns;
        bool                                   running{ false };
        std::jthread                           thread;
    };

    /**
     * @class WebSocketTransport::Impl
     * @brief Private implementation class for WebSocketTransport (PIMPL idiom).
     */
    class WebSocketTransport::Impl {
    public:
        explicit Impl(TransportOptions o)
            : opts(std::move(o)),
              client(opts, [this] { return nextId.fetch_add(1, std::memory_order_relaxed); }, events) {}

        /// Server that owns @p id, or null when the id is not an accepted connection.
        std::shared_ptr<ServerLoop> serverFor(ConnectionId id) {
            std::lock_guard<std::mutex> lk(mx);
            auto it = serverIds.find(id);
            if (it == serverIds.end()) return nullptr;
            return it->second.lock();
        }

        /// Run @p fn on the server's loop thread. False once the loop has exited.
        template <class F>
        bool defer(const std::shared_ptr<ServerLoop>& server, F&& fn) {
            std::lock_guard<std::mutex> lk(mx);
            if (!server->running || !server->loop) return false;
            server->loop->defer(std::forward<F>(fn));
            return true;
        }

        void runServer(std::shared_ptr<ServerLoop> server,
                       uint16_t port,
                       std::string path,
                       std::shared_ptr<std::promise<int>> bound) {
            uWS::App app{};

            using Behavior = uWS::TemplatedApp<false>::WebSocketBehavior<PerSocketData>;
            Behavior wsBeh{};
            wsBeh.compression = uWS::DISABLED;
            wsBeh.maxPayloadLength = opts.maxPayloadBytes;
            wsBeh.idleTimeout = opts.idleTimeoutSec;

            wsBeh.open = [this, server](WS* ws) {
                const ConnectionId id = nextId.fetch_add(1, std::memory_order_relaxed);
                ws->getUserData()->id = id;
                server->conns.emplace(id, ws);
                {
                    std::lock_guard<std::mutex> lk(mx);
                    serverIds.emplace(id, server);
                }
                LOG_DEBUG("WS[" + std::to_string(id) + "]: accepted");
                events.open(id);
            };

            wsBeh.message = [this](WS* ws, std::string_view msg, uWS::OpCode op) {
                const ConnectionId id = ws->getUserData()->id;
                if (op != uWS::OpCode::TEXT) {
                    LOG_DEBUG("WS[" + std::to_string(id) + "]: non-text frame ignored");
                    return;
                }
                events.message(id, std::string(msg));
            };

            wsBeh.close = [this, server](WS* ws, int code, std::string_view reason) {
                const ConnectionId id = ws->getUserData()->id;
                server->conns.erase(id);
                {
                    std::lock_guard<std::mutex> lk(mx);
                    serverIds.erase(id);
                }
                LOG_DEBUG("WS[" + std::to_string(id) + "]: closed (" + std::to_string(code) + ")");
                events.close(id, code, std::string(reason));
            };

            app.ws<PerSocketData>(path, std::move(wsBeh));
            app.any("/*", [](auto* res, auto* /*req*/) {
                res->writeStatus("404 Not Found")->end("Not Found");
            });

            app.listen(opts.bindAddress, port, LIBUS_LISTEN_EXCLUSIVE_PORT,
                [this, server, bound](us_listen_socket_t* tok) {
                    if (!tok) {
                        bound->set_value(-1);
                        return;
                    }
                    {
                        std::lock_guard<std::mutex> lk(mx);
                        server->loop = uWS::Loop::get();
                        server->listenSocket = tok;
                        server->running = true;
                    }
                    bound->set_value(us_socket_local_port(0, reinterpret_cast<us_socket_t*>(tok)));
                });

            if (!server->listenSocket) return;
            app.run();

            std::lock_guard<std::mutex> lk(mx);
            server->running = false;
            server->loop = nullptr;
            LOG_DEBUG("WS: server loop exited");
        }

        void stopServer(const std::shared_ptr<ServerLoop>& server) {
            bool deferred = defer(server, [server] {
                if (server->listenSocket) {
                    us_listen_socket_close(0, server->listenSocket);
                    server->listenSocket = nullptr;
                }
                // end() fires the close handler, which mutates conns
                std::vector<WS*> open;
                open.reserve(server->conns.size());
                for (auto& [id, ws] : server->conns) open.push_back(ws);
                for (auto* ws : open) ws->end(1001, "Server stopping");
            });
            if (!deferred) LOG_DEBUG("WS: server loop already stopped");
        }

        void joinRetired() {
            std::vector<std::shared_ptr<ServerLoop>> retired;
            {
                std::lock_guard<std::mutex> lk(mx);
                retired.swap(retiredServers);
            }
            for (auto& s : retired) {
                if (!s->thread.joinable()) continue;
                if (s->thread.get_id() == std::this_thread::get_id()) s->thread.detach();
                else s->thread.join();
            }
        }

        TransportOptions opts;
        std::atomic<ConnectionId> nextId{ 1 };
        TransportEvents events;

        std::mutex mx;
        std::shared_ptr<ServerLoop> server;                                     ///< current listener
        std::vector<std::shared_ptr<ServerLoop>> retiredServers;                ///< stopped, not yet joined
        std::unordered_map<ConnectionId, std::weak_ptr<ServerLoop>> serverIds;  ///< accepted ids

        WsClientConnector client;
    };

    WebSocketTransport::WebSocketTransport(TransportOptions options)
        : pImpl_(std::make_unique<Impl>(std::move(options))) {}

    WebSocketTransport::~WebSocketTransport() { shutdown(); }

    bool WebSocketTransport::canListen() const {
        return pImpl_->opts.enableHosting;
    }

    uint16_t WebSocketTransport::listen(uint16_t port, const std::string& path) {
        if (!pImpl_->opts.enableHosting)
            throw TransportError("Hosting is disabled for this transport");

        stopListening();
        pImpl_->joinRetired();

        auto server = std::make_shared<ServerLoop>();
        auto bound = std::make_shared<std::promise<int>>();
        auto result = bound->get_future();

        server->thread = std::jthread([this, server, port, path, bound] {
            try {
                pImpl_->runServer(server, port, path, bound);
            } catch (const std::exception& e) {
                LOG_ERROR("WS: server loop failed: " + std::string(e.what()));
            }
        });

        int boundPort = -1;
        try {
            boundPort = result.get();
        } catch (const std::future_error& e) {
            LOG_ERROR("WS: server loop ended before binding: " + std::string(e.what()));
        }
        if (boundPort <= 0) {
            server->thread.join();
            throw TransportError("Failed to bind " + pImpl_->opts.bindAddress + ":" + std::to_string(port));
        }

        {
            std::lock_guard<std::mutex> lk(pImpl_->mx);
            pImpl_->server = server;
        }
        LOG_INFO("WS: listening on " + pImpl_->opts.bindAddress + ":" + std::to_string(boundPort) + path);
        return static_cast<uint16_t>(boundPort);
    }

    void WebSocketTransport::stopListening() {
        std::shared_ptr<ServerLoop> server;
        {
            std::lock_guard<std::mutex> lk(pImpl_->mx);
            server = std::move(pImpl_->server);
            pImpl_->server.reset();
            if (server) pImpl_->retiredServers.push_back(server);
        }
        if (!server) return;
        pImpl_->stopServer(server);
    }

    ConnectionId WebSocketTransport::connect(const Endpoint& endpoint) {
        return pImpl_->client.connect(endpoint);
    }

    bool WebSocketTransport::send(ConnectionId id, const std::string& text) {
        if (auto server = pImpl_->serverFor(id)) {
            return pImpl_->defer(server, [server, id, text] {
                auto it = server->conns.find(id);
                if (it == server->conns.end()) return;
                if (it->second->send(text, uWS::OpCode::TEXT) == WS::SendStatus::DROPPED)
                    LOG_WARN("WS[" + std::to_string(id) + "]: frame dropped by backpressure limit");
            });
        }
        return pImpl_->client.send(id, text);
    }

    void WebSocketTransport::close(ConnectionId id, int code, const std::string& reason) {
        if (auto server = pImpl_->serverFor(id)) {
            pImpl_->defer(server, [server, id, code, reason] {
                auto it = server->conns.find(id);
                if (it != server->conns.end()) it->second->end(code, reason);
            });
            return;
        }
        pImpl_->client.close(id, code, reason);
    }

    void WebSocketTransport::shutdown() {
        stopListening();
        pImpl_->joinRetired();
        pImpl_->client.shutdown();
    }

    void WebSocketTransport::setOpenCallback(OpenCallback cb) { pImpl_->events.setOpen(std::move(cb)); }
    void WebSocketTransport::setMessageCallback(MessageCallback cb) { pImpl_->events.setMessage(std::move(cb)); }
    void WebSocketTransport::setCloseCallback(CloseCallback cb) { pImpl_->events.setClose(std::move(cb)); }
    void WebSocketTransport::setErrorCallback(TransportErrorCallback cb) { pImpl_->events.setError(std::move(cb)); }

}

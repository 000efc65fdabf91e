/**
 * @file ws_client_connector.hpp
 * @brief Boost.Beast WebSocket client shared by the remotectl transports.
 */
#pragma once
#include "remotectl/core/interfaces/itransport.hpp"
#include "remotectl/core/util/peer_options.hpp"

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace remotectl {

    /**
     * @class TransportEvents
     * @brief The four ITransport callbacks behind one mutex.
     *
     * Emitters copy the callback under the lock and invoke the copy without
     * it, so a callback may replace callbacks or call back into the transport.
     */
    class TransportEvents {
    public:
        void setOpen(OpenCallback cb)              { std::lock_guard<std::mutex> lk(mx_); open_ = std::move(cb); }
        void setMessage(MessageCallback cb)        { std::lock_guard<std::mutex> lk(mx_); message_ = std::move(cb); }
        void setClose(CloseCallback cb)            { std::lock_guard<std::mutex> lk(mx_); close_ = std::move(cb); }
        void setError(TransportErrorCallback cb)   { std::lock_guard<std::mutex> lk(mx_); error_ = std::move(cb); }

        void open(ConnectionId id) {
            auto cb = get(open_);
            if (cb) cb(id);
        }
        void message(ConnectionId id, const std::string& text) {
            auto cb = get(message_);
            if (cb) cb(id, text);
        }
        void close(ConnectionId id, int code, const std::string& reason) {
            auto cb = get(close_);
            if (cb) cb(id, code, reason);
        }
        void error(ConnectionId id, const std::string& what) {
            auto cb = get(error_);
            if (cb) cb(id, what);
        }

    private:
        template <class F>
        F get(const F& f) {
            std::lock_guard<std::mutex> lk(mx_);
            return f;
        }

        std::mutex             mx_;
        OpenCallback           open_;
        MessageCallback        message_;
        CloseCallback          close_;
        TransportErrorCallback error_;
    };

    /**
     * @class WsClientConnector
     * @brief Outbound ws:// and wss:// connections on one io_context thread.
     *
     * Every connection goes resolve → TCP connect → (TLS handshake) →
     * WebSocket handshake → read loop. Writes are queued and issued one at
     * a time. A close is reported exactly once per connection, including
     * dials that fail before opening.
     */
    class WsClientConnector {
    public:
        WsClientConnector(TransportOptions options,
                          std::function<ConnectionId()> nextId,
                          TransportEvents& events);
        ~WsClientConnector();

        WsClientConnector(const WsClientConnector&) = delete;
        WsClientConnector& operator=(const WsClientConnector&) = delete;

        ConnectionId connect(const Endpoint& endpoint);

        /// True while @p id is a live or dialling client connection.
        bool owns(ConnectionId id) const;

        bool send(ConnectionId id, const std::string& text);
        void close(ConnectionId id, int code, const std::string& reason);

        /// Drop every connection without reporting closes and join the io thread. Idempotent.
        void shutdown();

    private:
        class Session;
        friend class Session;

        void forget(ConnectionId id);

        TransportOptions                                          opts_;
        std::function<ConnectionId()>                             nextId_;
        TransportEvents&                                          events_;

        boost::asio::io_context                                   ioc_;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
        boost::asio::ssl::context                                 sslCtx_;

        mutable std::mutex                                        mx_;
        std::unordered_map<ConnectionId, std::shared_ptr<Session>> sessions_;
        std::atomic_bool                                          stopped_{ false };
        std::jthread                                               runner_;
    };

}

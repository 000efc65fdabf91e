/**
 * @file ws_client_connector.cpp
 * @brief Boost.Beast client connections for the WebSocket transports.
 */
#include "internal/transports/websocket/ws_client_connector.hpp"
#include "remotectl/core/util/error_types.hpp"
#include "remotectl/core/util/logger.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <deque>

namespace remotectl {

    namespace asio = boost::asio;
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    namespace ssl = asio::ssl;
    using tcp = asio::ip::tcp;

    namespace {
        constexpr auto kConnectTimeout = std::chrono::seconds(30);
        constexpr int kAbnormalClosure = 1006;
    }

    /**
     * @class WsClientConnector::Session
     * @brief One outbound connection. Every member runs on the io thread.
     */
    class WsClientConnector::Session : public std::enable_shared_from_this<WsClientConnector::Session> {
    public:
        Session(WsClientConnector& owner, ConnectionId id, Endpoint endpoint)
            : owner_(owner), id_(id), ep_(std::move(endpoint)), resolver_(owner.ioc_) {
            if (ep_.secure)
                tls_ = std::make_unique<websocket::stream<beast::ssl_stream<beast::tcp_stream>>>(owner.ioc_, owner.sslCtx_);
            else
                plain_ = std::make_unique<websocket::stream<beast::tcp_stream>>(owner.ioc_);
        }

        void start() {
            LOG_DEBUG("WsClient[" + std::to_string(id_) + "]: dialling " + ep_.url());
            resolver_.async_resolve(ep_.host, std::to_string(ep_.port),
                beast::bind_front_handler(&Session::onResolve, shared_from_this()));
        }

        void send(std::string text) {
            if (finished_ || closeRequested_) return;
            queue_.push_back(std::move(text));
            if (open_ && !writing_) doWrite();
        }

        void requestClose(int code, std::string reason) {
            if (finished_ || closeRequested_) return;
            closeRequested_ = true;
            closeCode_ = code;
            closeReason_ = std::move(reason);

            if (!open_) {
                // abort whichever connect step is in flight; its handler reports the close
                resolver_.cancel();
                withStream([](auto& ws) {
                    beast::error_code ec;
                    beast::get_lowest_layer(ws).socket().close(ec);
                });
                return;
            }
            if (!writing_ && queue_.empty()) doClose();
        }

    private:
        template <class F>
        void withStream(F&& f) {
            if (tls_) f(*tls_);
            else      f(*plain_);
        }

        std::string hostHeader() const {
            std::string h = ep_.host.find(':') != std::string::npos ? "[" + ep_.host + "]" : ep_.host;
            return h + ":" + std::to_string(ep_.port);
        }

        void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) return fail(ec, "resolve");
            withStream([&](auto& ws) {
                auto& layer = beast::get_lowest_layer(ws);
                layer.expires_after(kConnectTimeout);
                layer.async_connect(results,
                    beast::bind_front_handler(&Session::onConnect, shared_from_this()));
            });
        }

        void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
            if (ec) return fail(ec, "connect");
            if (!tls_) return handshake();

            if (!SSL_set_tlsext_host_name(tls_->next_layer().native_handle(), ep_.host.c_str())) {
                ec = beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
                return fail(ec, "tls sni");
            }
            if (owner_.opts_.verifyPeer)
                tls_->next_layer().set_verify_callback(ssl::host_name_verification(ep_.host));
            tls_->next_layer().async_handshake(ssl::stream_base::client,
                beast::bind_front_handler(&Session::onTlsHandshake, shared_from_this()));
        }

        void onTlsHandshake(beast::error_code ec) {
            if (ec) return fail(ec, "tls handshake");
            handshake();
        }

        void handshake() {
            withStream([&](auto& ws) {
                beast::get_lowest_layer(ws).expires_never();
                ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
                ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
                    req.set(beast::http::field::user_agent, "remotectl");
                }));
                ws.read_message_max(owner_.opts_.maxPayloadBytes);
                ws.text(true);
                ws.async_handshake(hostHeader(), ep_.path,
                    beast::bind_front_handler(&Session::onHandshake, shared_from_this()));
            });
        }

        void onHandshake(beast::error_code ec) {
            if (ec) return fail(ec, "websocket handshake");
            if (closeRequested_) {
                open_ = true;
                doRead();
                doClose();
                return;
            }

            open_ = true;
            LOG_DEBUG("WsClient[" + std::to_string(id_) + "]: open");
            owner_.events_.open(id_);
            if (finished_) return;
            doRead();
            if (!queue_.empty() && !writing_) doWrite();
        }

        void doRead() {
            withStream([&](auto& ws) {
                ws.async_read(buffer_, beast::bind_front_handler(&Session::onRead, shared_from_this()));
            });
        }

        void onRead(beast::error_code ec, std::size_t) {
            if (finished_) return;
            if (ec == websocket::error::closed) {
                int code = 0;
                std::string reason;
                withStream([&](auto& ws) {
                    code = static_cast<int>(ws.reason().code);
                    reason.assign(ws.reason().reason.data(), ws.reason().reason.size());
                });
                if (closeRequested_) finish(closeCode_, closeReason_);
                else                 finish(code, reason);
                return;
            }
            if (ec) return fail(ec, "read");

            bool text = true;
            withStream([&](auto& ws) { text = ws.got_text(); });
            std::string msg = beast::buffers_to_string(buffer_.data());
            buffer_.consume(buffer_.size());

            if (text) owner_.events_.message(id_, msg);
            else      LOG_DEBUG("WsClient[" + std::to_string(id_) + "]: binary frame ignored");

            if (!finished_) doRead();
        }

        void doWrite() {
            writing_ = true;
            withStream([&](auto& ws) {
                ws.async_write(asio::buffer(queue_.front()),
                    beast::bind_front_handler(&Session::onWrite, shared_from_this()));
            });
        }

        void onWrite(beast::error_code ec, std::size_t) {
            writing_ = false;
            if (finished_) return;
            if (ec) return fail(ec, "write");
            queue_.pop_front();
            if (!queue_.empty()) doWrite();
            else if (closeRequested_) doClose();
        }

        void doClose() {
            withStream([&](auto& ws) {
                ws.async_close(websocket::close_reason(static_cast<websocket::close_code>(closeCode_), closeReason_),
                    beast::bind_front_handler(&Session::onClose, shared_from_this()));
            });
        }

        void onClose(beast::error_code ec) {
            if (ec && ec != asio::error::operation_aborted)
                LOG_DEBUG("WsClient[" + std::to_string(id_) + "]: close handshake: " + ec.message());
            finish(closeCode_, closeReason_);
        }

        void fail(beast::error_code ec, const std::string& what) {
            if (finished_) return;
            if (closeRequested_) {
                finish(closeCode_, closeReason_);
                return;
            }
            LOG_WARN("WsClient[" + std::to_string(id_) + "]: " + what + " failed: " + ec.message());
            owner_.events_.error(id_, what + ": " + ec.message());
            finish(kAbnormalClosure, ec.message());
        }

        void finish(int code, const std::string& reason) {
            if (finished_) return;
            finished_ = true;
            open_ = false;
            withStream([](auto& ws) {
                beast::error_code ec;
                beast::get_lowest_layer(ws).socket().close(ec);
            });
            owner_.forget(id_);
            LOG_DEBUG("WsClient[" + std::to_string(id_) + "]: closed (" + std::to_string(code) + ")");
            owner_.events_.close(id_, code, reason);
        }

        WsClientConnector& owner_;
        ConnectionId       id_;
        Endpoint           ep_;
        tcp::resolver      resolver_;

        std::unique_ptr<websocket::stream<beast::tcp_stream>>                  plain_;
        std::unique_ptr<websocket::stream<beast::ssl_stream<beast::tcp_stream>>> tls_;

        beast::flat_buffer       buffer_;
        std::deque<std::string>  queue_;
        bool                     writing_{ false };
        bool                     open_{ false };
        bool                     finished_{ false };
        bool                     closeRequested_{ false };
        int                      closeCode_{ 1000 };
        std::string              closeReason_;
    };

    WsClientConnector::WsClientConnector(TransportOptions options,
                                         std::function<ConnectionId()> nextId,
                                         TransportEvents& events)
        : opts_(std::move(options)),
          nextId_(std::move(nextId)),
          events_(events),
          work_(asio::make_work_guard(ioc_)),
          sslCtx_(ssl::context::tls_client) {
        if (opts_.verifyPeer) {
            sslCtx_.set_default_verify_paths();
            sslCtx_.set_verify_mode(ssl::verify_peer);
        } else {
            sslCtx_.set_verify_mode(ssl::verify_none);
        }

        runner_ = std::jthread([this] {
            for (;;) {
                try {
                    ioc_.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("WsClient: handler threw: " + std::string(e.what()));
                }
            }
        });
    }

    WsClientConnector::~WsClientConnector() {
        shutdown();
    }

    ConnectionId WsClientConnector::connect(const Endpoint& endpoint) {
        if (stopped_) throw TransportError("WebSocket client is shut down");
        const ConnectionId id = nextId_();
        auto session = std::make_shared<Session>(*this, id, endpoint);
        {
            std::lock_guard<std::mutex> lk(mx_);
            sessions_[id] = session;
        }
        asio::post(ioc_, [session] { session->start(); });
        return id;
    }

    bool WsClientConnector::owns(ConnectionId id) const {
        std::lock_guard<std::mutex> lk(mx_);
        return sessions_.contains(id);
    }

    bool WsClientConnector::send(ConnectionId id, const std::string& text) {
        std::shared_ptr<Session> s;
        {
            std::lock_guard<std::mutex> lk(mx_);
            auto it = sessions_.find(id);
            if (it == sessions_.end()) return false;
            s = it->second;
        }
        asio::post(ioc_, [s, text] { s->send(text); });
        return true;
    }

    void WsClientConnector::close(ConnectionId id, int code, const std::string& reason) {
        std::shared_ptr<Session> s;
        {
            std::lock_guard<std::mutex> lk(mx_);
            auto it = sessions_.find(id);
            if (it == sessions_.end()) return;
            s = it->second;
        }
        asio::post(ioc_, [s, code, reason] { s->requestClose(code, reason); });
    }

    void WsClientConnector::forget(ConnectionId id) {
        std::lock_guard<std::mutex> lk(mx_);
        sessions_.erase(id);
    }

    void WsClientConnector::shutdown() {
        if (stopped_.exchange(true)) return;
        work_.reset();
        ioc_.stop();
        if (runner_.joinable()) {
            if (runner_.get_id() == std::this_thread::get_id()) runner_.detach();
            else runner_.join();
        }
        std::lock_guard<std::mutex> lk(mx_);
        sessions_.clear();
    }

}

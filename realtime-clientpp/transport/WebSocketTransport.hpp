#ifndef REALTIME_CLIENTPP_WEBSOCKET_TRANSPORT_HPP
#define REALTIME_CLIENTPP_WEBSOCKET_TRANSPORT_HPP

#include "Transport.hpp"
#include "../config.hpp"
#include "../Logger.hpp"
#include "../Url.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace transport {

namespace beast = boost::beast;             // from <boost/beast.hpp>
namespace http = beast::http;               // from <boost/beast/http.hpp>
namespace websocket = beast::websocket;     // from <boost/beast/websocket.hpp>
using tcp = boost::asio::ip::tcp;

/**
 * @brief WebSocket client transport implemented with Boost.Beast
 *
 * resolve -> connect -> handshake -> read loop. Outgoing frames go through
 * a write queue so at most one async_write is pending. Every completion
 * runs on the transport's strand.
 */
class WebSocketTransport : public PushTransport,
                           public std::enable_shared_from_this<WebSocketTransport> {
public:
    WebSocketTransport(asio::io_service& io_service, const PushConfig& config)
        : m_strand(asio::make_strand(io_service)),
          m_resolver(m_strand),
          m_ws(m_strand),
          m_connect_timeout(std::chrono::milliseconds(config.connect_timeout_ms)) {}

    void set_event_handler(std::shared_ptr<PushTransportHandler> handler) override {
        std::lock_guard<std::mutex> lock(m_handler_mutex);
        m_event_handler = handler;
    }

    void open(const std::string& url) override {
        Url parsed;
        if (!Url::try_parse(url, parsed) || (parsed.scheme != "ws" && parsed.scheme != "wss")) {
            report_async("Invalid WebSocket URL: " + url);
            return;
        }
        if (parsed.is_secure()) {
            report_async("wss:// is not supported by the bundled WebSocket transport");
            return;
        }

        auto self = shared_from_this();
        asio::post(m_strand, [self, parsed] {
            self->m_url = parsed;
            LOG_DEBUG("WebSocket(Beast) connecting to ", parsed.to_string());
            self->m_resolver.async_resolve(parsed.host, parsed.port,
                [self](beast::error_code ec, tcp::resolver::results_type results) {
                    if (ec) {
                        self->fail("resolve", ec);
                        return;
                    }
                    self->on_resolve(results);
                });
        });
    }

    bool send_message(const std::string& message) override {
        if (!is_open()) {
            LOG_TRACE("WebSocket(Beast) send on closed connection dropped");
            return false;
        }
        auto self = shared_from_this();
        asio::post(m_strand, [self, message] {
            bool writing = !self->m_out_queue.empty();
            self->m_out_queue.push_back(message);
            if (!writing) self->do_write();
        });
        return true;
    }

    void close(int code = close_code::NORMAL, const std::string& reason = "Normal closure") override {
        m_closing = true;
        bool was_open = m_open.exchange(false);

        auto self = shared_from_this();
        asio::post(m_strand, [self, code, reason, was_open] {
            self->m_resolver.cancel();
            if (!was_open) {
                beast::get_lowest_layer(self->m_ws).cancel();
                return;
            }
            websocket::close_reason cr(static_cast<std::uint16_t>(code), reason);
            self->m_ws.async_close(cr, [self](beast::error_code ec) {
                if (ec) {
                    LOG_DEBUG("WebSocket(Beast) close: ", ec.message());
                }
                LOG_DEBUG("WebSocket(Beast) connection closed");
            });
        });
    }

    bool is_open() const override {
        return m_open;
    }

    std::string get_name() const override { return "websocket"; }

private:
    void on_resolve(const tcp::resolver::results_type& results) {
        if (m_closing) return;
        beast::get_lowest_layer(m_ws).expires_after(m_connect_timeout);
        auto self = shared_from_this();
        beast::get_lowest_layer(m_ws).async_connect(results,
            [self](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                if (ec) {
                    self->fail("connect", ec);
                    return;
                }
                self->on_connect();
            });
    }

    void on_connect() {
        if (m_closing) return;
        // The websocket stream applies its own timeouts from here on
        beast::get_lowest_layer(m_ws).expires_never();
        m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        m_ws.set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(http::field::user_agent, std::string(defaults::USER_AGENT));
            }));

        // Host header carries the port unless it is the default
        std::string host = m_url.host;
        if (m_url.port != "80") host += ":" + m_url.port;

        auto self = shared_from_this();
        m_ws.async_handshake(host, m_url.target, [self](beast::error_code ec) {
            if (ec) {
                self->fail("handshake", ec);
                return;
            }
            self->on_handshake();
        });
    }

    void on_handshake() {
        if (m_closing) return;
        m_open = true;
        LOG_INFO("WebSocket(Beast) connected to ", m_url.to_string());
        if (auto handler = get_event_handler()) {
            handler->on_open();
        }
        do_read();
    }

    void do_read() {
        auto self = shared_from_this();
        m_ws.async_read(m_read_buffer, [self](beast::error_code ec, std::size_t bytes_transferred) {
            boost::ignore_unused(bytes_transferred);
            if (ec) {
                self->m_open = false;
                if (ec == websocket::error::closed) {
                    auto cr = self->m_ws.reason();
                    self->on_closed(static_cast<int>(cr.code), std::string(cr.reason.c_str()));
                    return;
                }
                self->fail("read", ec);
                return;
            }
            std::string payload{beast::buffers_to_string(self->m_read_buffer.data())};
            self->m_read_buffer.consume(self->m_read_buffer.size());
            if (auto handler = self->get_event_handler()) {
                handler->on_message(payload);
            }
            self->do_read();
        });
    }

    void do_write() {
        if (m_out_queue.empty()) return;
        m_ws.text(true);
        auto self = shared_from_this();
        m_ws.async_write(asio::buffer(m_out_queue.front()), [self](beast::error_code ec, std::size_t) {
            if (ec) {
                // The read loop reports the broken connection
                LOG_WARN("WebSocket(Beast) write: ", ec.message());
                self->m_out_queue.clear();
                return;
            }
            self->m_out_queue.pop_front();
            if (!self->m_out_queue.empty()) self->do_write();
        });
    }

    void fail(const char* what, beast::error_code ec) {
        m_open = false;
        if (m_closing) return;
        LOG_WARN("WebSocket(Beast) ", what, ": ", ec.message());
        if (auto handler = get_event_handler()) {
            handler->on_error(std::string(what) + ": " + ec.message());
        }
    }

    void on_closed(int code, const std::string& reason) {
        if (m_closing) return;
        LOG_INFO("WebSocket(Beast) closed by peer: ", code, " ", reason);
        if (auto handler = get_event_handler()) {
            handler->on_close(code, reason);
        }
    }

    void report_async(const std::string& error) {
        LOG_ERROR(error);
        auto self = shared_from_this();
        asio::post(m_strand, [self, error] {
            if (self->m_closing) return;
            if (auto handler = self->get_event_handler()) {
                handler->on_error(error);
            }
        });
    }

    std::shared_ptr<PushTransportHandler> get_event_handler() {
        if (m_closing) return nullptr;
        std::lock_guard<std::mutex> lock(m_handler_mutex);
        return m_event_handler;
    }

private:
    Strand m_strand;
    tcp::resolver m_resolver;
    websocket::stream<beast::tcp_stream> m_ws;
    beast::flat_buffer m_read_buffer;
    std::deque<std::string> m_out_queue;
    std::chrono::milliseconds m_connect_timeout;
    Url m_url;

    std::atomic<bool> m_open{false};
    std::atomic<bool> m_closing{false};

    mutable std::mutex m_handler_mutex;
    std::shared_ptr<PushTransportHandler> m_event_handler;
};

} // namespace transport
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_WEBSOCKET_TRANSPORT_HPP

#ifndef REALTIME_CLIENTPP_POLLING_TRANSPORT_HPP
#define REALTIME_CLIENTPP_POLLING_TRANSPORT_HPP

#include "Transport.hpp"
#include "../config.hpp"
#include "../Logger.hpp"
#include "../Url.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace transport {

namespace beast = boost::beast;     // from <boost/beast.hpp>
namespace http  = beast::http;      // from <boost/beast/http.hpp>
using tcp = boost::asio::ip::tcp;   // from <boost/asio/ip/tcp.hpp>

/**
 * @brief Builds the GET for one polling tick
 *
 * Query key segments of the form name=value become query parameters as-is.
 * A segment equal to the endpoint is skipped, and the remaining segments
 * are joined with ',' into the "key" parameter.
 */
inline FetchRequest make_fetch_request(const PollingConfig& config,
                                       const std::string& endpoint,
                                       const std::vector<std::string>& query_key) {
    FetchRequest request;
    request.endpoint = endpoint;
    request.url = Url::resolve(config.base_url, endpoint);
    request.timeout_ms = config.request_timeout_ms;
    request.user_agent = config.user_agent;

    std::string joined;
    for (const auto& segment : query_key) {
        if (segment.empty() || segment == endpoint) continue;
        auto eq = segment.find('=');
        if (eq != std::string::npos && eq > 0) {
            request.url.append_query(segment.substr(0, eq), segment.substr(eq + 1));
            continue;
        }
        if (!joined.empty()) joined += ',';
        joined += segment;
    }
    if (!joined.empty()) {
        request.url.append_query(params::QUERY_KEY, joined);
    }
    return request;
}

/**
 * @brief HTTP/1.1 GET client implemented with Boost.Beast
 *
 * One connection per request (Connection: close). Each request runs on
 * its own strand with the request timeout applied to every step.
 */
class PollingTransport : public HttpFetcher {
public:
    PollingTransport(asio::io_service& io_service, const PollingConfig& config)
        : m_io_service(io_service), m_config(config) {}

    ~PollingTransport() override {
        cancel_all();
    }

    void async_get(const FetchRequest& request, FetchCallback callback) override {
        if (request.url.is_secure()) {
            LOG_ERROR("PollingTransport cannot fetch ", request.url.to_string(), ": https is not supported");
            asio::post(m_io_service, [callback] {
                FetchResult result;
                result.error = "https is not supported by the bundled fetcher";
                callback(result);
            });
            return;
        }

        FetchRequest effective(request);
        if (effective.user_agent.empty()) effective.user_agent = m_config.user_agent;

        auto session = std::make_shared<FetchSession>(m_io_service, effective, std::move(callback));
        {
            std::lock_guard<std::mutex> lock(m_sessions_mutex);
            prune_locked();
            m_sessions.push_back(session);
        }
        LOG_TRACE("PollingTransport GET ", request.url.to_string());
        session->run();
    }

    void cancel_all() override {
        std::vector<std::weak_ptr<FetchSession>> copy;
        {
            std::lock_guard<std::mutex> lock(m_sessions_mutex);
            copy.swap(m_sessions);
        }
        for (auto& weak : copy) {
            if (auto session = weak.lock()) session->cancel();
        }
        if (!copy.empty()) {
            LOG_DEBUG("PollingTransport cancelled ", copy.size(), " outstanding requests");
        }
    }

    std::string get_name() const override { return "polling"; }

private:
    class FetchSession : public std::enable_shared_from_this<FetchSession> {
    public:
        FetchSession(asio::io_service& io_service, const FetchRequest& request, FetchCallback callback)
            : m_strand(asio::make_strand(io_service)),
              m_resolver(m_strand),
              m_stream(m_strand),
              m_request(request),
              m_callback(std::move(callback)),
              m_timeout(std::chrono::milliseconds(request.timeout_ms)) {}

        void run() {
            m_req.version(11);
            m_req.method(http::verb::get);
            m_req.target(m_request.url.target);
            std::string host = m_request.url.host;
            if (m_request.url.port != "80") host += ":" + m_request.url.port;
            m_req.set(http::field::host, host);
            m_req.set(http::field::user_agent, m_request.user_agent);
            m_req.set(http::field::accept, "application/json");
            m_req.set(http::field::connection, "close");

            auto self = shared_from_this();
            asio::post(m_strand, [self] {
                self->m_resolver.async_resolve(self->m_request.url.host, self->m_request.url.port,
                    [self](beast::error_code ec, tcp::resolver::results_type results) {
                        if (ec) return self->finish("resolve", ec);
                        self->on_resolve(results);
                    });
            });
        }

        void cancel() {
            auto self = shared_from_this();
            asio::post(m_strand, [self] {
                self->m_resolver.cancel();
                self->m_stream.cancel();
            });
        }

    private:
        void on_resolve(const tcp::resolver::results_type& results) {
            m_stream.expires_after(m_timeout);
            auto self = shared_from_this();
            m_stream.async_connect(results,
                [self](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                    if (ec) return self->finish("connect", ec);
                    self->on_connect();
                });
        }

        void on_connect() {
            m_stream.expires_after(m_timeout);
            auto self = shared_from_this();
            http::async_write(m_stream, m_req, [self](beast::error_code ec, std::size_t) {
                if (ec) return self->finish("write", ec);
                self->on_write();
            });
        }

        void on_write() {
            m_stream.expires_after(m_timeout);
            auto self = shared_from_this();
            http::async_read(m_stream, m_buffer, m_res, [self](beast::error_code ec, std::size_t) {
                if (ec) return self->finish("read", ec);
                self->finish(nullptr, ec);
            });
        }

        void finish(const char* what, beast::error_code ec) {
            if (m_done) return;
            m_done = true;

            FetchResult result;
            if (what) {
                result.error = std::string(what) + ": " + ec.message();
            } else {
                result.status = static_cast<int>(m_res.result_int());
                result.body = std::move(m_res.body());
            }

            beast::error_code ignore;
            m_stream.socket().shutdown(tcp::socket::shutdown_both, ignore);

            auto callback = std::move(m_callback);
            callback(result);
        }

        Strand m_strand;
        tcp::resolver m_resolver;
        beast::tcp_stream m_stream;
        FetchRequest m_request;
        FetchCallback m_callback;
        std::chrono::milliseconds m_timeout;
        beast::flat_buffer m_buffer;
        http::request<http::empty_body> m_req;
        http::response<http::string_body> m_res;
        bool m_done{false};
    };

    void prune_locked() {
        auto it = m_sessions.begin();
        while (it != m_sessions.end()) {
            if (it->expired()) {
                it = m_sessions.erase(it);
            } else {
                ++it;
            }
        }
    }

    asio::io_service& m_io_service;
    PollingConfig m_config;

    std::mutex m_sessions_mutex;
    std::vector<std::weak_ptr<FetchSession>> m_sessions;
};

} // namespace transport
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_POLLING_TRANSPORT_HPP

#ifndef REALTIME_CLIENTPP_TRANSPORT_HPP
#define REALTIME_CLIENTPP_TRANSPORT_HPP

#include "../config.hpp"
#include "../Constants.hpp"
#include "../Error.hpp"
#include "../RealtimeConfig.hpp"
#include "../Url.hpp"
#include <functional>
#include <memory>
#include <string>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace transport {

/**
 * @brief Push transport event handlers
 *
 * Called from the transport's own executor; implementations must not
 * assume any particular thread.
 */
class PushTransportHandler {
public:
    virtual ~PushTransportHandler() = default;

    /**
     * @brief Called once the handshake has completed
     */
    virtual void on_open() = 0;

    /**
     * @brief Called for every text frame received
     * @param message Frame text
     */
    virtual void on_message(const std::string& message) = 0;

    /**
     * @brief Called when the connection is closed by the peer or the network
     * @param code Close code
     * @param reason Close reason
     */
    virtual void on_close(int code, const std::string& reason) = 0;

    /**
     * @brief Called when a transport error occurs
     * @param error Error information
     */
    virtual void on_error(const std::string& error) = 0;
};

/**
 * @brief Abstract client-side push transport (one connection per instance)
 */
class PushTransport {
public:
    virtual ~PushTransport() = default;

    /**
     * @brief Sets the event handler for this transport
     * @param handler Event handler
     */
    virtual void set_event_handler(std::shared_ptr<PushTransportHandler> handler) = 0;

    /**
     * @brief Starts connecting; the outcome arrives through the handler
     * @param url Absolute push URL
     */
    virtual void open(const std::string& url) = 0;

    /**
     * @brief Queues a text frame
     * @param message Frame text
     * @return true if the connection is open and the frame was queued
     */
    virtual bool send_message(const std::string& message) = 0;

    /**
     * @brief Closes the connection; no handler callbacks follow
     * @param code Close code
     * @param reason Close reason
     */
    virtual void close(int code = close_code::NORMAL,
                       const std::string& reason = "Normal closure") = 0;

    /**
     * @brief Checks whether the handshake completed and the connection is still up
     */
    virtual bool is_open() const = 0;

    /**
     * @brief Gets the transport name
     */
    virtual std::string get_name() const = 0;
};

/**
 * @brief One polling GET
 */
struct FetchRequest {
    std::string endpoint;       ///< Endpoint as subscribed
    Url url;                    ///< Resolved URL including the query string
    int timeout_ms = timeouts::DEFAULT_REQUEST_TIMEOUT;
    std::string user_agent = defaults::USER_AGENT;
};

/**
 * @brief Outcome of one polling GET
 */
struct FetchResult {
    int status = 0;             ///< HTTP status, 0 if no response was received
    std::string body;
    std::string error;          ///< Network-level error, empty on a received response

    bool ok() const {
        return error.empty() && http_status::is_success(status);
    }

    std::string describe() const {
        if (!error.empty()) return error;
        return "HTTP " + std::to_string(status);
    }
};

using FetchCallback = std::function<void(const FetchResult&)>;

/**
 * @brief Abstract HTTP GET primitive used by polling
 */
class HttpFetcher {
public:
    virtual ~HttpFetcher() = default;

    /**
     * @brief Issues a GET; the callback is invoked exactly once
     * @param request Request description
     * @param callback Completion callback, called from the fetcher's executor
     */
    virtual void async_get(const FetchRequest& request, FetchCallback callback) = 0;

    /**
     * @brief Aborts every outstanding request (their callbacks still run, with an error)
     */
    virtual void cancel_all() = 0;

    /**
     * @brief Gets the fetcher name
     */
    virtual std::string get_name() const = 0;
};

/**
 * @brief Transport factory interface
 */
class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    /**
     * @brief Creates a push transport for one connection attempt
     * @param io_service IO service for async operations
     * @param config Push settings
     */
    virtual std::shared_ptr<PushTransport> create_push_transport(asio::io_service& io_service,
                                                                 const PushConfig& config) = 0;

    /**
     * @brief Creates the fetcher used for all polling requests
     * @param io_service IO service for async operations
     * @param config Polling settings
     */
    virtual std::shared_ptr<HttpFetcher> create_fetcher(asio::io_service& io_service,
                                                        const PollingConfig& config) = 0;

    /**
     * @brief Gets the transport type name
     */
    virtual std::string get_transport_type() const = 0;
};

} // namespace transport
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_TRANSPORT_HPP

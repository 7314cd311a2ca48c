#ifndef REALTIME_CLIENTPP_TESTS_FAKES_HPP
#define REALTIME_CLIENTPP_TESTS_FAKES_HPP

#include <gmock/gmock.h>

#include "transport/Transport.hpp"
#include "engine/TransportProbe.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace realtime_clientpp {
namespace fakes {

using namespace realtime_clientpp::lib;

/**
 * @brief In-process push transport driven by the test
 */
class FakePushTransport : public transport::PushTransport {
public:
    void set_event_handler(std::shared_ptr<transport::PushTransportHandler> h) override {
        handler = h;
    }

    void open(const std::string& target) override {
        url = target;
        ++open_calls;
    }

    bool send_message(const std::string& message) override {
        if (!connected || closed) return false;
        sent.push_back(message);
        return true;
    }

    void close(int code, const std::string& reason) override {
        closed = true;
        connected = false;
        close_code = code;
        close_reason = reason;
    }

    bool is_open() const override {
        return connected && !closed;
    }

    std::string get_name() const override {
        return "fake";
    }

    void simulate_open() {
        connected = true;
        if (!closed && handler) handler->on_open();
    }

    void simulate_message(const std::string& text) {
        if (!closed && handler) handler->on_message(text);
    }

    void simulate_error(const std::string& error) {
        connected = false;
        if (!closed && handler) handler->on_error(error);
    }

    void simulate_close(int code, const std::string& reason) {
        connected = false;
        if (!closed && handler) handler->on_close(code, reason);
    }

    std::shared_ptr<transport::PushTransportHandler> handler;
    std::string url;
    int open_calls = 0;
    bool connected = false;
    bool closed = false;
    int close_code = 0;
    std::string close_reason;
    std::vector<std::string> sent;
};

/**
 * @brief HTTP fetcher answering from a test-supplied responder
 *
 * Completions are posted to the io_service, or held until
 * complete_pending() when hold is set.
 */
class FakeFetcher : public transport::HttpFetcher {
public:
    typedef std::function<transport::FetchResult(const transport::FetchRequest&)> Responder;

    explicit FakeFetcher(asio::io_service& io) : m_io(io) {}

    void async_get(const transport::FetchRequest& request, transport::FetchCallback callback) override {
        requests.push_back(request);
        request_times.push_back(std::chrono::steady_clock::now());
        if (hold) {
            pending.push_back(callback);
            return;
        }
        transport::FetchResult result = responder ? responder(request) : ok("{}");
        asio::post(m_io, [callback, result] { callback(result); });
    }

    void cancel_all() override {
        ++cancel_calls;
        transport::FetchResult aborted;
        aborted.error = "Operation canceled";
        complete_pending(aborted);
    }

    std::string get_name() const override {
        return "fake";
    }

    void complete_pending(const transport::FetchResult& result) {
        std::deque<transport::FetchCallback> callbacks;
        callbacks.swap(pending);
        for (auto& callback : callbacks) {
            asio::post(m_io, [callback, result] { callback(result); });
        }
    }

    static transport::FetchResult ok(const std::string& body) {
        transport::FetchResult result;
        result.status = 200;
        result.body = body;
        return result;
    }

    static transport::FetchResult status(int code) {
        transport::FetchResult result;
        result.status = code;
        return result;
    }

    Responder responder;
    bool hold = false;
    int cancel_calls = 0;
    std::vector<transport::FetchRequest> requests;
    std::vector<std::chrono::steady_clock::time_point> request_times;
    std::deque<transport::FetchCallback> pending;

private:
    asio::io_service& m_io;
};

/**
 * @brief Factory handing out fake transports and keeping them for inspection
 */
class FakeTransportFactory : public transport::TransportFactory {
public:
    std::shared_ptr<transport::PushTransport> create_push_transport(asio::io_service&,
                                                                    const PushConfig& config) override {
        push_configs.push_back(config);
        if (fail_push_creation) {
            throw RealtimeException("push transport unavailable", RealtimeErrorCode::CONNECTION_FAILED);
        }
        auto push = std::make_shared<FakePushTransport>();
        pushes.push_back(push);
        return push;
    }

    std::shared_ptr<transport::HttpFetcher> create_fetcher(asio::io_service& io_service,
                                                           const PollingConfig&) override {
        fetcher = std::make_shared<FakeFetcher>(io_service);
        return fetcher;
    }

    std::string get_transport_type() const override {
        return "fake";
    }

    std::shared_ptr<FakePushTransport> last_push() const {
        return pushes.empty() ? nullptr : pushes.back();
    }

    bool fail_push_creation = false;
    std::vector<PushConfig> push_configs;
    std::vector<std::shared_ptr<FakePushTransport>> pushes;
    std::shared_ptr<FakeFetcher> fetcher;
};

class MockTransportProbe : public engine::TransportProbe {
public:
    MOCK_CONST_METHOD0(push_disallowed, bool());
    MOCK_CONST_METHOD0(describe, std::string());
};

} // namespace fakes
} // namespace realtime_clientpp

#endif // REALTIME_CLIENTPP_TESTS_FAKES_HPP

#ifndef REALTIME_CLIENTPP_BEAST_TRANSPORT_FACTORY_HPP
#define REALTIME_CLIENTPP_BEAST_TRANSPORT_FACTORY_HPP

#include "Transport.hpp"
#include "WebSocketTransport.hpp"
#include "PollingTransport.hpp"

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace transport {

/**
 * @brief Default factory: Beast WebSocket push, Beast HTTP polling
 */
class BeastTransportFactory : public TransportFactory {
public:
    std::shared_ptr<PushTransport> create_push_transport(asio::io_service& io_service,
                                                         const PushConfig& config) override {
        return std::make_shared<WebSocketTransport>(io_service, config);
    }

    std::shared_ptr<HttpFetcher> create_fetcher(asio::io_service& io_service,
                                                const PollingConfig& config) override {
        return std::make_shared<PollingTransport>(io_service, config);
    }

    std::string get_transport_type() const override { return "beast"; }
};

} // namespace transport
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_BEAST_TRANSPORT_FACTORY_HPP

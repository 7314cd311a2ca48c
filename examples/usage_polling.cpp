#include "../realtime-clientpp/realtime-clientpp.hpp"
#include <boost/asio.hpp>
#include <iostream>

int main() {
    using namespace realtime_clientpp;

    try {
        boost::asio::io_service io;

        RealtimeConfig config;
        config.apply_environment();
        config.status_period_ms = 2000;

        // Behave as if the deployment blocked push connections
        auto manager = RealtimeManager::create(io, config, std::make_shared<StaticProbe>(true));
        lib::Logger::instance().set_level(lib::LogLevel::DEBUG);

        manager->on_status_change([](const StatusReport& report) {
            std::cout << "Status: " << report.method << "/" << report.status << std::endl;
        });

        manager->subscribe("props", SubscriptionBinding(
            "property-update", "/api/properties", {"properties", "status=active"}, 1000,
            [](const Payload& payload) {
                std::cout << "Properties (" << payload.size() << " bytes): " << payload.data() << std::endl;
            }));

        manager->subscribe("stats", SubscriptionBinding(
            "", "/api/dashboard/stats", {}, 5000,
            [](const Payload& payload) {
                std::cout << "Stats: " << payload.data() << std::endl;
            }));

        std::cout << "Polling " << config.polling.base_url << std::endl;

        manager->connect();
        io.run_for(std::chrono::seconds(30));
        manager->disconnect();
        io.restart();
        io.poll();
    } catch (const RealtimeException& e) {
        std::cerr << "Realtime error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

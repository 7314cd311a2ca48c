#include "../realtime-clientpp/realtime-clientpp.hpp"
#include <boost/asio.hpp>
#include <iostream>
#include <string>

using namespace std;
using realtime_clientpp::Payload;
using realtime_clientpp::StatusReport;
using realtime_clientpp::SubscriptionBinding;

/**
 * @brief Example usage of the realtime manager
 *
 * This example demonstrates:
 * - Loading configuration from the environment
 * - Observing connection status changes
 * - Event-routed subscriptions with a polling fallback interval
 * - Sending a message once push is connected
 */
int main(int argc, char* argv[]) {
  try {
    boost::asio::io_service io_service;

    realtime_clientpp::RealtimeConfig config;
    if (argc > 1) {
      config = realtime_clientpp::RealtimeConfig::from_json_file(argv[1]);
    }
    config.apply_environment();
    config.push.alternate_path = "/ws-alt";

    realtime_clientpp::lib::Logger::instance().set_level(realtime_clientpp::lib::LogLevel::DEBUG);

    auto manager = realtime_clientpp::RealtimeManager::create(io_service, config);

    manager->on_status_change([&manager](const StatusReport& report) {
      cout << "Status: " << report.method << "/" << report.status
           << (report.push_disallowed ? " (push disallowed)" : "") << endl;

      if (manager->send(string("{\"event\":\"hello\",\"payload\":{\"client\":\"")
                        + manager->client_id() + "\"}}")) {
        cout << "Greeting sent" << endl;
      }
    });

    // Property updates: pushed as events, polled every second as fallback
    manager->subscribe("props", SubscriptionBinding(
        "property-update", "/api/properties", {"properties"}, 1000,
        [](const Payload& payload) {
          cout << "[props] " << payload.data() << endl;
        }));

    // Push only; inert while polling
    manager->subscribe("chat", SubscriptionBinding(
        "chat-message", "", {}, std::nullopt,
        [](const Payload& payload) {
          cout << "[chat] " << payload.data() << endl;
        }));

    manager->schemas().register_shape("property-update",
                                      realtime_clientpp::PayloadShape(realtime_clientpp::JsonKind::OBJECT, {"id"}));

    boost::asio::signal_set signals(io_service, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
      cout << "Shutting down" << endl;
      manager->disconnect();
      io_service.stop();
    });

    cout << "Client id " << manager->client_id() << ", connecting to " << config.push.url << endl;
    cout << "Press Ctrl+C to stop" << endl;

    manager->connect();
    io_service.run();

  } catch (const realtime_clientpp::RealtimeException& e) {
    cerr << "Realtime error: " << e.what() << endl;
    return 1;
  } catch (const std::exception& e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }

  return 0;
}

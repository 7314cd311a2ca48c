#ifndef REALTIME_CLIENTPP_HPP
#define REALTIME_CLIENTPP_HPP

/**
 * @file realtime-clientpp.hpp
 * @brief Main header for Realtime Client++
 *
 * Realtime Client++ keeps a set of named data subscriptions fed over
 * whichever transport currently works: a WebSocket push channel, or
 * interval-driven HTTP polling when push is unavailable.
 *
 * Architecture Overview:
 * =====================
 *
 * Transport Layer:
 * - PushTransport / HttpFetcher interfaces, created through a TransportFactory
 * - WebSocketTransport: Boost.Beast WebSocket client
 * - PollingTransport: Boost.Beast HTTP/1.1 GET client
 *
 * Engine Layer:
 * - ConnectionStateMachine: (method, status) pair plus push attempt epochs
 * - TransportProbe: decides whether push may be attempted at all
 * - HeartbeatMonitor: ping/pong liveness over the push channel
 *
 * Realtime Layer:
 * - RealtimeManager: lifecycle, subscriptions, send
 * - SubscriptionRegistry: id -> binding map
 * - DispatchEngine: push fan-out and per-subscription polling timers
 * - FailoverController: alternate push path, pinning, demotion to polling
 * - StatusReconciler: changed-only status publication
 *
 * Usage Example:
 * ==============
 *
 * ```cpp
 * asio::io_service io;
 * auto manager = realtime_clientpp::RealtimeManager::create(io);
 *
 * manager->on_status_change([](const realtime_clientpp::StatusReport& report) {
 *     std::cout << report.method << "/" << report.status << std::endl;
 * });
 *
 * manager->subscribe("props", realtime_clientpp::SubscriptionBinding(
 *     "property-update", "/api/properties", {}, 1000,
 *     [](const realtime_clientpp::Payload& payload) {
 *         std::cout << payload.data() << std::endl;
 *     }));
 *
 * manager->connect();
 * io.run();
 * ```
 */

// Core configuration and common headers
#include "config.hpp"
#include "Constants.hpp"
#include "Error.hpp"
#include "Logger.hpp"
#include "Message.hpp"
#include "Payload.hpp"
#include "EventSchema.hpp"
#include "RealtimeConfig.hpp"
#include "Url.hpp"
#include "uuid.hpp"

// Transport layer
#include "transport/Transport.hpp"
#include "transport/WebSocketTransport.hpp"
#include "transport/PollingTransport.hpp"
#include "transport/BeastTransportFactory.hpp"

// Engine layer
#include "engine/ConnectionState.hpp"
#include "engine/TransportProbe.hpp"
#include "engine/Heartbeat.hpp"

// Realtime layer
#include "realtime/Subscription.hpp"
#include "realtime/SubscriptionRegistry.hpp"
#include "realtime/DispatchEngine.hpp"
#include "realtime/FailoverController.hpp"
#include "realtime/StatusReconciler.hpp"
#include "realtime/RealtimeManager.hpp"

/**
 * @brief Main namespace for Realtime Client++
 */
namespace REALTIME_CLIENTPP_NAMESPACE {

// Version information
namespace version {
    constexpr const char* VERSION = "1.0.0";
    constexpr const char* DESCRIPTION = "Realtime Client++ push/polling subscription manager";
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;
}

// Convenience type aliases for common usage
using RealtimeManager = lib::realtime::RealtimeManager;
using SubscriptionBinding = lib::realtime::SubscriptionBinding;
using SubscriptionCallback = lib::realtime::SubscriptionCallback;
using StatusReport = lib::realtime::StatusReport;
using DispatchStats = lib::realtime::DispatchStats;
using FailoverStats = lib::realtime::FailoverStats;

using ConnectionMethod = lib::engine::ConnectionMethod;
using ConnectionStatus = lib::engine::ConnectionStatus;

// Configuration types
using PushConfig = lib::PushConfig;
using PollingConfig = lib::PollingConfig;
using HeartbeatConfig = lib::HeartbeatConfig;
using ProbeConfig = lib::ProbeConfig;

// Transport types
namespace Transport {
    using Push = lib::transport::PushTransport;
    using PushHandler = lib::transport::PushTransportHandler;
    using Fetcher = lib::transport::HttpFetcher;
    using Factory = lib::transport::TransportFactory;
    using Request = lib::transport::FetchRequest;
    using Result = lib::transport::FetchResult;
}

// Probe types
using TransportProbe = lib::engine::TransportProbe;
using EnvironmentProbe = lib::engine::EnvironmentProbe;
using StaticProbe = lib::engine::StaticProbe;

// Error types
using RealtimeException = lib::RealtimeException;
using RealtimeErrorCode = lib::RealtimeErrorCode;

/**
 * @brief Creates a manager configured from a JSON file plus environment overrides
 * @param io_service Boost ASIO IO service
 * @param path Configuration file
 * @return Shared pointer to RealtimeManager instance
 */
inline std::shared_ptr<RealtimeManager> create_manager_from_file(boost::asio::io_service& io_service,
                                                                 const std::string& path) {
    auto config = RealtimeConfig::from_json_file(path);
    config.apply_environment();
    return RealtimeManager::create(io_service, config);
}

} // namespace REALTIME_CLIENTPP_NAMESPACE

// Short alias for the main namespace
namespace rtclient = REALTIME_CLIENTPP_NAMESPACE;

#endif // REALTIME_CLIENTPP_HPP

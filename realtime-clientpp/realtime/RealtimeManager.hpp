#ifndef REALTIME_CLIENTPP_REALTIME_MANAGER_HPP
#define REALTIME_CLIENTPP_REALTIME_MANAGER_HPP

#include "../config.hpp"
#include "../Constants.hpp"
#include "../Error.hpp"
#include "../EventSchema.hpp"
#include "../Logger.hpp"
#include "../Message.hpp"
#include "../RealtimeConfig.hpp"
#include "../engine/ConnectionState.hpp"
#include "../engine/Heartbeat.hpp"
#include "../engine/TransportProbe.hpp"
#include "../transport/Transport.hpp"
#include "DispatchEngine.hpp"
#include "FailoverController.hpp"
#include "StatusReconciler.hpp"
#include "Subscription.hpp"
#include "SubscriptionRegistry.hpp"

#include <rapidjson/document.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace realtime {

/**
 * @brief Realtime connection and subscription manager
 *
 * Owns transport selection, the connection lifecycle and the subscription
 * registry. Lifecycle calls return immediately; the work runs on the
 * manager's strand, which also receives every transport event, timer
 * expiry and fetch completion. Transport failures only ever surface as
 * status changes.
 */
class RealtimeManager : public std::enable_shared_from_this<RealtimeManager> {
private:
    // Private tag for constructor access control
    struct PrivateTag {};

public:
    /**
     * @brief Creates a new manager (factory method)
     * @param io_service IO service driving every asynchronous operation
     * @param config Configuration; validated here
     * @param probe Deployment probe (EnvironmentProbe over config.probe if null)
     * @param factory Transport factory (Beast transports if null)
     * @return Shared pointer to the initialized manager
     * @throws RealtimeException with INVALID_CONFIG if the configuration is invalid
     */
    static std::shared_ptr<RealtimeManager> create(asio::io_service& io_service,
                                                   const RealtimeConfig& config = RealtimeConfig(),
                                                   std::shared_ptr<engine::TransportProbe> probe = nullptr,
                                                   std::shared_ptr<transport::TransportFactory> factory = nullptr);

    /**
     * @brief Tagged constructor (use create() instead)
     */
    RealtimeManager(PrivateTag, asio::io_service& io_service, const RealtimeConfig& config,
                    std::shared_ptr<engine::TransportProbe> probe,
                    std::shared_ptr<transport::TransportFactory> factory);

    ~RealtimeManager();

    RealtimeManager(const RealtimeManager&) = delete;
    RealtimeManager& operator=(const RealtimeManager&) = delete;

    engine::ConnectionMethod get_connection_method() const {
        return m_state.method();
    }

    engine::ConnectionStatus get_connection_status() const {
        return m_state.status();
    }

    /**
     * @brief Starts a connect cycle: polling if the probe disallows push, else a push attempt
     */
    void connect();

    /**
     * @brief Closes the active transport; subscriptions are kept
     */
    void disconnect();

    /**
     * @brief Switches to polling regardless of the probe
     */
    void force_polling();

    /**
     * @brief Switches to push regardless of the probe and pins it
     */
    void force_websockets();

    /**
     * @brief Adds or replaces a subscription
     * @throws RealtimeException with INVALID_SUBSCRIPTION for an empty id,
     *         a missing callback or a non-positive interval
     */
    void subscribe(const SubscriptionId& id, SubscriptionBinding binding);

    /**
     * @brief Removes a subscription; unknown ids are ignored
     */
    void unsubscribe(const SubscriptionId& id);

    /**
     * @brief Writes data to the push transport
     * @param data JSON text, or plain text which is sent as a JSON string
     * @return true only if dispatched in (push, connected)
     */
    bool send(const string& data);

    /**
     * @brief Writes a JSON value to the push transport
     * @return true only if dispatched in (push, connected)
     */
    bool send(const rapidjson::Value& data);

    /**
     * @brief Attaches a status observer
     */
    boost::signals2::connection on_status_change(const StatusReconciler::StatusSignal::slot_type& slot) {
        return m_reconciler->connect(slot);
    }

    const string& client_id() const {
        return m_client_id;
    }

    bool has_subscription(const SubscriptionId& id) const {
        return m_registry->contains(id);
    }

    size_t subscription_count() const {
        return m_registry->size();
    }

    vector<SubscriptionId> subscription_ids() const {
        return m_registry->ids();
    }

    EventSchemaRegistry& schemas() {
        return *m_schemas;
    }

    DispatchStats dispatch_stats() const {
        return m_dispatch->stats();
    }

    FailoverStats failover_stats() const {
        return m_failover.stats();
    }

    StatusReport status_report() const;

    const RealtimeConfig& config() const {
        return m_config;
    }

    Strand& strand() {
        return m_strand;
    }

private:
    class PushHandler;

    void initialize();

    // Strand-side operations
    void do_connect();
    void do_disconnect();
    void do_force_polling();
    void do_force_websockets();
    void on_subscribed(const SubscriptionId& id, uint64_t generation);
    void on_unsubscribed(const SubscriptionId& id);

    void start_push();
    void enter_polling(const string& reason);
    void close_push(int code, const string& reason);
    void reconcile_now();

    void handle_push_open(uint64_t epoch);
    void handle_push_message(uint64_t epoch, const string& text);
    void handle_push_failure(uint64_t epoch, const string& reason, int code = close_code::ABNORMAL);

    bool write_push(const string& text);

    template<typename Handler>
    void post(Handler&& handler) {
        std::weak_ptr<RealtimeManager> weak = shared_from_this();
        asio::post(m_strand, [weak, handler]() mutable {
            if (auto self = weak.lock()) {
                handler(*self);
            }
        });
    }

private:
    asio::io_service& m_io_service;
    Strand m_strand;
    RealtimeConfig m_config;
    string m_client_id;

    std::shared_ptr<engine::TransportProbe> m_probe;
    std::shared_ptr<transport::TransportFactory> m_factory;
    std::shared_ptr<SubscriptionRegistry> m_registry;
    std::shared_ptr<EventSchemaRegistry> m_schemas;
    std::shared_ptr<transport::HttpFetcher> m_fetcher;

    engine::ConnectionStateMachine m_state;
    FailoverController m_failover;
    std::atomic<bool> m_push_disallowed;

    std::shared_ptr<DispatchEngine> m_dispatch;
    std::shared_ptr<StatusReconciler> m_reconciler;
    std::shared_ptr<engine::HeartbeatMonitor> m_heartbeat;

    mutable std::mutex m_push_mutex;
    std::shared_ptr<transport::PushTransport> m_push;
    uint64_t m_push_epoch;      // strand only; 0 when no attempt is live
};

} // namespace realtime
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_REALTIME_MANAGER_HPP

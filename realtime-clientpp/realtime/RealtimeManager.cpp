#include "RealtimeManager.hpp"
#include "../uuid.hpp"
#include "../transport/BeastTransportFactory.hpp"

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace realtime {

namespace {
    const char* const HEARTBEAT_TIMEOUT_REASON = "Heartbeat timeout";
}

/**
 * @brief Forwards one push attempt's events onto the manager's strand
 *
 * Each attempt gets its own handler tagged with the attempt's epoch.
 */
class RealtimeManager::PushHandler : public transport::PushTransportHandler {
public:
    PushHandler(std::weak_ptr<RealtimeManager> manager, uint64_t epoch)
        : m_manager(std::move(manager)), m_epoch(epoch) {}

    void on_open() override {
        auto epoch = m_epoch;
        dispatch([epoch](RealtimeManager& self) { self.handle_push_open(epoch); });
    }

    void on_message(const std::string& message) override {
        auto epoch = m_epoch;
        dispatch([epoch, message](RealtimeManager& self) { self.handle_push_message(epoch, message); });
    }

    void on_close(int code, const std::string& reason) override {
        auto epoch = m_epoch;
        string text = "Connection closed (" + std::to_string(code) + (reason.empty() ? ")" : "): " + reason);
        dispatch([epoch, text, code](RealtimeManager& self) { self.handle_push_failure(epoch, text, code); });
    }

    void on_error(const std::string& error) override {
        auto epoch = m_epoch;
        dispatch([epoch, error](RealtimeManager& self) { self.handle_push_failure(epoch, error); });
    }

private:
    template<typename Handler>
    void dispatch(Handler handler) {
        auto manager = m_manager.lock();
        if (!manager) return;
        manager->post(std::move(handler));
    }

    std::weak_ptr<RealtimeManager> m_manager;
    uint64_t m_epoch;
};

std::shared_ptr<RealtimeManager> RealtimeManager::create(asio::io_service& io_service,
                                                         const RealtimeConfig& config,
                                                         std::shared_ptr<engine::TransportProbe> probe,
                                                         std::shared_ptr<transport::TransportFactory> factory) {
    config.validate();
    if (!config.log_level.empty()) {
        auto& logger = Logger::instance();
        logger.set_level(Logger::parse_level(config.log_level, logger.get_level()));
    }

    auto manager = std::make_shared<RealtimeManager>(PrivateTag{}, io_service, config,
                                                     std::move(probe), std::move(factory));
    manager->initialize();
    return manager;
}

RealtimeManager::RealtimeManager(PrivateTag, asio::io_service& io_service, const RealtimeConfig& config,
                                 std::shared_ptr<engine::TransportProbe> probe,
                                 std::shared_ptr<transport::TransportFactory> factory)
    : m_io_service(io_service)
    , m_strand(asio::make_strand(io_service))
    , m_config(config)
    , m_client_id(uuid::client_id())
    , m_probe(std::move(probe))
    , m_factory(std::move(factory))
    , m_registry(std::make_shared<SubscriptionRegistry>())
    , m_schemas(std::make_shared<EventSchemaRegistry>())
    , m_failover(config.push)
    , m_push_disallowed(false)
    , m_push_epoch(0) {
    if (!m_probe) {
        m_probe = std::make_shared<engine::EnvironmentProbe>(m_config.probe);
    }
    if (!m_factory) {
        m_factory = std::make_shared<transport::BeastTransportFactory>();
    }

    m_fetcher = m_factory->create_fetcher(m_io_service, m_config.polling);
    if (!m_fetcher) {
        throw RealtimeException("Transport factory '" + m_factory->get_transport_type() + "' returned no fetcher",
                                RealtimeErrorCode::INVALID_CONFIG);
    }
    m_dispatch = std::make_shared<DispatchEngine>(m_strand, m_registry, m_schemas, m_fetcher, m_config.polling);
}

RealtimeManager::~RealtimeManager() {
    std::shared_ptr<transport::PushTransport> push;
    {
        std::lock_guard<std::mutex> lock(m_push_mutex);
        push.swap(m_push);
    }
    if (push) {
        push->close(close_code::GOING_AWAY, "Manager destroyed");
    }
    m_fetcher->cancel_all();
    LOG_DEBUG("Realtime manager destroyed (client id ", m_client_id, ")");
}

void RealtimeManager::initialize() {
    std::weak_ptr<RealtimeManager> weak = shared_from_this();

    m_reconciler = std::make_shared<StatusReconciler>(m_strand, m_config.status_period_ms, [weak]() {
        auto self = weak.lock();
        return self ? self->status_report() : StatusReport();
    });

    m_heartbeat = std::make_shared<engine::HeartbeatMonitor>(
        m_strand, m_config.heartbeat,
        [weak](const string& text) {
            auto self = weak.lock();
            return self && self->write_push(text);
        },
        [weak]() {
            if (auto self = weak.lock()) {
                self->handle_push_failure(self->m_push_epoch, HEARTBEAT_TIMEOUT_REASON,
                                          close_code::HEARTBEAT_TIMEOUT);
            }
        });

    LOG_INFO("Realtime manager created (client id ", m_client_id, ", ",
             m_factory->get_transport_type(), " transports)");
}

void RealtimeManager::connect() {
    post([](RealtimeManager& self) { self.do_connect(); });
}

void RealtimeManager::disconnect() {
    post([](RealtimeManager& self) { self.do_disconnect(); });
}

void RealtimeManager::force_polling() {
    post([](RealtimeManager& self) { self.do_force_polling(); });
}

void RealtimeManager::force_websockets() {
    post([](RealtimeManager& self) { self.do_force_websockets(); });
}

void RealtimeManager::subscribe(const SubscriptionId& id, SubscriptionBinding binding) {
    binding.validate(id);

    auto generation = m_registry->upsert(id, std::move(binding))->generation;
    post([id, generation](RealtimeManager& self) { self.on_subscribed(id, generation); });
}

void RealtimeManager::unsubscribe(const SubscriptionId& id) {
    if (!m_registry->remove(id)) {
        LOG_TRACE("Unsubscribe for unknown id ignored: ", id);
        return;
    }
    LOG_DEBUG("Subscription removed: ", id);
    post([id](RealtimeManager& self) { self.on_unsubscribed(id); });
}

bool RealtimeManager::send(const string& data) {
    if (!m_state.can_send()) {
        LOG_TRACE("Send refused in state ", m_state.method(), "/", m_state.status());
        return false;
    }
    return write_push(json::is_valid(data) ? data : json::quote(data));
}

bool RealtimeManager::send(const rapidjson::Value& data) {
    if (!m_state.can_send()) {
        LOG_TRACE("Send refused in state ", m_state.method(), "/", m_state.status());
        return false;
    }
    return write_push(json::serialize(data));
}

StatusReport RealtimeManager::status_report() const {
    auto snapshot = m_state.snapshot();
    StatusReport report;
    report.method = snapshot.method;
    report.status = snapshot.status;
    report.push_disallowed = m_push_disallowed;
    return report;
}

void RealtimeManager::do_connect() {
    m_failover.begin_cycle();
    m_failover.clear_pin();

    bool disallowed = m_probe->push_disallowed();
    m_push_disallowed = disallowed;
    m_reconciler->start();

    auto snapshot = m_state.snapshot();
    if (disallowed) {
        LOG_INFO("Push not attempted: ", m_probe->describe());
        if (snapshot.method == engine::ConnectionMethod::POLLING) {
            reconcile_now();
            return;
        }
        enter_polling(m_probe->describe());
        return;
    }

    if (snapshot.method == engine::ConnectionMethod::PUSH
        && (snapshot.status == engine::ConnectionStatus::CONNECTED
            || snapshot.status == engine::ConnectionStatus::CONNECTING)) {
        LOG_DEBUG("Connect ignored, push already ", snapshot.status);
        reconcile_now();
        return;
    }
    start_push();
}

void RealtimeManager::do_disconnect() {
    close_push(close_code::NORMAL, "Client disconnect");
    m_push_epoch = 0;
    m_heartbeat->stop();
    m_dispatch->disarm_all();
    m_state.reset();
    m_failover.clear_pin();

    LOG_INFO("Disconnected (", m_registry->size(), " subscriptions kept)");
    reconcile_now();
    m_reconciler->stop();
}

void RealtimeManager::do_force_polling() {
    m_failover.clear_pin();
    m_reconciler->start();
    if (m_state.method() == engine::ConnectionMethod::POLLING) {
        LOG_DEBUG("Polling already in effect");
        reconcile_now();
        return;
    }
    enter_polling("forced");
}

void RealtimeManager::do_force_websockets() {
    m_failover.pin_push();
    m_reconciler->start();

    auto snapshot = m_state.snapshot();
    if (snapshot.method == engine::ConnectionMethod::PUSH
        && (snapshot.status == engine::ConnectionStatus::CONNECTED
            || snapshot.status == engine::ConnectionStatus::CONNECTING)) {
        LOG_DEBUG("Push already in effect (", snapshot.status, ")");
        reconcile_now();
        return;
    }

    m_failover.begin_cycle();
    start_push();
}

void RealtimeManager::on_subscribed(const SubscriptionId& id, uint64_t generation) {
    // A later subscribe or unsubscribe for the same id already superseded this one
    if (!m_registry->is_current(id, generation)) return;

    auto entry = m_registry->find(id);
    if (!entry) return;

    if (m_state.method() == engine::ConnectionMethod::POLLING) {
        // A mode switch queued ahead of us may have armed this binding already
        if (!m_dispatch->is_armed(id, generation)) m_dispatch->arm(entry);
        return;
    }

    m_dispatch->disarm(id);
    if (!entry->binding.routes_push() && !entry->binding.polls()) {
        LOG_DEBUG("Subscription ", id, " has neither an event nor a polling interval, inert");
    }
}

void RealtimeManager::on_unsubscribed(const SubscriptionId& id) {
    if (m_registry->contains(id)) return;
    m_dispatch->disarm(id);
}

void RealtimeManager::start_push() {
    close_push(close_code::NORMAL, "Superseded by a new connection");
    m_heartbeat->stop();
    m_dispatch->disarm_all();

    auto epoch = m_state.begin_connecting();
    m_push_epoch = epoch;
    string url = m_failover.push_url(m_client_id);

    std::shared_ptr<transport::PushTransport> push;
    try {
        push = m_factory->create_push_transport(m_io_service, m_config.push);
    } catch (const std::exception& e) {
        LOG_ERROR("Push transport creation failed: ", e.what());
    }
    reconcile_now();

    if (!push) {
        post([epoch](RealtimeManager& self) {
            self.handle_push_failure(epoch, "Push transport unavailable");
        });
        return;
    }

    push->set_event_handler(std::make_shared<PushHandler>(shared_from_this(), epoch));
    {
        std::lock_guard<std::mutex> lock(m_push_mutex);
        m_push = push;
    }

    LOG_INFO("Connecting push (", push->get_name(), ") to ", url,
             m_failover.on_alternate() ? " [alternate]" : "");
    push->open(url);
}

void RealtimeManager::enter_polling(const string& reason) {
    close_push(close_code::GOING_AWAY, "Switching to polling");
    m_push_epoch = 0;
    m_heartbeat->stop();

    m_state.enter_polling();
    m_dispatch->disarm_all();
    auto armed = m_dispatch->arm_all();

    LOG_INFO("Polling mode (", reason, "): ", armed, " of ", m_registry->size(), " subscriptions armed");
    reconcile_now();
}

void RealtimeManager::close_push(int code, const string& reason) {
    std::shared_ptr<transport::PushTransport> push;
    {
        std::lock_guard<std::mutex> lock(m_push_mutex);
        push.swap(m_push);
    }
    if (push) {
        LOG_DEBUG("Closing push transport (", code, "): ", reason);
        push->close(code, reason);
    }
}

void RealtimeManager::reconcile_now() {
    if (m_reconciler) m_reconciler->reconcile();
}

void RealtimeManager::handle_push_open(uint64_t epoch) {
    if (epoch != m_push_epoch) {
        LOG_DEBUG("Ignoring open from superseded push attempt (epoch ", epoch, ")");
        return;
    }
    if (!m_state.mark_connected(epoch)) return;

    LOG_INFO("Push connected (client id ", m_client_id, ")");
    m_heartbeat->start();
    reconcile_now();
}

void RealtimeManager::handle_push_message(uint64_t epoch, const string& text) {
    if (epoch != m_push_epoch || !m_state.can_send()) {
        LOG_TRACE("Ignoring frame from inactive push attempt (epoch ", epoch, ")");
        return;
    }

    PushMessage message;
    try {
        message = PushMessage::decode(text);
    } catch (const RealtimeException& e) {
        LOG_WARN("Dropping malformed push frame: ", e.what());
        return;
    }

    if (engine::HeartbeatMonitor::is_pong(message)) {
        m_heartbeat->on_pong();
    }
    m_dispatch->dispatch_push(message);
}

void RealtimeManager::handle_push_failure(uint64_t epoch, const string& reason, int code) {
    if (epoch == 0 || epoch != m_push_epoch || !m_state.is_current(epoch)) {
        LOG_DEBUG("Ignoring failure from superseded push attempt: ", reason);
        return;
    }
    // Error and close may both arrive for one attempt; only the first counts
    m_push_epoch = 0;

    LOG_WARN("Push transport failed: ", reason);
    m_heartbeat->stop();
    close_push(code, reason);
    m_state.mark_error(epoch);
    reconcile_now();

    switch (m_failover.on_failure(reason)) {
        case FailoverAction::RETRY_ALTERNATE:
            start_push();
            break;
        case FailoverAction::STAY:
            LOG_INFO("Push pinned, staying in error state until connect() or force_websockets()");
            break;
        case FailoverAction::DEMOTE:
            enter_polling(reason);
            break;
    }
}

bool RealtimeManager::write_push(const string& text) {
    std::shared_ptr<transport::PushTransport> push;
    {
        std::lock_guard<std::mutex> lock(m_push_mutex);
        push = m_push;
    }
    if (!push || !push->send_message(text)) {
        LOG_DEBUG("Push write failed, transport not open");
        return false;
    }
    return true;
}

} // namespace realtime
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#ifndef REALTIME_CLIENTPP_HEARTBEAT_HPP
#define REALTIME_CLIENTPP_HEARTBEAT_HPP

#include "../config.hpp"
#include "../Constants.hpp"
#include "../Logger.hpp"
#include "../Message.hpp"
#include "../RealtimeConfig.hpp"

#include <rapidjson/document.h>

#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <memory>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace engine {

/**
 * @brief Application-level ping/pong over the push envelope
 *
 * While running, sends a ping every interval and reports a timeout when
 * no pong arrives within timeout_ms of start or of the previous pong.
 * All methods must be called on the strand the monitor was created with.
 */
class HeartbeatMonitor : public std::enable_shared_from_this<HeartbeatMonitor> {
public:
    using SendHandler = function<bool(const string&)>;
    using TimeoutHandler = function<void()>;

    HeartbeatMonitor(Strand strand, const HeartbeatConfig& config,
                     SendHandler send, TimeoutHandler on_timeout)
        : m_config(config)
        , m_send(std::move(send))
        , m_on_timeout(std::move(on_timeout))
        , m_ping_timer(strand)
        , m_deadline_timer(strand)
        , m_running(false)
        , m_generation(0)
        , m_pings_sent(0) {}

    bool enabled() const {
        return m_config.interval_ms > 0;
    }

    bool running() const {
        return m_running;
    }

    size_t pings_sent() const {
        return m_pings_sent;
    }

    void start() {
        if (!enabled()) {
            LOG_DEBUG("Heartbeat disabled");
            return;
        }
        stop();
        m_running = true;
        ++m_generation;
        schedule_ping();
        arm_deadline();
        LOG_DEBUG("Heartbeat started (interval ", m_config.interval_ms, "ms, timeout ", m_config.timeout_ms, "ms)");
    }

    void stop() {
        if (!m_running) return;
        m_running = false;
        ++m_generation;
        m_ping_timer.cancel();
        m_deadline_timer.cancel();
        LOG_TRACE("Heartbeat stopped");
    }

    /**
     * @brief Refreshes liveness
     */
    void on_pong() {
        if (!m_running) return;
        LOG_TRACE("Heartbeat pong received");
        arm_deadline();
    }

    static string make_ping(int64_t timestamp_ms) {
        rapidjson::Document payload;
        payload.SetObject();
        auto& alloc = payload.GetAllocator();
        payload.AddMember(rapidjson::StringRef(wire::ACTION), rapidjson::StringRef(heartbeat::PING), alloc);
        rapidjson::Value ts(timestamp_ms);
        payload.AddMember(rapidjson::StringRef(wire::TIMESTAMP), ts, alloc);
        return PushMessage::encode(heartbeat::EVENT, payload);
    }

    static bool is_pong(const PushMessage& msg) {
        if (!msg.is_heartbeat() || !msg.json || !msg.json->IsObject()) return false;
        auto it = msg.json->FindMember(wire::ACTION);
        return it != msg.json->MemberEnd() && it->value.IsString()
               && string(it->value.GetString(), it->value.GetStringLength()) == heartbeat::PONG;
    }

private:
    void schedule_ping() {
        m_ping_timer.expires_after(std::chrono::milliseconds(m_config.interval_ms));
        std::weak_ptr<HeartbeatMonitor> weak = shared_from_this();
        auto generation = m_generation;
        m_ping_timer.async_wait([weak, generation](const boost::system::error_code& ec) {
            auto self = weak.lock();
            if (ec || !self || generation != self->m_generation) {
                return; // Timer cancelled or monitor restarted
            }
            self->send_ping();
        });
    }

    void send_ping() {
        auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        if (m_send && m_send(make_ping(static_cast<int64_t>(now)))) {
            ++m_pings_sent;
            LOG_TRACE("Heartbeat ping sent");
        } else {
            LOG_WARN("Heartbeat ping could not be sent");
        }
        schedule_ping();
    }

    void arm_deadline() {
        m_deadline_timer.expires_after(std::chrono::milliseconds(m_config.timeout_ms));
        std::weak_ptr<HeartbeatMonitor> weak = shared_from_this();
        auto generation = m_generation;
        m_deadline_timer.async_wait([weak, generation](const boost::system::error_code& ec) {
            auto self = weak.lock();
            if (ec || !self || generation != self->m_generation) {
                return;
            }
            LOG_WARN("Heartbeat timeout: no pong within ", self->m_config.timeout_ms, "ms");
            self->stop();
            if (self->m_on_timeout) self->m_on_timeout();
        });
    }

    HeartbeatConfig m_config;
    SendHandler m_send;
    TimeoutHandler m_on_timeout;
    asio::steady_timer m_ping_timer;
    asio::steady_timer m_deadline_timer;
    bool m_running;
    uint64_t m_generation;
    size_t m_pings_sent;
};

} // namespace engine
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_HEARTBEAT_HPP

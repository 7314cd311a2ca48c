#ifndef REALTIME_CLIENTPP_TRANSPORT_PROBE_HPP
#define REALTIME_CLIENTPP_TRANSPORT_PROBE_HPP

#include "../config.hpp"
#include "../Constants.hpp"
#include "../Logger.hpp"
#include "../RealtimeConfig.hpp"

#include <cstdlib>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace engine {

/**
 * @brief Classifies the deployment: may a push connection be attempted?
 */
class TransportProbe {
public:
    virtual ~TransportProbe() = default;

    /**
     * @brief true if this deployment is known to block push connections
     */
    virtual bool push_disallowed() const = 0;

    /**
     * @brief Short human-readable reason for the last classification
     */
    virtual string describe() const = 0;
};

/**
 * @brief Probe reading the process environment
 *
 * Push is disallowed when the force flag is set (configuration or
 * REALTIME_FORCE_POLLING) or when any marker variable is present.
 */
class EnvironmentProbe : public TransportProbe {
public:
    explicit EnvironmentProbe(const ProbeConfig& config = ProbeConfig())
        : m_config(config) {}

    bool push_disallowed() const override {
        return !reason().empty();
    }

    string describe() const override {
        auto r = reason();
        return r.empty() ? "push allowed" : r;
    }

private:
    string reason() const {
        if (m_config.force_polling) {
            return "polling forced by configuration";
        }
        if (const char* v = std::getenv(defaults::FORCE_POLLING_ENV)) {
            if (parse_flag(v)) {
                return string("polling forced by ") + defaults::FORCE_POLLING_ENV;
            }
        }
        for (const auto& marker : m_config.marker_variables) {
            if (!marker.empty() && std::getenv(marker.c_str())) {
                return "hosted environment detected (" + marker + ")";
            }
        }
        return string();
    }

    ProbeConfig m_config;
};

/**
 * @brief Probe with a fixed answer
 */
class StaticProbe : public TransportProbe {
public:
    explicit StaticProbe(bool disallowed) : m_disallowed(disallowed) {}

    bool push_disallowed() const override { return m_disallowed; }

    string describe() const override {
        return m_disallowed ? "push disallowed (static)" : "push allowed (static)";
    }

private:
    bool m_disallowed;
};

} // namespace engine
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_TRANSPORT_PROBE_HPP

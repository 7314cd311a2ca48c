#ifndef REALTIME_CLIENTPP_LOGGER_HPP
#define REALTIME_CLIENTPP_LOGGER_HPP

#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

/**
 * @brief Process-wide logger shared by every realtime component
 *
 * Lines go to std::cout unless another sink is installed with set_sink().
 * Writes are serialized so that completions running on several io_service
 * threads do not interleave their output.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        current_level_ = level;
    }

    LogLevel get_level() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return current_level_;
    }

    /**
     * @brief Redirects output; nullptr restores std::cout
     */
    void set_sink(std::ostream* sink) {
        std::lock_guard<std::mutex> lock(m_mutex);
        sink_ = sink ? sink : &std::cout;
    }

    bool enabled(LogLevel level) const {
        return level >= get_level();
    }

    /**
     * @brief Parses a level name ("trace", "Debug", "WARN", ...)
     * @param name Level name, case-insensitive
     * @param fallback Returned when the name is not recognised
     */
    static LogLevel parse_level(const string& name, LogLevel fallback = LogLevel::INFO) {
        string lowered(name);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "trace") return LogLevel::TRACE;
        if (lowered == "debug") return LogLevel::DEBUG;
        if (lowered == "info") return LogLevel::INFO;
        if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
        if (lowered == "error") return LogLevel::ERROR;
        if (lowered == "fatal") return LogLevel::FATAL;
        return fallback;
    }

    template<typename... Args>
    void log(LogLevel level, const string& format, Args&&... args) {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        oss << " [" << level_to_string(level) << "] ";

        format_message(oss, format, std::forward<Args>(args)...);

        std::lock_guard<std::mutex> lock(m_mutex);
        *sink_ << oss.str() << std::endl;
    }

    template<typename... Args>
    void trace(const string& format, Args&&... args) {
        log(LogLevel::TRACE, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const string& format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const string& format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const string& format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const string& format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(const string& format, Args&&... args) {
        log(LogLevel::FATAL, format, std::forward<Args>(args)...);
    }

    static const char* level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKNOWN";
        }
    }

private:
    Logger() : current_level_(LogLevel::INFO), sink_(&std::cout) {}

    mutable std::mutex m_mutex;
    LogLevel current_level_;
    std::ostream* sink_;

    template<typename T>
    void format_message(std::ostringstream& oss, const T& value) {
        oss << value;
    }

    template<typename T, typename... Args>
    void format_message(std::ostringstream& oss, const T& value, Args&&... args) {
        oss << value;
        format_message(oss, std::forward<Args>(args)...);
    }
};

#define LOG_TRACE(...) REALTIME_CLIENTPP_NAMESPACE::lib::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) REALTIME_CLIENTPP_NAMESPACE::lib::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  REALTIME_CLIENTPP_NAMESPACE::lib::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  REALTIME_CLIENTPP_NAMESPACE::lib::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) REALTIME_CLIENTPP_NAMESPACE::lib::Logger::instance().error(__VA_ARGS__)
#define LOG_FATAL(...) REALTIME_CLIENTPP_NAMESPACE::lib::Logger::instance().fatal(__VA_ARGS__)

} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_LOGGER_HPP

#ifndef NETPILOT_LOGGER_HPP
#define NETPILOT_LOGGER_HPP

#include <atomic>    // For std::atomic
#include <string>    // For std::string, std::to_string
#include <iostream>  // For std::cout, std::cerr, std::endl, std::ostream
#include <ctime>     // For std::time_t, std::time, std::localtime, std::strftime, struct std::tm
#include <cstdio>    // For std::snprintf
#include <cstddef>   // For std::size_t
#include <mutex>     // For std::mutex

namespace netpilot {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

class PilotLogger {
public:
    explicit PilotLogger(LogLevel min_level = LogLevel::INFO) : min_log_level_(min_level) {}

    void set_min_log_level(LogLevel level) {
        min_log_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel get_min_log_level() const {
        return min_log_level_.load(std::memory_order_relaxed);
    }

    void log(LogLevel level, const std::string& component, const std::string& message) const {
        if (level < get_min_log_level()) {
            return;
        }

        std::time_t t = std::time(nullptr);
        char time_buf[100];
        struct std::tm local_tm_buf;
        struct std::tm* local_tm = localtime_r(&t, &local_tm_buf);

        if (!local_tm || !std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", local_tm)) {
            std::snprintf(time_buf, sizeof(time_buf), "YYYY-MM-DD HH:MM:SS");
        }

        std::ostream& output_stream = (level >= LogLevel::ERROR) ? std::cerr : std::cout;

        // Pool reaper and request threads share the streams.
        std::lock_guard<std::mutex> lock(output_mutex_);
        output_stream << "[" << time_buf << "] "
                      << "[" << level_to_string(level) << "] "
                      << "[" << component << "] "
                      << message << std::endl;
    }

    void debug(const std::string& component, const std::string& message) const {
        log(LogLevel::DEBUG, component, message);
    }
    void info(const std::string& component, const std::string& message) const {
        log(LogLevel::INFO, component, message);
    }
    void warning(const std::string& component, const std::string& message) const {
        log(LogLevel::WARNING, component, message);
    }
    void error(const std::string& component, const std::string& message) const {
        log(LogLevel::ERROR, component, message);
    }
    void critical(const std::string& component, const std::string& message) const {
        log(LogLevel::CRITICAL, component, message);
    }

    // Shortens remote output for log lines and error messages.
    static std::string excerpt(const std::string& text, std::size_t max_len = 200) {
        std::string flat = text;
        for (char& c : flat) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        if (flat.size() <= max_len) {
            return flat;
        }
        return flat.substr(0, max_len) + "...(" + std::to_string(flat.size() - max_len) + " more bytes)";
    }

    static std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return "DEBUG   ";
            case LogLevel::INFO:     return "INFO    ";
            case LogLevel::WARNING:  return "WARNING ";
            case LogLevel::ERROR:    return "ERROR   ";
            case LogLevel::CRITICAL: return "CRITICAL";
            default:                 return "UNKNOWN ";
        }
    }

private:
    std::atomic<LogLevel> min_log_level_; // changed at runtime while other threads log
    mutable std::mutex output_mutex_;
};

} // namespace netpilot

#endif // NETPILOT_LOGGER_HPP

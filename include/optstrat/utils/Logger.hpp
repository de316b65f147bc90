#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace optstrat::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    OFF
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::OFF:     return "OFF";
    }
    return "UNKNOWN";
}

class Logger {
public:
    explicit Logger(std::string component_name)
        : component_name_(std::move(component_name)) {}

    // Process-wide sink settings shared by every component logger.
    static void configure(LogLevel min_level, std::ostream& sink = std::clog) {
        std::lock_guard<std::mutex> lock(state().mutex);
        state().min_level = min_level;
        state().sink = &sink;
    }

    static LogLevel min_level() {
        std::lock_guard<std::mutex> lock(state().mutex);
        return state().min_level;
    }

    bool is_enabled(LogLevel level) const {
        return level != LogLevel::OFF && level >= min_level();
    }

    const std::string& component() const noexcept { return component_name_; }

    template<typename... Args>
    void log(LogLevel level, Args&&... args) const {
        if (!is_enabled(level)) {
            return;
        }
        std::ostringstream message;
        (message << ... << std::forward<Args>(args));
        write(level, message.str());
    }

    template<typename... Args>
    void debug(Args&&... args) const { log(LogLevel::DEBUG, std::forward<Args>(args)...); }

    template<typename... Args>
    void info(Args&&... args) const { log(LogLevel::INFO, std::forward<Args>(args)...); }

    template<typename... Args>
    void warning(Args&&... args) const { log(LogLevel::WARNING, std::forward<Args>(args)...); }

    template<typename... Args>
    void error(Args&&... args) const { log(LogLevel::ERROR, std::forward<Args>(args)...); }

private:
    struct SinkState {
        std::mutex mutex;
        LogLevel min_level = LogLevel::WARNING;
        std::ostream* sink = &std::clog;
    };

    static SinkState& state() {
        static SinkState instance;
        return instance;
    }

    static std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_time{};
        localtime_r(&seconds, &local_time);

        std::ostringstream oss;
        oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << millis.count();
        return oss.str();
    }

    void write(LogLevel level, const std::string& message) const {
        const std::string line = timestamp() + " [" + to_string(level) + "] [" +
                                 component_name_ + "] " + message;
        std::lock_guard<std::mutex> lock(state().mutex);
        *state().sink << line << '\n';
    }

    std::string component_name_;
};

}

#define OPTSTRAT_LOG_DEBUG(logger, ...) \
    do { if ((logger).is_enabled(::optstrat::utils::LogLevel::DEBUG)) (logger).debug(__VA_ARGS__); } while (0)
#define OPTSTRAT_LOG_INFO(logger, ...) \
    do { if ((logger).is_enabled(::optstrat::utils::LogLevel::INFO)) (logger).info(__VA_ARGS__); } while (0)
#define OPTSTRAT_LOG_WARNING(logger, ...) \
    do { if ((logger).is_enabled(::optstrat::utils::LogLevel::WARNING)) (logger).warning(__VA_ARGS__); } while (0)
#define OPTSTRAT_LOG_ERROR(logger, ...) \
    do { if ((logger).is_enabled(::optstrat::utils::LogLevel::ERROR)) (logger).error(__VA_ARGS__); } while (0)

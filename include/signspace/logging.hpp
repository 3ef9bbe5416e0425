#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace signspace {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

const char* log_level_name(LogLevel level) noexcept;

// "debug", "info", "warn", "error", "fatal"; unknown names map to INFO
LogLevel parse_log_level(const std::string& name) noexcept;

/**
 * Process-wide log sink.
 *
 * Records below the current level are dropped before their arguments are
 * formatted. A FATAL record is flushed and then aborts the process.
 */
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level) { level_.store(level); }
    void setOutput(std::ostream& stream);

    bool enabled(LogLevel level) const { return level >= level_.load(); }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        if (!enabled(level)) return;

        std::ostringstream msg;
        (msg << ... << std::forward<Args>(args));
        write(level, file, line, func, msg.str());
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const char* file, int line, const char* func, const std::string& message);

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::ostream* output_ = &std::clog;
    std::mutex mutex_;
};

#define LOG_DEBUG(...) signspace::Logger::getInstance().log(signspace::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  signspace::Logger::getInstance().log(signspace::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  signspace::Logger::getInstance().log(signspace::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) signspace::Logger::getInstance().log(signspace::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_FATAL(...) signspace::Logger::getInstance().log(signspace::LogLevel::FATAL, __FILE__, __LINE__, __func__, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

} // namespace signspace

#include "signspace/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>

namespace signspace {

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

LogLevel parse_log_level(const std::string& name) noexcept {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return LogLevel::INFO;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setOutput(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_ = &stream;
}

void Logger::write(LogLevel level, const char* file, int line, const char* func, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    const char* filename = std::strrchr(file, '/');
    filename = filename ? filename + 1 : file;

    std::lock_guard<std::mutex> lock(mutex_);
    *output_ << '[' << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << '.'
             << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ') << "] "
             << std::left << std::setw(5) << log_level_name(level) << std::right << ' '
             << filename << ':' << line << ' ' << func << "() - " << message << '\n';

    if (level >= LogLevel::WARN) {
        output_->flush();
    }
    if (level == LogLevel::FATAL) {
        std::abort();
    }
}

} // namespace signspace

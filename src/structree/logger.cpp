#include "structree/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace structree {

Logger::Logger()
    : stream_{&std::clog}, level_{LogLevel::Error} {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) noexcept {
    level_ = level;
}

LogLevel Logger::level() const noexcept {
    return level_;
}

void Logger::set_output(std::ostream* stream) noexcept {
    std::scoped_lock lock{mutex_};
    stream_ = stream != nullptr ? stream : &std::clog;
}

std::string_view Logger::level_to_string(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "error";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Trace:
        return "trace";
    }
    return "unknown";
}

void Logger::write(LogLevel level, std::string_view message) {
    std::scoped_lock lock{mutex_};
    if (!stream_) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &seconds);
#else
    localtime_r(&seconds, &tm);
#endif
    (*stream_) << std::put_time(&tm, "%H:%M:%S") << ' ' << level_to_string(level) << " | " << message << '\n';
}

} // namespace structree

#pragma once

#include <format>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace structree {

enum class LogLevel {
    Error = 0,
    Warn,
    Info,
    Debug,
    Trace,
};

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

    void set_output(std::ostream* stream) noexcept;

    template <typename... Args>
    void log(LogLevel level, std::string_view fmt, Args&&... args) {
        if (level > level_) {
            return;
        }
        if constexpr (sizeof...(Args) == 0) {
            write(level, fmt);
        } else {
            auto tuple_args = std::make_tuple(std::forward<Args>(args)...);
            auto formatted = std::apply(
                [&](auto&... unpacked) {
                    return std::vformat(fmt, std::make_format_args(unpacked...));
                },
                tuple_args);
            write(level, formatted);
        }
    }

    template <typename... Args>
    void debug(std::string_view fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    [[nodiscard]] static std::string_view level_to_string(LogLevel level) noexcept;

private:
    Logger();
    void write(LogLevel level, std::string_view message);

    std::ostream* stream_;
    LogLevel level_;
    std::mutex mutex_;
};

} // namespace structree

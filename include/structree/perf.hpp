#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "structree/logger.hpp"

namespace structree {

// Logs "<phase> <path> took N us" when it goes out of scope. A phase that
// produces a result set can report its size with set_items().
class ScopedTimer {
public:
    explicit ScopedTimer(std::string_view phase, const std::filesystem::path& target = {},
        LogLevel level = LogLevel::Debug)
        : label_(phase)
        , level_(level)
        , start_(std::chrono::steady_clock::now()) {
        if (!target.empty()) {
            label_ += ' ';
            label_ += target.string();
        }
    }

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
        if (items_) {
            Logger::instance().log(level_, "{} took {} us, {} item(s)", label_, elapsed.count(), *items_);
        } else {
            Logger::instance().log(level_, "{} took {} us", label_, elapsed.count());
        }
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void set_items(std::size_t count) { items_ = count; }

    const std::string& label() const { return label_; }

private:
    std::string label_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
    std::optional<std::size_t> items_;
};

} // namespace structree

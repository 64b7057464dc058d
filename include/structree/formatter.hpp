#pragma once

#include <cstdint>
#include <format>
#include <string>

namespace structree::formatter {

// 1023 -> "1023B", 1024 -> "1.0K", 1536 -> "1.5K"; stops at G.
inline std::string human_size(std::uintmax_t size) {
    constexpr auto k1024 = 1024.0;
    constexpr const char* suffixes = "KMG";
    double value = static_cast<double>(size);
    std::size_t idx = 0;
    while (value >= k1024 && idx < 3) {
        value /= k1024;
        ++idx;
    }
    if (idx == 0) {
        return std::format("{}B", size);
    }
    return std::format("{:.1f}{}", value, suffixes[idx - 1]);
}

inline std::string whole_megabytes(std::uintmax_t size) {
    return std::format("{}MB", size / (1024u * 1024u));
}

} // namespace structree::formatter

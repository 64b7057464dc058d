#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace structree::string_utils {

inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

inline std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

// Splits "a, b,,c" into {"a", "b", "c"}.
inline std::vector<std::string> split_list(std::string_view text, char separator = ',') {
    std::vector<std::string> parts;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto end = text.find(separator, pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto part = trim(text.substr(pos, end - pos));
        if (!part.empty()) {
            parts.emplace_back(part);
        }
        pos = end + 1;
    }
    return parts;
}

inline std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

} // namespace structree::string_utils

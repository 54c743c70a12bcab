#ifndef NETHEAL_COMMON_HPP
#define NETHEAL_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace netheal {

inline std::string ltrim(std::string value) {
    auto it = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(value.begin(), it);
    return value;
}

inline std::string rtrim(std::string value) {
    auto it = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(it.base(), value.end());
    return value;
}

inline std::string trim(std::string value) {
    return rtrim(ltrim(std::move(value)));
}

inline std::vector<std::string> split(std::string_view value, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : value) {
        if (ch == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    parts.push_back(current);
    return parts;
}

// Splits on runs of whitespace, dropping empty fields.
inline std::vector<std::string> split_whitespace(std::string_view value) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : value) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string output;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            output += separator;
        }
        output += parts[i];
    }
    return output;
}

inline std::string strip_quotes(std::string value) {
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

inline double seconds_since_epoch() {
    using clock = std::chrono::system_clock;
    auto now = clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

// 2024-01-31T12:00:00.123Z
inline std::string iso8601_utc(double timestamp) {
    const std::time_t seconds = static_cast<std::time_t>(timestamp);
    int millis = static_cast<int>((timestamp - static_cast<double>(seconds)) * 1000.0);
    if (millis < 0) {
        millis = 0;
    } else if (millis > 999) {
        millis = 999;
    }
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    char output[40];
    std::snprintf(output, sizeof(output), "%s.%03dZ", buffer, millis);
    return output;
}

}  // namespace netheal

#endif  // NETHEAL_COMMON_HPP

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace remindbot::utils {

using TimePoint = std::chrono::system_clock::time_point;

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline TimePoint Now() {
    return std::chrono::system_clock::now();
}

inline long long ToMs(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint FromMs(long long ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

inline std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return value;
}

inline std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Formats in the process reference timezone as "YYYY-MM-DD HH:MM:SS".
inline std::string FormatLocalTime(TimePoint tp) {
    const auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm local_time{};
    localtime_r(&time, &local_time);
    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

// Parses "YYYY-MM-DD HH:MM:SS" in the process reference timezone.
inline std::optional<TimePoint> ParseLocalTime(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    std::tm tm{};
    std::istringstream ss(Trim(value));
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    std::string rest;
    if (ss >> rest) {
        return std::nullopt;
    }
    const std::tm parsed = tm;
    tm.tm_isdst = -1;
    const auto seconds = std::mktime(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    // mktime rolls impossible dates such as 2024-02-30 into the next month.
    if (tm.tm_year != parsed.tm_year || tm.tm_mon != parsed.tm_mon || tm.tm_mday != parsed.tm_mday ||
        tm.tm_sec != parsed.tm_sec) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

}  // namespace remindbot::utils

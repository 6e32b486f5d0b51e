#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

namespace remindbot::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

inline LogLevel LogLevelFromString(std::string value, LogLevel fallback = LogLevel::kInfo) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (value == "debug") {
        return LogLevel::kDebug;
    }
    if (value == "info") {
        return LogLevel::kInfo;
    }
    if (value == "warn" || value == "warning") {
        return LogLevel::kWarn;
    }
    if (value == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogMessage {
    LogLevel level;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

inline std::atomic<LogLevel>& MinLevel() {
    static std::atomic<LogLevel> level{LogLevel::kInfo};
    return level;
}

inline void Configure(const LogConfig& config) {
    MinLevel().store(config.min_level);
}

inline bool Enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(MinLevel().load());
}

// Writes "[tag] message key=value ..." to stderr. Lines from different threads do not interleave.
inline void Log(const char* tag, const LogMessage& entry) {
    if (!Enabled(entry.level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << tag << "] ";
    if (entry.level != LogLevel::kInfo) {
        line << ToString(entry.level) << " ";
    }
    line << entry.message;
    for (const auto& [key, value] : entry.fields) {
        line << " " << key << "=" << value;
    }
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    std::cerr << line.str() << std::endl;
}

inline void Log(const char* tag, LogLevel level, const std::string& message) {
    Log(tag, LogMessage{level, message, {}});
}

}  // namespace remindbot::utils

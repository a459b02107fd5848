#pragma once

#include <string>
#include <unordered_map>

namespace mathguard::utils {

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

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Accepts "debug", "info", "warn"/"warning", "error" in any case.
LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] message key=value ..." to stderr when level passes the filter.
void Log(const LogMessage& message);
void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields = {});

std::string FormatLogLine(const LogMessage& message);

}  // namespace mathguard::utils

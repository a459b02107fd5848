#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace mathguard::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& MutableConfig() {
    static LogConfig config{};
    return config;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableConfig() = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return MutableConfig();
}

std::string FormatLogLine(const LogMessage& message) {
    std::ostringstream line;
    line << "[" << message.tag << "] ";
    if (message.level != LogLevel::kInfo) {
        line << ToString(message.level) << " ";
    }
    line << message.message;
    // Sorted so the same fields always print in the same order.
    const std::map<std::string, std::string> ordered(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : ordered) {
        line << " " << key << "=" << value;
    }
    return line.str();
}

void Log(const LogMessage& message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    if (static_cast<int>(message.level) < static_cast<int>(MutableConfig().min_level)) {
        return;
    }
    std::cerr << FormatLogLine(message) << std::endl;
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields) {
    Log(LogMessage{level, tag, message, fields});
}

}  // namespace mathguard::utils

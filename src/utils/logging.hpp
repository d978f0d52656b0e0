#pragma once

#include <string>
#include <utility>
#include <vector>

namespace termgate::utils {

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

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
bool ShouldLog(LogLevel level);

// Writes "[tag] LEVEL message key=value ..." to stderr.
void Log(const LogMessage& msg);

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::vector<std::pair<std::string, std::string>> fields = {});

}  // namespace termgate::utils

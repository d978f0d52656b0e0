#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace termgate::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_log_mutex;

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
    g_min_level.store(static_cast<int>(config.min_level));
}

bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(const LogMessage& msg) {
    if (!ShouldLog(msg.level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << msg.tag << "] " << ToString(msg.level) << " " << msg.message;
    for (const auto& [key, value] : msg.fields) {
        line << " " << key << "=" << value;
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << line.str() << std::endl;
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::vector<std::pair<std::string, std::string>> fields) {
    Log(LogMessage{level, tag, message, std::move(fields)});
}

}  // namespace termgate::utils

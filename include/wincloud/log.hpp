#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace wincloud {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error,
    Off
};

using LogSink = std::function<void(LogLevel level, std::string_view component, std::string_view message)>;

std::string_view ToString(LogLevel level);

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

// Replaces the stderr writer. An empty sink restores the default.
void SetLogSink(LogSink sink);

void Log(LogLevel level, std::string_view component, const std::string& message);

inline void LogDebug(const std::string_view component, const std::string& message) {
    Log(LogLevel::Debug, component, message);
}

inline void LogInfo(const std::string_view component, const std::string& message) {
    Log(LogLevel::Info, component, message);
}

inline void LogWarning(const std::string_view component, const std::string& message) {
    Log(LogLevel::Warning, component, message);
}

inline void LogError(const std::string_view component, const std::string& message) {
    Log(LogLevel::Error, component, message);
}

}  // namespace wincloud

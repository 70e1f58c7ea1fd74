#include "wincloud/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace wincloud {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warning};
std::mutex g_sink_mutex;
LogSink g_sink;

void WriteToStderr(const LogLevel level, const std::string_view component, const std::string_view message) {
    std::cerr << "[log] " << ToString(level) << " " << component << ": " << message << "\n";
}

}  // namespace

std::string_view ToString(const LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Off:
            return "OFF";
    }
    return "?";
}

void SetLogLevel(const LogLevel level) {
    g_level.store(level);
}

LogLevel GetLogLevel() {
    return g_level.load();
}

void SetLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void Log(const LogLevel level, const std::string_view component, const std::string& message) {
    if (level == LogLevel::Off || static_cast<int>(level) < static_cast<int>(g_level.load())) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        g_sink(level, component, message);
        return;
    }
    WriteToStderr(level, component, message);
}

}  // namespace wincloud

#include "board_log.hpp"

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Error)};

} // namespace

namespace board_log {

LogLevel GetLevel() {
    return static_cast<LogLevel>(g_level.load());
}

void SetLevel(LogLevel level) {
    g_level = static_cast<int>(level);
}

bool IsEnabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= g_level.load();
}

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

std::mutex& OutputMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace board_log

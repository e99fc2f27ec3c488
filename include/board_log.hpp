#pragma once

#include <atomic>
#include <iostream>
#include <mutex>

// Levels match the integer values accepted by BoardShim::SetLogLevel
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

namespace board_log {

LogLevel GetLevel();
void SetLevel(LogLevel level);
bool IsEnabled(LogLevel level);
const char* LevelName(LogLevel level);
std::mutex& OutputMutex();

} // namespace board_log

#define BOARD_LOG(level, x)                                                     \
    do {                                                                        \
        if (board_log::IsEnabled(level)) {                                      \
            std::lock_guard<std::mutex> _log_lock(board_log::OutputMutex());    \
            std::cerr << "[biostream " << board_log::LevelName(level) << "] "   \
                      << x << std::endl;                                        \
        }                                                                       \
    } while (0)

#define LOG_TRACE(x) BOARD_LOG(LogLevel::Trace, x)
#define LOG_DEBUG(x) BOARD_LOG(LogLevel::Debug, x)
#define LOG_INFO(x)  BOARD_LOG(LogLevel::Info, x)
#define LOG_WARN(x)  BOARD_LOG(LogLevel::Warn, x)
#define LOG_ERROR(x) BOARD_LOG(LogLevel::Error, x)

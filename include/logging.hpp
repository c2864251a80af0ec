#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// Tagged line logging: "[TAG] message". Errors and warnings go to stderr,
// everything else to stdout. One mutex keeps lines from concurrent jobs whole.

enum class LogLevel : int { Error = 0, Warn = 1, Info = 2, Debug = 3 };

namespace logging_detail {
inline std::atomic<int>& level() {
    static std::atomic<int> lvl{static_cast<int>(LogLevel::Info)};
    return lvl;
}
inline std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}
} // namespace logging_detail

inline void set_log_level(LogLevel lvl) {
    logging_detail::level().store(static_cast<int>(lvl));
}

inline LogLevel log_level() {
    return static_cast<LogLevel>(logging_detail::level().load());
}

inline bool log_enabled(LogLevel lvl) {
    return static_cast<int>(lvl) <= logging_detail::level().load();
}

inline void log_line(LogLevel lvl, const char* tag, const std::string& message) {
    if (!log_enabled(lvl)) return;
    std::lock_guard<std::mutex> lock(logging_detail::sink_mutex());
    std::ostream& out = (lvl <= LogLevel::Warn) ? std::cerr : std::cout;
    out << "[" << tag << "] " << message << std::endl;
}

// LOG_INFO("ENCODER", "wrote " << n << " frames");
#define PIXVAULT_LOG(lvl, tag, expr)                                   \
    do {                                                               \
        if (log_enabled(lvl)) {                                        \
            std::ostringstream pixvault_log_os_;                       \
            pixvault_log_os_ << expr;                                  \
            log_line(lvl, tag, pixvault_log_os_.str());                \
        }                                                              \
    } while (0)

#define LOG_ERROR(tag, expr) PIXVAULT_LOG(LogLevel::Error, tag, expr)
#define LOG_WARN(tag, expr)  PIXVAULT_LOG(LogLevel::Warn, tag, expr)
#define LOG_INFO(tag, expr)  PIXVAULT_LOG(LogLevel::Info, tag, expr)
#define LOG_DEBUG(tag, expr) PIXVAULT_LOG(LogLevel::Debug, tag, expr)

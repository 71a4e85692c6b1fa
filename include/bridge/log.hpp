#pragma once
// Logging: stderr lines tagged with the emitting component
//
// stdout belongs to results (and to JSON-RPC frames in bridge_mcp), so all
// diagnostics go to stderr. Debug lines are dropped unless verbose mode
// is on.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace bridge {
namespace log {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline void set_verbose(bool on) { verbose_flag().store(on); }
inline bool verbose() { return verbose_flag().load(); }

inline void vwrite(const char* level, const char* component, const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&now_time_t, &tm);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm);

    std::fprintf(stderr, "[%s.%03d][%s]%s ", time_buf,
                 static_cast<int>(now_ms.count()), component, level);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

} // namespace log

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!log::verbose()) return;
    va_list args;
    va_start(args, fmt);
    log::vwrite("", component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log::vwrite(" warning:", component, fmt, args);
    va_end(args);
}

inline void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log::vwrite(" error:", component, fmt, args);
    va_end(args);
}

} // namespace bridge

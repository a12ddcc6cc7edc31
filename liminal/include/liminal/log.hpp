#pragma once
// Logging: component-tagged lines on stderr
//
//   [HH:MM:SS.mmm][component] message
//
// Debug lines only appear in verbose mode. Warnings and errors always do.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace liminal {

inline std::atomic<bool>& verbose_mode() {
    static std::atomic<bool> verbose{false};
    return verbose;
}

inline void set_verbose(bool on) { verbose_mode() = on; }

inline void log_line(const char* level, const char* component, const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));

    std::fprintf(stderr, "[%s.%03d][%s] %s", time_buf, static_cast<int>(now_ms.count()),
                 component, level);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode()) return;
    va_list args;
    va_start(args, fmt);
    log_line("", component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_line("warning: ", component, fmt, args);
    va_end(args);
}

inline void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_line("error: ", component, fmt, args);
    va_end(args);
}

} // namespace liminal

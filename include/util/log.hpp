#pragma once
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <strings.h>

namespace ncbridge
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // lifecycle milestones, always shown unless filtered above error
};

namespace detail
{
inline std::atomic<int> &threshold()
{
    static std::atomic<int> lv{static_cast<int>(Level::Info)};
    return lv;
}

// Serializes lines coming from the RPC thread and provider worker threads.
inline std::mutex &sink_mutex()
{
    static std::mutex mu;
    return mu;
}

inline bool name_is(const char *name, const char *a, const char *b = nullptr)
{
    return ::strcasecmp(name, a) == 0 || (b && ::strcasecmp(name, b) == 0);
}
}  // namespace detail

inline void set_log_level(Level lv)
{
    detail::threshold().store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline bool log_enabled(Level lv)
{
    return static_cast<int>(lv) >= detail::threshold().load(std::memory_order_relaxed);
}

// Accepts DEBUG, INFO, WARN/WARNING, ERROR/ERR in any case; anything else means INFO.
inline void set_log_level_by_name(const char *name)
{
    Level lv = Level::Info;
    if (name)
    {
        if (detail::name_is(name, "debug"))
            lv = Level::Debug;
        else if (detail::name_is(name, "warn", "warning"))
            lv = Level::Warning;
        else if (detail::name_is(name, "error", "err"))
            lv = Level::Error;
    }
    set_log_level(lv);
}

inline const char *level_tag(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "[?]";
}

inline int format_clock(char *buf, std::size_t n)
{
    using clock     = std::chrono::system_clock;
    const auto  now = clock::now();
    const auto  ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count() % 1000;
    std::time_t secs = clock::to_time_t(now);
    std::tm     local{};
    localtime_r(&secs, &local);
    return std::snprintf(buf, n, "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min,
                         local.tm_sec, static_cast<int>(ms));
}

#if defined(__GNUC__)
__attribute__((format(printf, 3, 4)))
#endif
inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if (!log_enabled(lv))
        return;

    // One line is built in full and written with a single call.
    char        line[1024];
    std::size_t used = 0;
    int         n    = format_clock(line, sizeof(line));
    if (n > 0)
        used = static_cast<std::size_t>(n);
    n = std::snprintf(line + used, sizeof(line) - used, " %s %s: ", level_tag(lv),
                      func ? func : "?");
    if (n > 0)
        used += static_cast<std::size_t>(n);
    if (used >= sizeof(line))
        used = sizeof(line) - 1;

    va_list ap;
    va_start(ap, fmt);
    n = std::vsnprintf(line + used, sizeof(line) - used, fmt, ap);
    va_end(ap);
    if (n > 0)
        used += static_cast<std::size_t>(n);
    if (used > sizeof(line) - 2)
        used = sizeof(line) - 2;  // truncated message, keep room for the newline
    if (used == 0 || line[used - 1] != '\n')
        line[used++] = '\n';
    line[used] = '\0';

    std::lock_guard<std::mutex> lock(detail::sink_mutex());
    std::fputs(line, stderr);
    std::fflush(stderr);
}

#define LOG_DEBUG(...) ::ncbridge::logf(::ncbridge::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::ncbridge::logf(::ncbridge::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::ncbridge::logf(::ncbridge::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::ncbridge::logf(::ncbridge::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::ncbridge::logf(::ncbridge::Level::System, __func__, __VA_ARGS__)

}  // namespace ncbridge

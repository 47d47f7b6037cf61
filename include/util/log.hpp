#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <optional>
#include <string>

namespace liftrr
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // state transitions, parsed by front-ends
};

inline Level &global_level()
{
    static Level lv = Level::Debug;
    return lv;
}

// executor, radio host and ipc threads all log; keep lines whole
inline std::mutex &log_mu()
{
    static std::mutex mu;
    return mu;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline std::optional<Level> parse_level(const char *name)
{
    if (!name)
        return std::nullopt;
    const std::string level(name);
    if (level == "debug" || level == "DEBUG")
        return Level::Debug;
    if (level == "info" || level == "INFO")
        return Level::Info;
    if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        return Level::Warning;
    if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        return Level::Error;
    return std::nullopt;
}

// unknown names fall back to Info and report false
inline bool set_log_level_by_name(const char *name)
{
    auto lv = parse_level(name);
    set_log_level(lv.value_or(Level::Info));
    return lv.has_value();
}

inline const char *level_name(Level lv)
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
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::lock_guard<std::mutex> lk(log_mu());
    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::liftrr::logf(::liftrr::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::liftrr::logf(::liftrr::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::liftrr::logf(::liftrr::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::liftrr::logf(::liftrr::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::liftrr::logf(::liftrr::Level::System, __func__, __VA_ARGS__)

}  // namespace liftrr

#pragma once
#include <cstdio>
#include <cstdarg>


namespace vat
{
#ifdef NDEBUG
    #define LOG_DEBUG(fmt, ...) ((void)0)
#else
    #define LOG_DEBUG(fmt, ...) ::vat::log_impl(::vat::LogLevel::Debug, fmt, ##__VA_ARGS__)
#endif

#define LOG_INFO(fmt, ...) ::vat::log_impl(::vat::LogLevel::Info, fmt, ##__VA_ARGS__)

#define LOG_WARNING(fmt, ...) ::vat::log_impl(::vat::LogLevel::Warning, fmt, ##__VA_ARGS__)

#define LOG_ERROR(fmt, ...) ::vat::log_impl(::vat::LogLevel::Error, fmt, ##__VA_ARGS__)


enum class LogLevel : int { Debug = 0, Info, Warning, Error };

// messages below this level are dropped
inline LogLevel g_MinLogLevel = LogLevel::Debug;

inline void SetLogLevel(LogLevel lv) { g_MinLogLevel = lv; }

inline void log_impl(LogLevel lv, const char* fmt, ...) {
    if (static_cast<int>(lv) < static_cast<int>(g_MinLogLevel))
        return;

    const char* lvl_str[] = { "DEBUG", "INFO", "WARN", "ERROR" };

    std::fprintf(stderr, "[%s]: ", lvl_str[static_cast<int>(lv)]);

    std::va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

}

#pragma once

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace winshot {

enum class LogLevel { Info, Warn, Error, Debug };

inline bool g_debug_enabled = false;
inline bool g_quiet = false;
inline FILE* g_log_file = nullptr;

inline void setDebugLogging(bool enabled) {
    g_debug_enabled = enabled;
}

// Tests silence stderr output; the log file, if any, still receives lines.
inline void setQuietLogging(bool quiet) {
    g_quiet = quiet;
}

inline void initFileLogging() {
    const char* logPath = std::getenv("WINSHOT_LOG_FILE");
    if (logPath && logPath[0] != '\0') {
        g_log_file = std::fopen(logPath, "a");
        if (g_log_file) {
            std::fprintf(g_log_file, "\n=== winshot started ===\n");
            std::fflush(g_log_file);
        }
    }
}

inline void closeFileLogging() {
    if (g_log_file) {
        std::fclose(g_log_file);
        g_log_file = nullptr;
    }
}

inline const char* logTag(LogLevel level) {
    switch (level) {
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Debug:
            return "DEBUG";
    }
    return "INFO";
}

inline void logMessage(LogLevel level, const char* fmt, ...) {
    if (level == LogLevel::Debug && !g_debug_enabled) {
        return;
    }
    const char* tag = logTag(level);

    va_list args;
    va_start(args, fmt);

    va_list args_copy;
    if (!g_quiet) {
        std::fprintf(stderr, "[%s] ", tag);
        va_copy(args_copy, args);
        std::vfprintf(stderr, fmt, args_copy);
        va_end(args_copy);
        std::fprintf(stderr, "\n");
    }

    if (g_log_file) {
        std::fprintf(g_log_file, "[%s] ", tag);
        va_copy(args_copy, args);
        std::vfprintf(g_log_file, fmt, args_copy);
        va_end(args_copy);
        std::fprintf(g_log_file, "\n");
        std::fflush(g_log_file);
    }

    va_end(args);
}

}  // namespace winshot

#define LOG_INFO(...) \
    ::winshot::logMessage(::winshot::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) \
    ::winshot::logMessage(::winshot::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) \
    ::winshot::logMessage(::winshot::LogLevel::Error, __VA_ARGS__)
#define LOG_DEBUG(...) \
    ::winshot::logMessage(::winshot::LogLevel::Debug, __VA_ARGS__)

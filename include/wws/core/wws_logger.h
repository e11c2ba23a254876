/**
 * @file wws_logger.h
 * @brief Wake Word Server - Logger
 *
 * Process-wide logger with a level filter and an optional external
 * callback. Without a callback, messages go to stderr: stdout may be the
 * event channel of a stdio:// connection and must stay clean.
 *
 * Usage:
 *   WWS_LOG_INFO("Server", "Listening on %s", uri.c_str());
 *   WWS_LOG_ERROR("Porcupine", "Init failed: %s", status);
 */

#ifndef WWS_LOGGER_H
#define WWS_LOGGER_H

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace wws {

// =============================================================================
// LOG LEVELS
// =============================================================================

enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warning = 3, Error = 4 };

// =============================================================================
// LOG CALLBACK TYPE
// =============================================================================

/**
 * External log callback type.
 *
 * @param level Log level
 * @param category Log category (e.g., "Cache")
 * @param message Formatted message
 * @param user_data Optional user context
 */
using LogCallback = void (*)(LogLevel level, const char* category, const char* message,
                             void* user_data);

// =============================================================================
// LOGGER CLASS
// =============================================================================

class Logger {
   public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void setCallback(LogCallback callback, void* user_data = nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = callback;
        user_data_ = user_data;
    }

    void setMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel minLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    bool isEnabled(LogLevel level) const { return level >= minLevel(); }

    void log(LogLevel level, const char* category, const char* format, ...) {
        if (!isEnabled(level)) {
            return;
        }

        char buffer[2048];
        va_list args;
        va_start(args, format);
        vsnprintf(buffer, sizeof(buffer), format, args);
        va_end(args);

        std::lock_guard<std::mutex> lock(mutex_);
        if (callback_) {
            callback_(level, category, buffer, user_data_);
        } else {
            std::fprintf(stderr, "[%s][%s] %s\n", levelToString(level), category, buffer);
            std::fflush(stderr);
        }
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:
                return "TRACE";
            case LogLevel::Debug:
                return "DEBUG";
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Warning:
                return "WARN";
            case LogLevel::Error:
                return "ERROR";
            default:
                return "???";
        }
    }

   private:
    Logger() = default;

    mutable std::mutex mutex_;
    LogCallback callback_ = nullptr;
    void* user_data_ = nullptr;
    LogLevel min_level_ = LogLevel::Info;
};

// =============================================================================
// CONVENIENCE MACROS
// =============================================================================

#define WWS_LOG_TRACE(category, ...) \
    wws::Logger::instance().log(wws::LogLevel::Trace, category, __VA_ARGS__)

#define WWS_LOG_DEBUG(category, ...) \
    wws::Logger::instance().log(wws::LogLevel::Debug, category, __VA_ARGS__)

#define WWS_LOG_INFO(category, ...) \
    wws::Logger::instance().log(wws::LogLevel::Info, category, __VA_ARGS__)

#define WWS_LOG_WARNING(category, ...) \
    wws::Logger::instance().log(wws::LogLevel::Warning, category, __VA_ARGS__)

#define WWS_LOG_ERROR(category, ...) \
    wws::Logger::instance().log(wws::LogLevel::Error, category, __VA_ARGS__)

}  // namespace wws

#endif  // WWS_LOGGER_H

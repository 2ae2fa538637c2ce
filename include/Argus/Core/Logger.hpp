/**
 * @file Logger.hpp
 * @brief Logging infrastructure for Argus diagnostics
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * Thread-safe logging system with multiple severity levels, file rotation,
 * and callback output so an embedding orchestrator can collect detection
 * diagnostics alongside its own logs.
 */

#pragma once

#ifndef ARGUS_CORE_LOGGER_HPP
#define ARGUS_CORE_LOGGER_HPP

#include <string>
#include <string_view>
#include <mutex>
#include <memory>
#include <chrono>
#include <functional>
#include <optional>
#include <cstdio>
#include <cstdint>

namespace spdlog {
class logger;
namespace level { enum level_enum : int; }
}

namespace Argus {
namespace Core {

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    Trace = 0,      ///< Per-match tracing
    Debug = 1,      ///< Registration, filter and validator decisions
    Info = 2,       ///< Feedback, imports, breaker recovery
    Warning = 3,    ///< Fallbacks, regex failures, breaker trips
    Error = 4,      ///< Failures surfaced to the caller
    Critical = 5,   ///< Unrecoverable conditions
    Off = 255       ///< Disable all logging
};

/**
 * @brief Log output targets
 */
enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,   ///< Output to console/stdout
    File = 1 << 1,      ///< Output to rotating file
    Callback = 1 << 2,  ///< Call user-provided callback
    All = Console | File | Callback
};

inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline LogOutput operator&(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning"/"warn",
 *        "error", "critical", "off")
 */
std::optional<LogLevel> parseLogLevel(std::string_view name);

/**
 * @brief Log callback function type
 * @param level Severity level of the message
 * @param message Formatted log message
 * @param timestamp Message timestamp
 */
using LogCallback = std::function<void(LogLevel level, std::string_view message,
                                       std::chrono::system_clock::time_point timestamp)>;

/**
 * @brief Thread-safe logging system for Argus
 *
 * Messages logged before Initialize() are counted as dropped rather than
 * buffered, so library code can log unconditionally.
 */
class Logger {
public:
    /**
     * @brief Get the global logger instance
     */
    static Logger& Instance();

    /**
     * @brief Initialize the logger
     * @param minLevel Minimum log level to record
     * @param outputs Output targets (console, file, callback)
     * @param logFilePath Path to log file (required if File output enabled)
     * @param maxFileSizeMB Maximum log file size in MB before rotation
     * @return true on success, false if already initialized or sink creation failed
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /**
     * @brief Shutdown the logger and flush all buffers
     */
    void Shutdown();

    void SetMinLevel(LogLevel level);
    LogLevel GetMinLevel() const;

    /**
     * @brief Set user callback for log messages (used by the Callback output)
     */
    void SetCallback(LogCallback callback);

    /**
     * @brief Check if a log level is enabled
     */
    bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Log a message at the specified level
     * @param level Severity level
     * @param message Message text
     * @param file Source file name (optional)
     * @param line Source line number (optional)
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /**
     * @brief Log a printf-style formatted message
     */
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args) {
        LogFormatAt(level, nullptr, 0, format, std::forward<Args>(args)...);
    }

    /**
     * @brief printf-style variant carrying the caller's source location
     *
     * Messages longer than the stack buffer are formatted a second time into
     * a heap string of the exact size.
     */
    template<typename... Args>
    void LogFormatAt(LogLevel level, const char* file, int line,
                     const char* format, Args&&... args) {
        if (!IsLevelEnabled(level)) {
            countDropped();
            return;
        }

        char stackBuffer[512];
        const int needed = std::snprintf(stackBuffer, sizeof(stackBuffer), format, args...);
        if (needed <= 0) {
            return;
        }

        const auto length = static_cast<size_t>(needed);
        if (length < sizeof(stackBuffer)) {
            Log(level, std::string_view(stackBuffer, length), file, line);
            return;
        }

        std::string text(length + 1, '\0');
        std::snprintf(text.data(), text.size(), format, args...);
        text.resize(length);
        Log(level, text, file, line);
    }

    /**
     * @brief Flush all buffers to disk
     */
    void Flush();

    /**
     * @brief Number of messages logged at each level
     */
    struct Statistics {
        size_t trace;
        size_t debug;
        size_t info;
        size_t warning;
        size_t error;
        size_t critical;
        size_t dropped;  ///< Messages dropped by level filtering or before Initialize
    };

    Statistics GetStatistics() const;
    void ResetStatistics();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void countDropped();

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level);
    static LogLevel FromSpdlogLevel(spdlog::level::level_enum level);

    // Configuration
    LogLevel minLevel_ = LogLevel::Info;
    LogOutput outputs_ = LogOutput::Console;
    std::string logFilePath_;
    size_t maxFileSizeBytes_ = 10 * 1024 * 1024;
    LogCallback callback_;

    // State
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
    bool initialized_ = false;

    // Statistics
    mutable std::mutex statsMutex_;
    Statistics stats_{};
};

} // namespace Core
} // namespace Argus

// ============================================================================
// Convenience Macros
// ============================================================================

#ifndef ARGUS_DISABLE_LOGGING

#define ARGUS_LOG_AT(level, msg) \
    ::Argus::Core::Logger::Instance().Log(::Argus::Core::LogLevel::level, msg, __FILE__, __LINE__)

#define ARGUS_LOG_AT_F(level, fmt, ...) \
    ::Argus::Core::Logger::Instance().LogFormatAt( \
        ::Argus::Core::LogLevel::level, __FILE__, __LINE__, fmt, __VA_ARGS__)

#else
#define ARGUS_LOG_AT(level, msg) ((void)0)
#define ARGUS_LOG_AT_F(level, fmt, ...) ((void)0)
#endif // ARGUS_DISABLE_LOGGING

#define ARGUS_LOG_TRACE(msg)    ARGUS_LOG_AT(Trace, msg)
#define ARGUS_LOG_DEBUG(msg)    ARGUS_LOG_AT(Debug, msg)
#define ARGUS_LOG_INFO(msg)     ARGUS_LOG_AT(Info, msg)
#define ARGUS_LOG_WARNING(msg)  ARGUS_LOG_AT(Warning, msg)
#define ARGUS_LOG_ERROR(msg)    ARGUS_LOG_AT(Error, msg)
#define ARGUS_LOG_CRITICAL(msg) ARGUS_LOG_AT(Critical, msg)

#define ARGUS_LOG_TRACE_F(fmt, ...)    ARGUS_LOG_AT_F(Trace, fmt, __VA_ARGS__)
#define ARGUS_LOG_DEBUG_F(fmt, ...)    ARGUS_LOG_AT_F(Debug, fmt, __VA_ARGS__)
#define ARGUS_LOG_INFO_F(fmt, ...)     ARGUS_LOG_AT_F(Info, fmt, __VA_ARGS__)
#define ARGUS_LOG_WARNING_F(fmt, ...)  ARGUS_LOG_AT_F(Warning, fmt, __VA_ARGS__)
#define ARGUS_LOG_ERROR_F(fmt, ...)    ARGUS_LOG_AT_F(Error, fmt, __VA_ARGS__)
#define ARGUS_LOG_CRITICAL_F(fmt, ...) ARGUS_LOG_AT_F(Critical, fmt, __VA_ARGS__)

#endif // ARGUS_CORE_LOGGER_HPP

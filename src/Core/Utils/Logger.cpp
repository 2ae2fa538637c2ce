/**
 * @file Logger.cpp
 * @brief spdlog-backed implementation of the Argus logger
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/Logger.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

namespace Argus {
namespace Core {

namespace {

/**
 * @brief Sink forwarding each formatted payload to a user callback
 */
class CallbackSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    using Forward = std::function<void(const spdlog::details::log_msg&)>;

    explicit CallbackSink(Forward forward) : m_forward(std::move(forward)) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        if (m_forward) {
            m_forward(msg);
        }
    }

    void flush_() override {}

private:
    Forward m_forward;
};

constexpr size_t ROTATED_FILE_COUNT = 3;

std::string_view baseName(const char* path) {
    std::string_view view(path);
    auto pos = view.find_last_of("/\\");
    return pos == std::string_view::npos ? view : view.substr(pos + 1);
}

} // anonymous namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warning" || lowered == "warn") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "critical") return LogLevel::Critical;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

bool Logger::Initialize(LogLevel minLevel, LogOutput outputs,
                        const std::string& logFilePath, size_t maxFileSizeMB) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    minLevel_ = minLevel;
    outputs_ = outputs;
    logFilePath_ = logFilePath;
    maxFileSizeBytes_ = maxFileSizeMB * 1024 * 1024;

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (hasFlag(outputs_, LogOutput::Console)) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }

        if (hasFlag(outputs_, LogOutput::File) && !logFilePath_.empty()) {
            std::filesystem::path logPath(logFilePath_);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath_, maxFileSizeBytes_, ROTATED_FILE_COUNT));
        }

        if (hasFlag(outputs_, LogOutput::Callback)) {
            // Invoked while Log() holds mutex_, so callback_ is read safely.
            sinks.push_back(std::make_shared<CallbackSink>(
                [this](const spdlog::details::log_msg& msg) {
                    if (callback_) {
                        std::string_view payload(msg.payload.data(), msg.payload.size());
                        callback_(FromSpdlogLevel(msg.level), payload, msg.time);
                    }
                }));
        }

        spdlogger_ = std::make_shared<spdlog::logger>("argus", sinks.begin(), sinks.end());
        spdlogger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [argus] %v");
        spdlogger_->set_level(ToSpdlogLevel(minLevel_));
        spdlogger_->flush_on(spdlog::level::warn);

        initialized_ = true;
        return true;

    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "argus: failed to initialize logger: " << e.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "argus: cannot create log directory: " << e.what() << std::endl;
    }
    spdlogger_.reset();
    return false;
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return;
    }

    if (spdlogger_) {
        spdlogger_->flush();
        spdlogger_.reset();
    }
    initialized_ = false;
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
    if (spdlogger_) {
        spdlogger_->set_level(ToSpdlogLevel(level));
    }
}

LogLevel Logger::GetMinLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return minLevel_;
}

void Logger::SetCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

bool Logger::IsLevelEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_ && level != LogLevel::Off && level >= minLevel_;
}

void Logger::countDropped() {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_.dropped++;
}

void Logger::Log(LogLevel level, std::string_view message,
                 const char* file, int line) {
    if (!IsLevelEnabled(level)) {
        countDropped();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        switch (level) {
            case LogLevel::Trace:    stats_.trace++; break;
            case LogLevel::Debug:    stats_.debug++; break;
            case LogLevel::Info:     stats_.info++; break;
            case LogLevel::Warning:  stats_.warning++; break;
            case LogLevel::Error:    stats_.error++; break;
            case LogLevel::Critical: stats_.critical++; break;
            default: break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!spdlogger_) {
        return;
    }

    if (file != nullptr && line > 0) {
        spdlogger_->log(ToSpdlogLevel(level), "({}:{}) {}", baseName(file), line, message);
    } else {
        spdlogger_->log(ToSpdlogLevel(level), message);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spdlogger_) {
        spdlogger_->flush();
    }
}

Logger::Statistics Logger::GetStatistics() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

void Logger::ResetStatistics() {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_ = Statistics{};
}

spdlog::level::level_enum Logger::ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel Logger::FromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warning;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Critical;
        default:                      return LogLevel::Off;
    }
}

} // namespace Core
} // namespace Argus

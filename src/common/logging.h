#pragma once

/// @file logging.h
/// @brief PromptGuard logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace promptguard {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "promptguard";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    /// Audit records go to a second logger that shares the sinks
    std::string audit_name = "promptguard.audit";

    /// Console output goes to stderr instead of stdout
    bool console_to_stderr = false;

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "promptguard.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// @brief Initialize the global loggers with the given configuration
/// @param config Logging configuration
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Get the logger that receives audit payloads
std::shared_ptr<spdlog::logger> GetAuditLogger();

/// @brief Set the level of both loggers
void SetLogLevel(LogLevel level);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

/// @brief Parse "trace", "debug", "info", "warn"/"warning", "error", "critical", "off"
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Lowercase name of a level ("debug", "info", "warning", ...)
std::string LogLevelToString(LogLevel level);

// Convenience macros for logging
#define PROMPTGUARD_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_INFO(...) SPDLOG_LOGGER_INFO(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_WARN(...) SPDLOG_LOGGER_WARN(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::promptguard::GetLogger(), __VA_ARGS__)

}  // namespace promptguard

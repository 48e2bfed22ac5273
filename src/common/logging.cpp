#include "logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace promptguard {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<spdlog::logger> g_audit_logger;
std::mutex g_init_mutex;

}  // namespace

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    const auto level = static_cast<spdlog::level::level_enum>(config.level);

    // Console sink (always enabled)
    spdlog::sink_ptr console_sink;
    if (config.console_to_stderr) {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    console_sink->set_level(level);
    sinks.push_back(console_sink);

    // File sink (optional)
    if (config.enable_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size,
            config.max_files
        );
        file_sink->set_level(level);
        sinks.push_back(file_sink);
    }

    g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    g_logger->set_level(level);
    g_logger->set_pattern(config.pattern);

    // Audit records share the sinks under their own logger name
    g_audit_logger = std::make_shared<spdlog::logger>(
        config.audit_name, sinks.begin(), sinks.end());
    g_audit_logger->set_level(level);
    g_audit_logger->set_pattern(config.pattern);

    spdlog::set_default_logger(g_logger);

    // Flush on warn and above
    g_logger->flush_on(spdlog::level::warn);
    g_audit_logger->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> GetLogger() {
    if (!g_logger) {
        InitLogging();
    }
    return g_logger;
}

std::shared_ptr<spdlog::logger> GetAuditLogger() {
    if (!g_audit_logger) {
        InitLogging();
    }
    return g_audit_logger;
}

void SetLogLevel(LogLevel level) {
    const auto spd_level = static_cast<spdlog::level::level_enum>(level);
    for (const auto& logger : {g_logger, g_audit_logger}) {
        if (!logger) {
            continue;
        }
        logger->set_level(spd_level);
        for (const auto& sink : logger->sinks()) {
            sink->set_level(spd_level);
        }
    }
}

void FlushLogs() {
    if (g_logger) {
        g_logger->flush();
    }
    if (g_audit_logger) {
        g_audit_logger->flush();
    }
}

void ShutdownLogging() {
    FlushLogs();
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        spdlog::shutdown();
        g_logger.reset();
        g_audit_logger.reset();
    }
}

absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::StripAsciiWhitespace(absl::string_view(name.data(), name.size())));
    if (lowered == "trace") return LogLevel::kTrace;
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    if (lowered == "critical") return LogLevel::kCritical;
    if (lowered == "off") return LogLevel::kOff;
    return absl::InvalidArgumentError(absl::StrCat("Unknown log level: ", absl::string_view(name.data(), name.size())));
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::kTrace: return "trace";
        case LogLevel::kDebug: return "debug";
        case LogLevel::kInfo: return "info";
        case LogLevel::kWarn: return "warning";
        case LogLevel::kError: return "error";
        case LogLevel::kCritical: return "critical";
        case LogLevel::kOff: return "off";
    }
    return "info";
}

}  // namespace promptguard

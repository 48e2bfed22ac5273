#pragma once

/// @file audit.h
/// @brief Structured audit records for preprocessing verdicts
///
/// Audit payloads never carry prompt text. The prompt is represented only by
/// its length and an 8 character SHA-256 fingerprint of a bounded prefix.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include "common/logging.h"
#include "security/types.h"

namespace promptguard::security {

/// Characters hashed by ComputeFingerprint
inline constexpr size_t kFingerprintPrefixChars = 2048;

/// @brief SHA-256 of the first kFingerprintPrefixChars characters, first 8 hex digits
absl::StatusOr<std::string> ComputeFingerprint(std::string_view text);

/// @brief Current UTC time as ISO-8601 with milliseconds
std::string CurrentTimestamp();

/// @brief Log-safe view of a DetectionResult
struct DetectionSummary {
    bool injection_detected = false;
    double confidence_score = 0.0;
    size_t pattern_count = 0;                ///< Before capping
    std::vector<std::string> patterns;       ///< Capped at kMaxReportedPatterns
    std::optional<InjectionType> injection_type;
    std::optional<SecuritySeverity> risk_level;
    std::optional<SecurityAction> recommended_action;

    static DetectionSummary From(const DetectionResult& detection);

    nlohmann::json ToJson() const;
};

/// @brief One audit record; serialized keys are fixed
struct AuditPayload {
    std::string ts;
    std::optional<std::string> sid;
    std::optional<std::string> rid;
    std::optional<std::string> ua;
    std::optional<std::string> ip;
    std::vector<std::string> patterns;
    double score = 0.0;
    std::optional<SecuritySeverity> sev;
    SecurityAction action = SecurityAction::kAllow;
    size_t len = 0;
    std::string sha8;
    double ms = 0.0;
    bool constrained = true;
    bool sanitized = false;

    /// @brief Exactly the keys ts, sid, rid, ua, ip, patterns, score, sev,
    /// action, len, sha8, ms, constrained, sanitized
    nlohmann::json ToJson() const;
};

/// @brief Sink for audit payloads
class AuditLogger {
public:
    virtual ~AuditLogger() = default;

    /// @brief Record a payload at the given level
    virtual void Log(const AuditPayload& payload, LogLevel level) = 0;
};

/// @brief Writes each payload as one JSON line to an spdlog logger
class SpdlogAuditLogger : public AuditLogger {
public:
    /// @param logger Target logger; defaults to GetAuditLogger()
    explicit SpdlogAuditLogger(std::shared_ptr<spdlog::logger> logger = nullptr);

    void Log(const AuditPayload& payload, LogLevel level) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/// @brief Serialize JSON, replacing invalid UTF-8 instead of throwing
std::string DumpJson(const nlohmann::json& value);

}  // namespace promptguard::security

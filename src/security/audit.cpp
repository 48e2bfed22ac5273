/// @file audit.cpp
/// @brief Audit payload serialization and fingerprinting

#include "security/audit.h"

#include <array>
#include <cmath>

#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <openssl/evp.h>

#include "common/error.h"
#include "security/text_normalizer.h"

namespace promptguard::security {

namespace {

using json = nlohmann::json;

constexpr size_t kFingerprintHexChars = 8;

template <typename T, typename F>
json OptionalToJson(const std::optional<T>& value, F&& convert) {
    if (!value.has_value()) {
        return nullptr;
    }
    return convert(*value);
}

json OptionalToJson(const std::optional<std::string>& value) {
    return value.has_value() ? json(*value) : json(nullptr);
}

/// Round to microsecond precision so payloads stay compact
double RoundScore(double value) {
    return std::round(value * 1e6) / 1e6;
}

}  // namespace

absl::StatusOr<std::string> ComputeFingerprint(std::string_view text) {
    const std::string_view prefix = Utf8Prefix(text, kFingerprintPrefixChars);

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(prefix.data(), prefix.size(), digest.data(), &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        return InternalError("SHA-256 digest failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(kFingerprintHexChars);
    for (unsigned int i = 0; i < digest_len && hex.size() < kFingerprintHexChars; ++i) {
        hex.push_back(kHex[digest[i] >> 4U]);
        hex.push_back(kHex[digest[i] & 0x0FU]);
    }
    return hex;
}

std::string CurrentTimestamp() {
    return absl::FormatTime("%Y-%m-%dT%H:%M:%E3SZ", absl::Now(), absl::UTCTimeZone());
}

// ============================================================================
// DetectionSummary
// ============================================================================

DetectionSummary DetectionSummary::From(const DetectionResult& detection) {
    DetectionSummary summary;
    summary.injection_detected = detection.injection_detected();
    summary.confidence_score = detection.confidence_score();
    summary.pattern_count = detection.detected_patterns().size();
    summary.patterns = CapPatterns(detection.detected_patterns());
    summary.injection_type = detection.injection_type();
    summary.risk_level = detection.risk_level();
    summary.recommended_action = detection.recommended_action();
    return summary;
}

json DetectionSummary::ToJson() const {
    json j;
    j["injection_detected"] = injection_detected;
    j["confidence_score"] = RoundScore(confidence_score);
    j["pattern_count"] = pattern_count;
    j["patterns"] = patterns;
    j["injection_type"] = OptionalToJson(injection_type, InjectionTypeToString);
    j["risk_level"] = OptionalToJson(risk_level, SeverityToString);
    j["recommended_action"] = OptionalToJson(recommended_action, ActionToString);
    return j;
}

// ============================================================================
// AuditPayload
// ============================================================================

json AuditPayload::ToJson() const {
    json j;
    j["ts"] = ts;
    j["sid"] = OptionalToJson(sid);
    j["rid"] = OptionalToJson(rid);
    j["ua"] = OptionalToJson(ua);
    j["ip"] = OptionalToJson(ip);
    j["patterns"] = CapPatterns(patterns);
    j["score"] = RoundScore(score);
    j["sev"] = OptionalToJson(sev, SeverityToString);
    j["action"] = ActionToString(action);
    j["len"] = len;
    j["sha8"] = sha8;
    j["ms"] = std::round(ms * 1000.0) / 1000.0;
    j["constrained"] = constrained;
    j["sanitized"] = sanitized;
    return j;
}

std::string DumpJson(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ============================================================================
// SpdlogAuditLogger
// ============================================================================

SpdlogAuditLogger::SpdlogAuditLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : GetAuditLogger()) {}

void SpdlogAuditLogger::Log(const AuditPayload& payload, LogLevel level) {
    logger_->log(static_cast<spdlog::level::level_enum>(level), "{}",
                 DumpJson(payload.ToJson()));
}

}  // namespace promptguard::security

/// @file preprocessor.cpp
/// @brief Secure prompt preprocessing pipeline implementation

#include "security/preprocessor.h"

#include <atomic>
#include <chrono>
#include <cmath>
#include <mutex>

#include <absl/strings/str_format.h>

#include "common/error.h"
#include "security/pattern_detector.h"
#include "security/text_normalizer.h"

namespace promptguard::security {

namespace {

using json = nlohmann::json;

double ElapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
}

std::atomic<SecurePromptPreprocessor*> g_default_preprocessor{nullptr};
std::unique_ptr<SecurePromptPreprocessor> g_default_owner;
std::mutex g_default_mutex;

}  // namespace

absl::Status ValidateThresholds(double low, double medium, double high) {
    for (double value : {low, medium, high}) {
        if (std::isnan(value) || value < 0.0 || value > 1.0) {
            return MakeError(ErrorCode::kValidationError,
                             absl::StrFormat("Thresholds must be within [0, 1] "
                                             "(low=%g, medium=%g, high=%g)",
                                             low, medium, high));
        }
    }
    if (!(low <= medium && medium <= high)) {
        return MakeError(ErrorCode::kValidationError,
                         absl::StrFormat("Thresholds must satisfy low <= medium <= high "
                                         "(low=%g, medium=%g, high=%g)",
                                         low, medium, high));
    }
    return absl::OkStatus();
}

json SecurePreprocessResultToJson(const SecurePreprocessResult& result) {
    json j;
    j["allowed"] = result.allowed;
    j["action_taken"] = ActionToString(result.action_taken);
    j["sanitized_text"] = result.sanitized_text.has_value()
                              ? json(*result.sanitized_text) : json(nullptr);
    j["system_wrapper"] = result.system_wrapper.has_value()
                              ? json(*result.system_wrapper) : json(nullptr);
    j["detection"] = result.detection.ToJson();
    j["audit"] = result.audit.ToJson();
    j["session_terminated"] = result.session_terminated;
    j["log_level"] = LogLevelToString(result.log_level);
    return j;
}

// ============================================================================
// SecurePromptPreprocessor
// ============================================================================

SecurePromptPreprocessor::SecurePromptPreprocessor(
    std::shared_ptr<InjectionDetector> detector,
    std::shared_ptr<Sanitizer> sanitizer,
    PreprocessorConfig config,
    std::shared_ptr<AuditLogger> audit_logger,
    std::shared_ptr<SecurityAlerter> alerter,
    std::shared_ptr<SessionStore> session_store)
    : detector_(std::move(detector)),
      sanitizer_(std::move(sanitizer)),
      config_(std::move(config)),
      audit_logger_(std::move(audit_logger)),
      alerter_(std::move(alerter)),
      session_store_(std::move(session_store)) {}

SecurePromptPreprocessor::~SecurePromptPreprocessor() = default;

absl::Status SecurePromptPreprocessor::Initialize() {
    if (initialized_) {
        return absl::OkStatus();
    }

    PROMPTGUARD_RETURN_IF_ERROR(ValidateThresholds(
        config_.low_threshold, config_.medium_threshold, config_.high_threshold));

    if (!detector_) {
        return MakeError(ErrorCode::kConfigurationError, "Preprocessor requires a detector");
    }
    if (!sanitizer_) {
        return MakeError(ErrorCode::kConfigurationError, "Preprocessor requires a sanitizer");
    }
    if (!audit_logger_) {
        audit_logger_ = std::make_shared<SpdlogAuditLogger>();
    }

    PROMPTGUARD_LOG_DEBUG(
        "Preprocessor initialized (low={}, medium={}, high={}, alerter={}, sessions={})",
        config_.low_threshold, config_.medium_threshold, config_.high_threshold,
        alerter_ != nullptr, session_store_ != nullptr);

    initialized_ = true;
    return absl::OkStatus();
}

SecurityAction SecurePromptPreprocessor::Decide(
    double score,
    std::optional<SecuritySeverity> severity,
    std::optional<SecurityAction> recommended) const {
    SecurityAction action = SecurityAction::kAllow;
    if (score >= config_.high_threshold) {
        action = SecurityAction::kBlock;
    } else if (score >= config_.low_threshold) {
        action = SecurityAction::kWarn;
    }

    if (severity == SecuritySeverity::kHigh && action == SecurityAction::kAllow) {
        action = SecurityAction::kWarn;
    }

    // Recommendations only ever tighten the decision
    if (recommended.has_value()) {
        action = StricterAction(action, *recommended);
    }
    return action;
}

absl::StatusOr<SecurePreprocessResult> SecurePromptPreprocessor::Preprocess(
    std::string_view text, const DetectionContext& context) {
    if (!initialized_) {
        return absl::FailedPreconditionError("Preprocessor not initialized");
    }

    const auto start_time = std::chrono::steady_clock::now();

    PROMPTGUARD_ASSIGN_OR_RETURN(std::string fingerprint, ComputeFingerprint(text));
    const size_t length = Utf8Length(text);

    // 1. Detect
    auto detection_or = detector_->Detect(text, context);
    if (!detection_or.ok()) {
        PROMPTGUARD_LOG_ERROR("Detection failed (len={}, sha8={}): {}",
                              length, fingerprint,
                              absl::StatusCodeToString(detection_or.status().code()));
        return detection_or.status();
    }
    const DetectionResult& detection = *detection_or;

    // 2. Decide
    const SecurityAction action = Decide(detection.confidence_score(),
                                         detection.risk_level(),
                                         detection.recommended_action());

    // 3. Sanitize
    std::optional<SecurityAction> action_override;
    if (action != detection.recommended_action().value_or(SecurityAction::kAllow)) {
        action_override = action;
    }
    auto neutralized_or = sanitizer_->Sanitize(text, detection, ResolvePolicyTemplate(),
                                               action_override);
    if (!neutralized_or.ok()) {
        PROMPTGUARD_LOG_ERROR("Sanitization failed (len={}, sha8={}): {}",
                              length, fingerprint,
                              absl::StatusCodeToString(neutralized_or.status().code()));
        return neutralized_or.status();
    }
    NeutralizedResult& neutralized = *neutralized_or;
    const bool sanitized = neutralized.sanitized_text.has_value();

    // 4. Summary and audit payload
    SecurePreprocessResult result;
    result.allowed = action != SecurityAction::kBlock;
    result.action_taken = action;
    result.sanitized_text = std::move(neutralized.sanitized_text);
    result.system_wrapper = std::move(neutralized.system_wrapper);
    result.detection = DetectionSummary::From(detection);

    AuditPayload& audit = result.audit;
    audit.ts = CurrentTimestamp();
    audit.sid = context.session_id;
    audit.rid = context.request_id;
    audit.ua = context.user_agent;
    audit.ip = context.source_ip;
    audit.patterns = CapPatterns(detection.detected_patterns());
    audit.score = detection.confidence_score();
    audit.sev = detection.risk_level();
    audit.action = action;
    audit.len = length;
    audit.sha8 = fingerprint;
    audit.constrained = true;
    audit.sanitized = sanitized;
    audit.ms = ElapsedMs(start_time);

    // 5. Log
    result.log_level = SelectLogLevel(action, sanitized);
    EmitAudit(audit, result.log_level);

    // 6. Alert
    if (action == SecurityAction::kBlock ||
        detection.risk_level() == SecuritySeverity::kHigh) {
        RaiseAlert(detection, audit, context);
    }

    // 7. Terminate session
    if (action == SecurityAction::kBlock && context.session_id.has_value()) {
        result.session_terminated = TerminateSession(*context.session_id);
    }

    return result;
}

LogLevel SecurePromptPreprocessor::SelectLogLevel(SecurityAction action, bool sanitized) {
    switch (action) {
        case SecurityAction::kAllow:
            return LogLevel::kDebug;
        case SecurityAction::kBlock:
            return LogLevel::kError;
        case SecurityAction::kWarn:
            return sanitized ? LogLevel::kInfo : LogLevel::kWarn;
    }
    return LogLevel::kWarn;
}

// ============================================================================
// Private Implementation
// ============================================================================

std::optional<std::string> SecurePromptPreprocessor::ResolvePolicyTemplate() const {
    if (!config_.policy_template_provider) {
        return std::nullopt;
    }
    try {
        return config_.policy_template_provider();
    } catch (const std::exception& e) {
        PROMPTGUARD_LOG_WARN("Policy template provider failed, using default policy: {}",
                             e.what());
        return std::nullopt;
    }
}

void SecurePromptPreprocessor::EmitAudit(const AuditPayload& payload, LogLevel level) const {
    try {
        audit_logger_->Log(payload, level);
    } catch (const std::exception& e) {
        PROMPTGUARD_LOG_ERROR("Audit logging failed (sha8={}): {}", payload.sha8, e.what());
    }
}

void SecurePromptPreprocessor::RaiseAlert(const DetectionResult& detection,
                                          const AuditPayload& payload,
                                          const DetectionContext& context) const {
    if (!alerter_) {
        return;
    }

    SecurityAlertEvent event;
    event.timestamp = payload.ts;
    event.session_id = context.session_id;
    event.request_id = context.request_id;
    event.source_ip = context.source_ip;
    event.severity = detection.risk_level();
    event.score = detection.confidence_score();
    event.detected_patterns = payload.patterns;
    event.injection_type = detection.injection_type();
    event.action_taken = payload.action;
    event.input_fingerprint = payload.sha8;
    event.details = absl::StrFormat(
        "Prompt injection verdict %s (score=%.2f, patterns=%d, len=%d)",
        ActionToString(payload.action), payload.score,
        detection.detected_patterns().size(), payload.len);

    try {
        alerter_->Notify(event);
    } catch (const std::exception& e) {
        PROMPTGUARD_LOG_ERROR("Security alert failed (sha8={}): {}", payload.sha8, e.what());
    }
}

bool SecurePromptPreprocessor::TerminateSession(const std::string& session_id) const {
    if (!session_store_) {
        return false;
    }
    try {
        if (session_store_->RemoveSession(session_id)) {
            PROMPTGUARD_LOG_WARN("Session {} terminated after blocked prompt", session_id);
            return true;
        }
        PROMPTGUARD_LOG_WARN("Session {} could not be removed after blocked prompt",
                             session_id);
    } catch (const std::exception& e) {
        PROMPTGUARD_LOG_ERROR("Session {} removal failed: {}", session_id, e.what());
    }
    return false;
}

// ============================================================================
// Factory and default instance
// ============================================================================

absl::StatusOr<std::unique_ptr<SecurePromptPreprocessor>> CreateSecurePromptPreprocessor(
    std::shared_ptr<InjectionDetector> detector,
    std::shared_ptr<Sanitizer> sanitizer,
    PreprocessorConfig config,
    std::shared_ptr<AuditLogger> audit_logger,
    std::shared_ptr<SecurityAlerter> alerter,
    std::shared_ptr<SessionStore> session_store) {
    auto preprocessor = std::make_unique<SecurePromptPreprocessor>(
        std::move(detector), std::move(sanitizer), std::move(config),
        std::move(audit_logger), std::move(alerter), std::move(session_store));
    PROMPTGUARD_RETURN_IF_ERROR(preprocessor->Initialize());
    return preprocessor;
}

absl::StatusOr<SecurePromptPreprocessor*> DefaultPreprocessor() {
    if (auto* instance = g_default_preprocessor.load(std::memory_order_acquire)) {
        return instance;
    }

    std::lock_guard<std::mutex> lock(g_default_mutex);
    if (auto* instance = g_default_preprocessor.load(std::memory_order_relaxed)) {
        return instance;
    }

    PROMPTGUARD_ASSIGN_OR_RETURN(auto detector, CreatePatternInjectionDetector());
    PROMPTGUARD_ASSIGN_OR_RETURN(auto sanitizer, CreateSanitizationService());
    PROMPTGUARD_ASSIGN_OR_RETURN(
        g_default_owner,
        CreateSecurePromptPreprocessor(std::move(detector), std::move(sanitizer)));

    g_default_preprocessor.store(g_default_owner.get(), std::memory_order_release);
    return g_default_owner.get();
}

absl::StatusOr<SecurePreprocessResult> SecurePreprocess(std::string_view text,
                                                        const DetectionContext& context) {
    PROMPTGUARD_ASSIGN_OR_RETURN(auto* preprocessor, DefaultPreprocessor());
    return preprocessor->Preprocess(text, context);
}

}  // namespace promptguard::security

/// @file security_config.cpp
/// @brief Typed PromptGuard settings and pipeline wiring

#include "security/security_config.h"

#include <cmath>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace promptguard::security {

namespace {

absl::Status RequirePositive(std::string_view key, int64_t value) {
    if (value <= 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat(absl::string_view(key.data(), key.size()), " must be positive, got ", value));
    }
    return absl::OkStatus();
}

absl::Status RequireUnitInterval(std::string_view key, double value) {
    if (std::isnan(value) || value < 0.0 || value > 1.0) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat(absl::string_view(key.data(), key.size()), " must be within [0, 1], got ", value));
    }
    return absl::OkStatus();
}

}  // namespace

absl::StatusOr<PromptGuardConfig> LoadPromptGuardConfig(const Config& config) {
    PromptGuardConfig result;

    // ===== Thresholds =====
    PreprocessorConfig& thresholds = result.preprocessor;
    PROMPTGUARD_ASSIGN_OR_RETURN(
        thresholds.low_threshold,
        config.ReadDouble("security.thresholds.low", thresholds.low_threshold));
    PROMPTGUARD_ASSIGN_OR_RETURN(
        thresholds.medium_threshold,
        config.ReadDouble("security.thresholds.medium", thresholds.medium_threshold));
    PROMPTGUARD_ASSIGN_OR_RETURN(
        thresholds.high_threshold,
        config.ReadDouble("security.thresholds.high", thresholds.high_threshold));
    PROMPTGUARD_RETURN_IF_ERROR(ValidateThresholds(
        thresholds.low_threshold, thresholds.medium_threshold, thresholds.high_threshold));

    PROMPTGUARD_ASSIGN_OR_RETURN(
        result.batch.high_confidence_threshold,
        config.ReadDouble("security.batch.high_confidence_threshold",
                          result.batch.high_confidence_threshold));
    PROMPTGUARD_RETURN_IF_ERROR(RequireUnitInterval(
        "security.batch.high_confidence_threshold", result.batch.high_confidence_threshold));

    // ===== Detector =====
    PatternDetectorConfig& detector = result.detector;
    PROMPTGUARD_ASSIGN_OR_RETURN(
        detector.detection_threshold,
        config.ReadDouble("security.detector.detection_threshold",
                          detector.detection_threshold));
    PROMPTGUARD_RETURN_IF_ERROR(RequireUnitInterval(
        "security.detector.detection_threshold", detector.detection_threshold));

    PROMPTGUARD_ASSIGN_OR_RETURN(
        detector.max_context_tokens,
        config.ReadInt("security.detector.max_context_tokens", detector.max_context_tokens));
    PROMPTGUARD_RETURN_IF_ERROR(RequirePositive(
        "security.detector.max_context_tokens", detector.max_context_tokens));

    PROMPTGUARD_ASSIGN_OR_RETURN(
        int64_t max_scan_chars,
        config.ReadInt("security.detector.max_scan_chars",
                       static_cast<int64_t>(detector.max_scan_chars)));
    PROMPTGUARD_RETURN_IF_ERROR(RequirePositive("security.detector.max_scan_chars",
                                                max_scan_chars));
    detector.max_scan_chars = static_cast<size_t>(max_scan_chars);

    // ===== Sanitizer =====
    PROMPTGUARD_ASSIGN_OR_RETURN(
        int64_t max_input_length,
        config.ReadInt("security.sanitizer.max_input_length",
                       static_cast<int64_t>(result.sanitizer.max_input_length)));
    PROMPTGUARD_RETURN_IF_ERROR(RequirePositive("security.sanitizer.max_input_length",
                                                max_input_length));
    result.sanitizer.max_input_length = static_cast<size_t>(max_input_length);

    const std::string policy = config.GetString("security.sanitizer.policy_template");
    if (!absl::StripAsciiWhitespace(policy).empty()) {
        result.policy_template = policy;
        result.preprocessor.policy_template_provider = [policy]() {
            return std::optional<std::string>(policy);
        };
    }

    // ===== Alerting =====
    result.alerting_enabled = config.GetBool("security.alerting.enabled", true);
    PROMPTGUARD_ASSIGN_OR_RETURN(
        int64_t queue_capacity,
        config.ReadInt("security.alerting.queue_capacity",
                       static_cast<int64_t>(result.alerting.queue_capacity)));
    PROMPTGUARD_RETURN_IF_ERROR(RequirePositive("security.alerting.queue_capacity",
                                                queue_capacity));
    result.alerting.queue_capacity = static_cast<size_t>(queue_capacity);

    // ===== Logging =====
    if (config.HasKey("logging.level")) {
        auto level = ParseLogLevel(config.GetString("logging.level"));
        if (!level.ok()) {
            return MakeError(ErrorCode::kConfigurationError, std::string_view(level.status().message().data(), level.status().message().size()));
        }
        result.logging.level = *level;
    }
    const std::string log_file = config.GetString("logging.file");
    if (!log_file.empty()) {
        result.logging.enable_file = true;
        result.logging.file_path = log_file;
    }

    return result;
}

// ============================================================================
// Pipeline wiring
// ============================================================================

void PromptGuardPipeline::Shutdown() {
    if (alerter) {
        alerter->Stop();
    }
}

absl::StatusOr<PromptGuardPipeline> BuildPromptGuardPipeline(
    const PromptGuardConfig& config,
    std::shared_ptr<SessionStore> session_store) {
    PromptGuardPipeline pipeline;

    PROMPTGUARD_ASSIGN_OR_RETURN(pipeline.detector,
                                 CreatePatternInjectionDetector(config.detector));
    PROMPTGUARD_ASSIGN_OR_RETURN(pipeline.sanitizer,
                                 CreateSanitizationService(config.sanitizer));

    if (config.alerting_enabled) {
        pipeline.alerter = std::make_shared<AsyncAlerter>(
            std::make_shared<LoggingAlerter>(), config.alerting);
        PROMPTGUARD_RETURN_IF_ERROR(pipeline.alerter->Start());
    }

    PROMPTGUARD_ASSIGN_OR_RETURN(
        pipeline.preprocessor,
        CreateSecurePromptPreprocessor(pipeline.detector, pipeline.sanitizer,
                                       config.preprocessor,
                                       std::make_shared<SpdlogAuditLogger>(),
                                       pipeline.alerter, session_store));
    PROMPTGUARD_ASSIGN_OR_RETURN(
        pipeline.processor,
        CreateSecurePromptProcessor(session_store, pipeline.preprocessor,
                                    pipeline.detector, config.batch));

    return pipeline;
}

}  // namespace promptguard::security

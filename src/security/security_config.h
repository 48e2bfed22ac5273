#pragma once

/// @file security_config.h
/// @brief Typed PromptGuard settings and pipeline wiring
///
/// Recognized keys (environment overrides in parentheses):
///   security.thresholds.low|medium|high (PROMPTGUARD_THRESHOLD_LOW|MEDIUM|HIGH)
///   security.batch.high_confidence_threshold (PROMPTGUARD_HIGH_CONFIDENCE_THRESHOLD)
///   security.detector.detection_threshold
///   security.detector.max_context_tokens
///   security.detector.max_scan_chars
///   security.sanitizer.max_input_length
///   security.sanitizer.policy_template (PROMPTGUARD_POLICY_TEMPLATE)
///   security.alerting.enabled
///   security.alerting.queue_capacity
///   logging.level (PROMPTGUARD_LOG_LEVEL)
///   logging.file

#include <memory>
#include <optional>
#include <string>

#include <absl/status/statusor.h>

#include "common/config.h"
#include "common/logging.h"
#include "security/alerter.h"
#include "security/batch_processor.h"
#include "security/pattern_detector.h"
#include "security/preprocessor.h"
#include "security/sanitizer.h"
#include "security/session_store.h"

namespace promptguard::security {

/// @brief Validated settings for every pipeline component
struct PromptGuardConfig {
    PreprocessorConfig preprocessor;
    BatchProcessorConfig batch;
    PatternDetectorConfig detector;
    SanitizerConfig sanitizer;

    /// Caller policy wrapper; the built-in policy applies when absent
    std::optional<std::string> policy_template;

    bool alerting_enabled = true;
    AsyncAlerterConfig alerting;

    LogConfig logging;
};

/// @brief Read and validate settings; out-of-range values are rejected, never clamped
absl::StatusOr<PromptGuardConfig> LoadPromptGuardConfig(const Config& config);

/// @brief Fully wired components sharing one session store
struct PromptGuardPipeline {
    std::shared_ptr<PatternInjectionDetector> detector;
    std::shared_ptr<SanitizationService> sanitizer;
    std::shared_ptr<AsyncAlerter> alerter;  ///< Null when alerting is disabled
    std::shared_ptr<SecurePromptPreprocessor> preprocessor;
    std::shared_ptr<SecurePromptProcessor> processor;

    /// @brief Stop alert delivery after flushing pending events
    void Shutdown();
};

/// @brief Build detector, sanitizer, alerter, preprocessor and batch processor
absl::StatusOr<PromptGuardPipeline> BuildPromptGuardPipeline(
    const PromptGuardConfig& config,
    std::shared_ptr<SessionStore> session_store);

}  // namespace promptguard::security

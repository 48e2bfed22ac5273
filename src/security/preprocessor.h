#pragma once

/// @file preprocessor.h
/// @brief Secure prompt preprocessing pipeline
///
/// For each prompt the preprocessor:
/// 1. runs the detector
/// 2. decides an action from the score thresholds (stricter detector
///    recommendations win)
/// 3. sanitizes the text and resolves the policy wrapper
/// 4. builds a log-safe detection summary and audit payload
/// 5. writes the audit payload at a level derived from the action
/// 6. alerts on BLOCK or HIGH severity
/// 7. removes the caller's session on BLOCK
///
/// Alerter, audit logger and session store failures are logged and never
/// reach the caller.

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "common/logging.h"
#include "security/alerter.h"
#include "security/audit.h"
#include "security/detector.h"
#include "security/sanitizer.h"
#include "security/session_store.h"
#include "security/types.h"

namespace promptguard::security {

/// @brief Supplies a caller policy; nullopt or blank selects the default policy
using PolicyTemplateProvider = std::function<std::optional<std::string>()>;

/// @brief Decision thresholds and policy source
struct PreprocessorConfig {
    /// Scores at or above low_threshold are at least WARN
    double low_threshold = 0.25;

    /// Lower edge of the upper WARN band (reported, same action as the low band)
    double medium_threshold = 0.60;

    /// Scores at or above high_threshold are BLOCK
    double high_threshold = 0.85;

    /// Optional policy wrapper source
    PolicyTemplateProvider policy_template_provider;
};

/// @brief Verdict for one prompt
struct SecurePreprocessResult {
    /// False iff action_taken is BLOCK
    bool allowed = true;
    SecurityAction action_taken = SecurityAction::kAllow;

    /// Present only when sanitization changed the text
    std::optional<std::string> sanitized_text;
    std::optional<std::string> system_wrapper;

    DetectionSummary detection;
    AuditPayload audit;

    /// True when this call removed the caller's session
    bool session_terminated = false;

    /// Level the audit record was written at
    LogLevel log_level = LogLevel::kDebug;
};

/// @brief Render a result as JSON for callers and tooling
nlohmann::json SecurePreprocessResultToJson(const SecurePreprocessResult& result);

/// @brief Fails unless 0 <= low <= medium <= high <= 1
absl::Status ValidateThresholds(double low, double medium, double high);

/// @brief Orchestrates detection, sanitization, audit, alerting and session termination
///
/// Example:
/// @code
///   auto preprocessor = CreateSecurePromptPreprocessor(detector, sanitizer);
///   DetectionContext context;
///   context.session_id = "session-42";
///   auto result = (*preprocessor)->Preprocess(user_input, context);
///   if (result.ok() && !result->allowed) {
///       // reject the request; the session is already gone
///   }
/// @endcode
class SecurePromptPreprocessor {
public:
    SecurePromptPreprocessor(std::shared_ptr<InjectionDetector> detector,
                             std::shared_ptr<Sanitizer> sanitizer,
                             PreprocessorConfig config = {},
                             std::shared_ptr<AuditLogger> audit_logger = nullptr,
                             std::shared_ptr<SecurityAlerter> alerter = nullptr,
                             std::shared_ptr<SessionStore> session_store = nullptr);
    ~SecurePromptPreprocessor();

    // Disable copy
    SecurePromptPreprocessor(const SecurePromptPreprocessor&) = delete;
    SecurePromptPreprocessor& operator=(const SecurePromptPreprocessor&) = delete;

    /// @brief Validate thresholds and collaborators
    absl::Status Initialize();

    /// @brief Map a score to an action
    ///
    /// score >= high is BLOCK, score >= low is WARN, otherwise ALLOW.
    /// HIGH severity lifts ALLOW to WARN, and a stricter recommendation wins.
    SecurityAction Decide(double score,
                          std::optional<SecuritySeverity> severity,
                          std::optional<SecurityAction> recommended) const;

    /// @brief Run the full pipeline for one prompt
    /// @return The verdict, or the detector/sanitizer error (e.g. input too large)
    absl::StatusOr<SecurePreprocessResult> Preprocess(std::string_view text,
                                                      const DetectionContext& context = {});

    /// @brief Level used for an audit record
    static LogLevel SelectLogLevel(SecurityAction action, bool sanitized);

    const PreprocessorConfig& GetConfig() const { return config_; }

    /// True when a session store is wired in
    bool ManagesSessions() const { return session_store_ != nullptr; }

private:
    std::optional<std::string> ResolvePolicyTemplate() const;

    void EmitAudit(const AuditPayload& payload, LogLevel level) const;

    void RaiseAlert(const DetectionResult& detection,
                    const AuditPayload& payload,
                    const DetectionContext& context) const;

    bool TerminateSession(const std::string& session_id) const;

    std::shared_ptr<InjectionDetector> detector_;
    std::shared_ptr<Sanitizer> sanitizer_;
    PreprocessorConfig config_;
    std::shared_ptr<AuditLogger> audit_logger_;
    std::shared_ptr<SecurityAlerter> alerter_;
    std::shared_ptr<SessionStore> session_store_;

    bool initialized_ = false;
};

/// @brief Create and initialize a preprocessor; invalid thresholds fail here
absl::StatusOr<std::unique_ptr<SecurePromptPreprocessor>> CreateSecurePromptPreprocessor(
    std::shared_ptr<InjectionDetector> detector,
    std::shared_ptr<Sanitizer> sanitizer,
    PreprocessorConfig config = {},
    std::shared_ptr<AuditLogger> audit_logger = nullptr,
    std::shared_ptr<SecurityAlerter> alerter = nullptr,
    std::shared_ptr<SessionStore> session_store = nullptr);

// =============================================================================
// Process-wide default instance
// =============================================================================

/// @brief Lazily built preprocessor with default detector, sanitizer and audit logger
///
/// The default instance has no alerter and no session store. Construction
/// happens once even under concurrent first use.
absl::StatusOr<SecurePromptPreprocessor*> DefaultPreprocessor();

/// @brief Preprocess with the default instance
absl::StatusOr<SecurePreprocessResult> SecurePreprocess(std::string_view text,
                                                        const DetectionContext& context = {});

}  // namespace promptguard::security

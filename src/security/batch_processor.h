#pragma once

/// @file batch_processor.h
/// @brief Session-guarded processing of an ordered prompt list
///
/// The batch processor walks a prompt list for one session. Before each
/// prompt it re-fetches the session and stops for good once the session is
/// gone. The first blocked or high-confidence prompt terminates the session
/// and ends the batch.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "security/detector.h"
#include "security/preprocessor.h"
#include "security/session_store.h"
#include "security/types.h"

namespace promptguard::security {

/// @brief Configuration for batch processing
struct BatchProcessorConfig {
    /// Raw confidence at or above this bar terminates the session, independent
    /// of the preprocessor's BLOCK threshold
    double high_confidence_threshold = 0.9;
};

/// @brief Outcome of one processed prompt
struct PromptRecord {
    int64_t prompt_index = 0;

    /// Echoed prompt; absent on error entries
    std::optional<std::string> prompt;

    bool injection_detected = false;
    double confidence_score = 0.0;
    std::optional<InjectionType> injection_type;
    std::optional<SecuritySeverity> risk_level;
    std::optional<SecurityAction> recommended_action;

    /// Preprocessor decision; absent when the detector ran alone
    std::optional<SecurityAction> action_taken;

    /// Status code name of a failed prompt ("INVALID_ARGUMENT", "INTERNAL", ...)
    std::optional<std::string> error;

    nlohmann::json ToJson() const;
};

/// @brief Result of a batch run
struct PromptProcessingResult {
    bool high_confidence_detected = false;
    int64_t detection_index = -1;
    bool session_terminated = false;
    size_t total_prompts_processed = 0;
    std::vector<PromptRecord> detection_results;

    nlohmann::json ToJson() const;
};

/// @brief Result of the single-prompt guard
struct GuardedPromptResult {
    /// False when the session was absent and nothing ran
    bool should_continue = false;
    std::optional<PromptRecord> record;
};

/// @brief Drives the preprocessor (or a bare detector) across prompts for one session
///
/// Example:
/// @code
///   auto processor = CreateSecurePromptProcessor(sessions, preprocessor);
///   auto result = (*processor)->ProcessPromptsWithSecurity(prompts, "session-42");
///   if (result.ok() && result->session_terminated) {
///       // prompt result->detection_index ended the conversation
///   }
/// @endcode
class SecurePromptProcessor {
public:
    /// @param session_store Session collaborator (required)
    /// @param preprocessor Full pipeline; preferred when set
    /// @param detector Fallback used only when no preprocessor is set
    SecurePromptProcessor(std::shared_ptr<SessionStore> session_store,
                          std::shared_ptr<SecurePromptPreprocessor> preprocessor,
                          std::shared_ptr<InjectionDetector> detector = nullptr,
                          BatchProcessorConfig config = {});
    ~SecurePromptProcessor();

    // Disable copy
    SecurePromptProcessor(const SecurePromptProcessor&) = delete;
    SecurePromptProcessor& operator=(const SecurePromptProcessor&) = delete;

    absl::Status Initialize();

    /// @brief Process prompts in order until the list ends, the session disappears
    ///        or a prompt terminates the session
    absl::StatusOr<PromptProcessingResult> ProcessPromptsWithSecurity(
        const std::vector<std::string>& prompts,
        const std::string& session_id,
        DetectionContext context = {});

    /// @brief Run one prompt if the session still exists
    /// @param prompt_index Position of the prompt in the caller's sequence,
    ///        recorded as the record's prompt_index
    absl::StatusOr<GuardedPromptResult> ProcessSinglePromptWithGuard(
        const std::string& prompt,
        const std::string& session_id,
        int64_t prompt_index = 0,
        DetectionContext context = {});

    /// @brief True when the session no longer exists
    bool ValidateSessionTermination(const std::string& session_id);

    const BatchProcessorConfig& GetConfig() const { return config_; }

private:
    struct Evaluation {
        PromptRecord record;
        bool terminate = false;        ///< BLOCK or score >= bar
        bool session_removed = false;  ///< Removed by the preprocessor
    };

    Evaluation EvaluatePrompt(int64_t index,
                              const std::string& prompt,
                              const DetectionContext& context);

    absl::StatusOr<Evaluation> RunPipeline(int64_t index,
                                           const std::string& prompt,
                                           const DetectionContext& context);

    bool SessionExists(const std::string& session_id);

    std::shared_ptr<SessionStore> session_store_;
    std::shared_ptr<SecurePromptPreprocessor> preprocessor_;
    std::shared_ptr<InjectionDetector> detector_;
    BatchProcessorConfig config_;

    bool initialized_ = false;
};

/// @brief Create and initialize a batch processor
absl::StatusOr<std::unique_ptr<SecurePromptProcessor>> CreateSecurePromptProcessor(
    std::shared_ptr<SessionStore> session_store,
    std::shared_ptr<SecurePromptPreprocessor> preprocessor,
    std::shared_ptr<InjectionDetector> detector = nullptr,
    BatchProcessorConfig config = {});

}  // namespace promptguard::security

/// @file batch_processor.cpp
/// @brief Session-guarded batch processing implementation

#include "security/batch_processor.h"

#include <cmath>

#include <absl/strings/str_format.h>

#include "common/error.h"
#include "common/logging.h"

namespace promptguard::security {

namespace {

using json = nlohmann::json;

template <typename T>
json OptionalName(const std::optional<T>& value, std::string (*to_string)(T)) {
    return value.has_value() ? json(to_string(*value)) : json(nullptr);
}

PromptRecord ErrorRecord(int64_t index, absl::StatusCode code) {
    PromptRecord record;
    record.prompt_index = index;
    record.injection_detected = false;
    record.confidence_score = 0.0;
    record.error = absl::StatusCodeToString(code);
    return record;
}

}  // namespace

json PromptRecord::ToJson() const {
    json j;
    j["prompt_index"] = prompt_index;
    if (prompt.has_value()) {
        j["prompt"] = *prompt;
    }
    j["injection_detected"] = injection_detected;
    j["confidence_score"] = confidence_score;
    if (error.has_value()) {
        j["error"] = *error;
        return j;
    }
    j["injection_type"] = OptionalName(injection_type, &InjectionTypeToString);
    j["risk_level"] = OptionalName(risk_level, &SeverityToString);
    j["recommended_action"] = OptionalName(recommended_action, &ActionToString);
    if (action_taken.has_value()) {
        j["action_taken"] = ActionToString(*action_taken);
    }
    return j;
}

json PromptProcessingResult::ToJson() const {
    json records = json::array();
    for (const auto& record : detection_results) {
        records.push_back(record.ToJson());
    }

    json j;
    j["high_confidence_detected"] = high_confidence_detected;
    j["detection_index"] = detection_index;
    j["session_terminated"] = session_terminated;
    j["total_prompts_processed"] = total_prompts_processed;
    j["detection_results"] = std::move(records);
    return j;
}

// ============================================================================
// SecurePromptProcessor
// ============================================================================

SecurePromptProcessor::SecurePromptProcessor(
    std::shared_ptr<SessionStore> session_store,
    std::shared_ptr<SecurePromptPreprocessor> preprocessor,
    std::shared_ptr<InjectionDetector> detector,
    BatchProcessorConfig config)
    : session_store_(std::move(session_store)),
      preprocessor_(std::move(preprocessor)),
      detector_(std::move(detector)),
      config_(config) {}

SecurePromptProcessor::~SecurePromptProcessor() = default;

absl::Status SecurePromptProcessor::Initialize() {
    if (initialized_) {
        return absl::OkStatus();
    }

    if (!session_store_) {
        return MakeError(ErrorCode::kConfigurationError,
                         "Batch processor requires a session store");
    }
    if (!preprocessor_ && !detector_) {
        return MakeError(ErrorCode::kConfigurationError,
                         "Batch processor requires a preprocessor or a detector");
    }

    const double bar = config_.high_confidence_threshold;
    if (std::isnan(bar) || bar < 0.0 || bar > 1.0) {
        return MakeError(ErrorCode::kValidationError,
                         absl::StrFormat("High-confidence threshold must be within [0, 1], got %g",
                                         bar));
    }

    if (preprocessor_ && bar < preprocessor_->GetConfig().high_threshold) {
        // Both knobs stay active; a prompt can end the batch before it would be blocked
        PROMPTGUARD_LOG_DEBUG("High-confidence bar {} is below the BLOCK threshold {}",
                              bar, preprocessor_->GetConfig().high_threshold);
    }

    initialized_ = true;
    return absl::OkStatus();
}

absl::StatusOr<PromptProcessingResult> SecurePromptProcessor::ProcessPromptsWithSecurity(
    const std::vector<std::string>& prompts,
    const std::string& session_id,
    DetectionContext context) {
    if (!initialized_) {
        return absl::FailedPreconditionError("Batch processor not initialized");
    }

    PromptProcessingResult result;
    if (prompts.empty()) {
        return result;
    }

    context.session_id = session_id;

    for (size_t i = 0; i < prompts.size(); ++i) {
        const auto index = static_cast<int64_t>(i);

        // Guard: a session removed earlier (here or elsewhere) ends the batch
        if (!SessionExists(session_id)) {
            PROMPTGUARD_LOG_INFO("Session {} is gone, stopping batch at prompt {}",
                                 session_id, index);
            break;
        }

        PROMPTGUARD_LOG_DEBUG("Processing prompt {}/{} for session {}",
                              i + 1, prompts.size(), session_id);

        Evaluation evaluation = EvaluatePrompt(index, prompts[i], context);
        result.detection_results.push_back(std::move(evaluation.record));

        if (!evaluation.terminate) {
            continue;
        }

        const PromptRecord& record = result.detection_results.back();
        result.high_confidence_detected = true;
        result.detection_index = index;
        PROMPTGUARD_LOG_WARN(
            "High-confidence injection at prompt {} in session {} (score={:.3f})",
            index, session_id, record.confidence_score);

        if (evaluation.session_removed) {
            result.session_terminated = true;
        } else {
            try {
                result.session_terminated = session_store_->RemoveSession(session_id);
            } catch (const std::exception& e) {
                PROMPTGUARD_LOG_ERROR("Session {} removal failed: {}", session_id, e.what());
                result.session_terminated = false;
            }
        }

        if (result.session_terminated) {
            PROMPTGUARD_LOG_INFO("Session {} terminated after prompt {}", session_id, index);
        } else {
            PROMPTGUARD_LOG_WARN("Failed to remove session {} after prompt {}",
                                 session_id, index);
        }
        break;
    }

    result.total_prompts_processed = result.detection_results.size();
    return result;
}

absl::StatusOr<GuardedPromptResult> SecurePromptProcessor::ProcessSinglePromptWithGuard(
    const std::string& prompt,
    const std::string& session_id,
    int64_t prompt_index,
    DetectionContext context) {
    if (!initialized_) {
        return absl::FailedPreconditionError("Batch processor not initialized");
    }
    if (prompt_index < 0) {
        return MakeError(ErrorCode::kValidationError, "prompt_index must not be negative");
    }

    GuardedPromptResult guarded;
    if (!SessionExists(session_id)) {
        PROMPTGUARD_LOG_INFO("Session {} is gone, skipping prompt", session_id);
        return guarded;
    }

    context.session_id = session_id;
    guarded.should_continue = true;
    guarded.record = EvaluatePrompt(prompt_index, prompt, context).record;
    return guarded;
}

bool SecurePromptProcessor::ValidateSessionTermination(const std::string& session_id) {
    return !SessionExists(session_id);
}

// ============================================================================
// Private Implementation
// ============================================================================

SecurePromptProcessor::Evaluation SecurePromptProcessor::EvaluatePrompt(
    int64_t index, const std::string& prompt, const DetectionContext& context) {
    try {
        auto evaluation = RunPipeline(index, prompt, context);
        if (evaluation.ok()) {
            return *std::move(evaluation);
        }
        PROMPTGUARD_LOG_ERROR("Prompt {} failed: {}", index,
                              absl::StatusCodeToString(evaluation.status().code()));
        return Evaluation{ErrorRecord(index, evaluation.status().code())};
    } catch (const std::exception& e) {
        PROMPTGUARD_LOG_ERROR("Prompt {} raised an exception: {}", index, e.what());
        return Evaluation{ErrorRecord(index, absl::StatusCode::kInternal)};
    }
}

absl::StatusOr<SecurePromptProcessor::Evaluation> SecurePromptProcessor::RunPipeline(
    int64_t index, const std::string& prompt, const DetectionContext& context) {
    Evaluation evaluation;
    PromptRecord& record = evaluation.record;
    record.prompt_index = index;
    record.prompt = prompt;

    if (preprocessor_) {
        PROMPTGUARD_ASSIGN_OR_RETURN(auto outcome, preprocessor_->Preprocess(prompt, context));
        const DetectionSummary& detection = outcome.detection;
        record.injection_detected = detection.injection_detected;
        record.confidence_score = detection.confidence_score;
        record.injection_type = detection.injection_type;
        record.risk_level = detection.risk_level;
        record.recommended_action = detection.recommended_action;
        record.action_taken = outcome.action_taken;

        evaluation.terminate = outcome.action_taken == SecurityAction::kBlock ||
                               detection.confidence_score >= config_.high_confidence_threshold;
        evaluation.session_removed = outcome.session_terminated;
        return evaluation;
    }

    PROMPTGUARD_ASSIGN_OR_RETURN(auto detection, detector_->Detect(prompt, context));
    record.injection_detected = detection.injection_detected();
    record.confidence_score = detection.confidence_score();
    record.injection_type = detection.injection_type();
    record.risk_level = detection.risk_level();
    record.recommended_action = detection.recommended_action();

    evaluation.terminate = detection.confidence_score() >= config_.high_confidence_threshold;
    return evaluation;
}

bool SecurePromptProcessor::SessionExists(const std::string& session_id) {
    try {
        return session_store_->GetSession(session_id).has_value();
    } catch (const std::exception& e) {
        // Unknown session state is treated as gone
        PROMPTGUARD_LOG_ERROR("Session {} lookup failed: {}", session_id, e.what());
        return false;
    }
}

absl::StatusOr<std::unique_ptr<SecurePromptProcessor>> CreateSecurePromptProcessor(
    std::shared_ptr<SessionStore> session_store,
    std::shared_ptr<SecurePromptPreprocessor> preprocessor,
    std::shared_ptr<InjectionDetector> detector,
    BatchProcessorConfig config) {
    auto processor = std::make_unique<SecurePromptProcessor>(
        std::move(session_store), std::move(preprocessor), std::move(detector), config);
    PROMPTGUARD_RETURN_IF_ERROR(processor->Initialize());
    return processor;
}

}  // namespace promptguard::security

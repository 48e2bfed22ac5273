/// @file types.cpp
/// @brief Enum conversions and DetectionResult validation

#include "security/types.h"

#include <cmath>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace promptguard::security {

std::string InjectionTypeToString(InjectionType type) {
    switch (type) {
        case InjectionType::kNone: return "none";
        case InjectionType::kInstructionOverride: return "instruction_override";
        case InjectionType::kRoleConfusion: return "role_confusion";
        case InjectionType::kDelimiterInjection: return "delimiter_injection";
        case InjectionType::kContextManipulation: return "context_manipulation";
        case InjectionType::kSystemPromptAccess: return "system_prompt_access";
        case InjectionType::kParameterManipulation: return "parameter_manipulation";
        case InjectionType::kOther: return "other";
    }
    return "other";
}

std::string SeverityToString(SecuritySeverity severity) {
    switch (severity) {
        case SecuritySeverity::kLow: return "low";
        case SecuritySeverity::kMedium: return "medium";
        case SecuritySeverity::kHigh: return "high";
    }
    return "low";
}

std::string ActionToString(SecurityAction action) {
    switch (action) {
        case SecurityAction::kAllow: return "allow";
        case SecurityAction::kWarn: return "warn";
        case SecurityAction::kBlock: return "block";
    }
    return "allow";
}

absl::StatusOr<InjectionType> ParseInjectionType(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::StripAsciiWhitespace(absl::string_view(name.data(), name.size())));
    for (auto type : {InjectionType::kNone, InjectionType::kInstructionOverride,
                      InjectionType::kRoleConfusion, InjectionType::kDelimiterInjection,
                      InjectionType::kContextManipulation, InjectionType::kSystemPromptAccess,
                      InjectionType::kParameterManipulation, InjectionType::kOther}) {
        if (InjectionTypeToString(type) == lowered) {
            return type;
        }
    }
    return MakeError(ErrorCode::kValidationError,
                     absl::StrCat("Unknown injection type: ", absl::string_view(name.data(), name.size())));
}

absl::StatusOr<SecuritySeverity> ParseSeverity(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::StripAsciiWhitespace(absl::string_view(name.data(), name.size())));
    if (lowered == "low") return SecuritySeverity::kLow;
    if (lowered == "medium") return SecuritySeverity::kMedium;
    if (lowered == "high" || lowered == "critical") return SecuritySeverity::kHigh;
    return MakeError(ErrorCode::kValidationError,
                     absl::StrCat("Unknown severity: ", absl::string_view(name.data(), name.size())));
}

absl::StatusOr<SecurityAction> ParseAction(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::StripAsciiWhitespace(absl::string_view(name.data(), name.size())));
    if (lowered == "allow") return SecurityAction::kAllow;
    if (lowered == "warn") return SecurityAction::kWarn;
    if (lowered == "block") return SecurityAction::kBlock;
    return MakeError(ErrorCode::kValidationError,
                     absl::StrCat("Unknown action: ", absl::string_view(name.data(), name.size())));
}

absl::StatusOr<DetectionResult> DetectionResult::Create(
    bool injection_detected,
    double confidence_score,
    std::vector<std::string> detected_patterns,
    std::optional<InjectionType> injection_type,
    std::optional<SecuritySeverity> risk_level,
    std::optional<SecurityAction> recommended_action) {
    if (std::isnan(confidence_score) || confidence_score < 0.0 || confidence_score > 1.0) {
        return MakeError(ErrorCode::kValidationError,
                         absl::StrCat("confidence_score must be within [0, 1], got ",
                                      confidence_score));
    }

    DetectionResult result;
    result.injection_detected_ = injection_detected;
    result.confidence_score_ = confidence_score;
    result.detected_patterns_ = std::move(detected_patterns);
    result.injection_type_ = injection_type;
    result.risk_level_ = risk_level;
    result.recommended_action_ = recommended_action;
    return result;
}

DetectionResult DetectionResult::Neutral() {
    DetectionResult result;
    result.risk_level_ = SecuritySeverity::kLow;
    result.recommended_action_ = SecurityAction::kAllow;
    return result;
}

std::vector<std::string> CapPatterns(const std::vector<std::string>& patterns) {
    if (patterns.size() <= kMaxReportedPatterns) {
        return patterns;
    }
    return std::vector<std::string>(patterns.begin(),
                                    patterns.begin() + kMaxReportedPatterns);
}

}  // namespace promptguard::security

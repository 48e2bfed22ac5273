#pragma once

/// @file types.h
/// @brief Value types shared by the prompt preprocessing pipeline
///
/// Severity and action are small integer-backed scales; merging logic
/// compares them through Rank() so that "upgrade, never downgrade" holds.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

namespace promptguard::security {

/// @brief Why a detection fired
enum class InjectionType : uint8_t {
    kNone,
    kInstructionOverride,
    kRoleConfusion,
    kDelimiterInjection,
    kContextManipulation,
    kSystemPromptAccess,
    kParameterManipulation,
    kOther
};

/// @brief Ordered risk scale (LOW < MEDIUM < HIGH)
enum class SecuritySeverity : uint8_t {
    kLow = 0,
    kMedium = 1,
    kHigh = 2
};

/// @brief Ordered enforcement scale (ALLOW < WARN < BLOCK)
enum class SecurityAction : uint8_t {
    kAllow = 0,
    kWarn = 1,
    kBlock = 2
};

constexpr int Rank(SecuritySeverity severity) { return static_cast<int>(severity); }
constexpr int Rank(SecurityAction action) { return static_cast<int>(action); }

/// @brief The stricter of two actions
constexpr SecurityAction StricterAction(SecurityAction a, SecurityAction b) {
    return Rank(a) >= Rank(b) ? a : b;
}

/// @brief The higher of two severities
constexpr SecuritySeverity HigherSeverity(SecuritySeverity a, SecuritySeverity b) {
    return Rank(a) >= Rank(b) ? a : b;
}

std::string InjectionTypeToString(InjectionType type);
std::string SeverityToString(SecuritySeverity severity);
std::string ActionToString(SecurityAction action);

/// @brief Parse a type name ("instruction_override", ...)
absl::StatusOr<InjectionType> ParseInjectionType(std::string_view name);

/// @brief Parse a severity name; "critical" is accepted as an alias for HIGH
absl::StatusOr<SecuritySeverity> ParseSeverity(std::string_view name);

/// @brief Parse an action name ("allow", "warn", "block")
absl::StatusOr<SecurityAction> ParseAction(std::string_view name);

/// @brief Request metadata passed alongside a prompt
struct DetectionContext {
    std::optional<std::string> session_id;
    std::optional<std::string> request_id;
    std::optional<std::string> user_agent;
    std::optional<std::string> source_ip;

    /// Retrieval parameters validated when present
    std::optional<int64_t> top_k;
    std::optional<double> similarity_threshold;
};

/// @brief Immutable classification of a single prompt
class DetectionResult {
public:
    /// @brief Build a result; fails when the score is outside [0, 1] or NaN
    static absl::StatusOr<DetectionResult> Create(
        bool injection_detected,
        double confidence_score,
        std::vector<std::string> detected_patterns = {},
        std::optional<InjectionType> injection_type = std::nullopt,
        std::optional<SecuritySeverity> risk_level = std::nullopt,
        std::optional<SecurityAction> recommended_action = std::nullopt);

    /// @brief Result for absent or empty text
    static DetectionResult Neutral();

    bool injection_detected() const { return injection_detected_; }
    double confidence_score() const { return confidence_score_; }
    const std::vector<std::string>& detected_patterns() const { return detected_patterns_; }
    const std::optional<InjectionType>& injection_type() const { return injection_type_; }
    const std::optional<SecuritySeverity>& risk_level() const { return risk_level_; }
    const std::optional<SecurityAction>& recommended_action() const {
        return recommended_action_;
    }

private:
    DetectionResult() = default;

    bool injection_detected_ = false;
    double confidence_score_ = 0.0;
    std::vector<std::string> detected_patterns_;
    std::optional<InjectionType> injection_type_;
    std::optional<SecuritySeverity> risk_level_;
    std::optional<SecurityAction> recommended_action_;
};

/// @brief Outcome of a context-window or parameter check
struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> violations;  ///< Named violations, e.g. "invalid_top_k"
    SecurityAction recommended_action = SecurityAction::kAllow;
};

/// @brief Maximum number of pattern labels carried by any emitted payload
inline constexpr size_t kMaxReportedPatterns = 8;

/// @brief First kMaxReportedPatterns entries of a pattern list
std::vector<std::string> CapPatterns(const std::vector<std::string>& patterns);

}  // namespace promptguard::security

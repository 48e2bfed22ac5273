#pragma once

/// @file pattern_detector.h
/// @brief Signature and heuristic based prompt injection detector
///
/// Detection layers, applied to a bounded, Unicode-folded prefix of the text:
/// - Context window and retrieval parameter validation
/// - Versioned regex signature table (see injection_patterns.h)
/// - Context boundary indicators, damped for ordinary questions
/// - Repetition heuristic aware of technical vocabulary
/// - Obfuscation decoding (percent, \u, \x, HTML entities, spaced letters)

#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "security/detector.h"
#include "security/injection_patterns.h"
#include "security/types.h"

namespace promptguard::security {

/// @brief Configuration for the pattern detector
struct PatternDetectorConfig {
    /// Score at or above which injection_detected is set
    double detection_threshold = 0.8;

    /// Reported accuracy target (introspection only)
    double accuracy_target = 0.95;

    /// Context window limit; tokens are estimated as characters / 4
    int64_t max_context_tokens = 8192;

    /// Upper bound on characters scanned by the signature layers, counted
    /// after whitespace and repeated-character runs are compacted
    size_t max_scan_chars = 8192;

    int64_t min_top_k = 1;
    int64_t max_top_k = 50;
    double min_similarity_threshold = 0.1;
    double max_similarity_threshold = 1.0;
};

/// @brief Introspection snapshot of a detector's configuration
struct DetectorInfo {
    double detection_threshold = 0.0;
    double accuracy_target = 0.0;
    int64_t max_context_tokens = 0;
    size_t max_scan_chars = 0;
    int64_t min_top_k = 0;
    int64_t max_top_k = 0;
    double min_similarity_threshold = 0.0;
    double max_similarity_threshold = 0.0;
    int pattern_table_version = 0;
    size_t pattern_count = 0;
};

/// @brief Pattern and heuristic injection detector
///
/// Example:
/// @code
///   auto detector = CreatePatternInjectionDetector();
///   auto result = (*detector)->Detect("ignore previous instructions", {});
///   if (result.ok() && result->injection_detected()) {
///       // confidence >= 0.8, risk HIGH
///   }
/// @endcode
class PatternInjectionDetector : public InjectionDetector {
public:
    explicit PatternInjectionDetector(PatternDetectorConfig config = {});
    ~PatternInjectionDetector() override;

    // Disable copy
    PatternInjectionDetector(const PatternInjectionDetector&) = delete;
    PatternInjectionDetector& operator=(const PatternInjectionDetector&) = delete;

    /// @brief Compile the signature table
    absl::Status Initialize();

    // =========================================================================
    // InjectionDetector Interface
    // =========================================================================

    absl::StatusOr<DetectionResult> Detect(
        std::string_view text, const DetectionContext& context) override;

    // =========================================================================
    // Validation API
    // =========================================================================

    /// @brief Check the estimated token count against the context window
    ValidationResult ValidateContextWindow(std::string_view text) const;

    /// @brief Check retrieval parameters; each violation is reported separately
    ValidationResult ValidateQueryParameters(int64_t top_k,
                                             double similarity_threshold) const;

    // =========================================================================
    // Neutralization
    // =========================================================================

    /// @brief Replace injection phrasing with inert markers
    ///
    /// Applying Neutralize to its own output returns the output unchanged.
    /// Text that neutralizes to nothing becomes a fixed placeholder.
    absl::StatusOr<std::string> Neutralize(std::string_view text) const;

    /// @brief Configuration introspection
    DetectorInfo GetInfo() const;

    const PatternDetectorConfig& GetConfig() const { return config_; }

private:
    /// One scored signal
    struct Contribution {
        std::string label;
        InjectionType type;
        SecuritySeverity severity;
        double confidence;
    };

    void MatchSignatures(const std::string& text, const std::string& lowered,
                         const std::string& prefix,
                         std::vector<Contribution>& out) const;
    void AnalyzeContext(const std::string& lowered,
                        size_t char_count,
                        std::vector<Contribution>& out) const;
    void AnalyzeRepetition(const std::string& lowered,
                           std::vector<Contribution>& out) const;
    void AnalyzeObfuscation(const std::string& text,
                            std::vector<Contribution>& out) const;

    absl::StatusOr<DetectionResult> Score(
        std::vector<Contribution> contributions,
        bool force_block) const;

    SecurityAction RecommendAction(double confidence, SecuritySeverity severity) const;

    PatternDetectorConfig config_;

    struct CompiledPattern {
        std::regex regex;
        const InjectionPatternSpec* spec;
    };
    std::vector<CompiledPattern> compiled_patterns_;

    struct NeutralizationRule {
        std::regex regex;
        std::string replacement;
    };
    std::vector<NeutralizationRule> neutralization_rules_;

    bool initialized_ = false;
};

/// @brief Create and initialize a pattern detector
absl::StatusOr<std::unique_ptr<PatternInjectionDetector>> CreatePatternInjectionDetector(
    PatternDetectorConfig config = {});

/// @brief Decode percent, \uXXXX, \xXX and HTML-entity escapes
std::string DecodeEscapes(std::string_view text);

/// @brief Join runs of five or more single letters separated by space, '-', '_' or '.'
std::string CollapseSeparatedLetters(std::string_view text);

inline constexpr std::string_view kNeutralizedQueryPlaceholder =
    "[QUERY_NEUTRALIZED_DUE_TO_SECURITY_VIOLATION]";

}  // namespace promptguard::security

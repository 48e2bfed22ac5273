#pragma once

/// @file sanitizer.h
/// @brief Prompt neutralization and safety policy wrapping

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "security/types.h"

namespace promptguard::security {

/// @brief Marker that replaces every neutralized span
inline constexpr std::string_view kNeutralizedMarker = "[[neutralized]]";

/// @brief Policy used when no caller template is available
extern const char* const kDefaultSafetyPolicy;

/// @brief Output of a sanitization pass
struct NeutralizedResult {
    std::string original_text;

    /// Present only when at least one rule changed the text
    std::optional<std::string> sanitized_text;

    SecurityAction action_taken = SecurityAction::kAllow;

    /// Safety preamble for the downstream model; never empty
    std::string system_wrapper;
};

/// @brief Abstract base class for sanitizers
class Sanitizer {
public:
    virtual ~Sanitizer() = default;

    /// @brief Neutralize dangerous spans and attach a policy wrapper
    /// @param original_text Prompt text
    /// @param detection Detector verdict for the same text
    /// @param policy_template Caller policy; blank or absent selects the default
    /// @param action_override Action to report instead of the detector's recommendation
    virtual absl::StatusOr<NeutralizedResult> Sanitize(
        std::string_view original_text,
        const DetectionResult& detection,
        const std::optional<std::string>& policy_template = std::nullopt,
        std::optional<SecurityAction> action_override = std::nullopt) = 0;
};

/// @brief Configuration for the sanitization service
struct SanitizerConfig {
    /// Hard ceiling in characters (code points); longer input is rejected
    size_t max_input_length = 10000;

    /// Policy used when the caller supplies none
    std::string default_policy = kDefaultSafetyPolicy;

    /// Replacement rule set (ECMAScript, case-insensitive); empty selects the
    /// built-in rules. Capture group 1, when present, is kept ahead of the marker.
    std::vector<std::string> patterns;
};

/// @brief Stateless, regex based sanitizer
///
/// Normalizes the text and bounds repeated runs (see text_normalizer.h),
/// replaces each rule match and each fenced code block with
/// kNeutralizedMarker, then collapses runs of markers into one.
class SanitizationService : public Sanitizer {
public:
    explicit SanitizationService(SanitizerConfig config = {});
    ~SanitizationService() override;

    // Disable copy
    SanitizationService(const SanitizationService&) = delete;
    SanitizationService& operator=(const SanitizationService&) = delete;

    /// @brief Compile the rule set
    absl::Status Initialize();

    absl::StatusOr<NeutralizedResult> Sanitize(
        std::string_view original_text,
        const DetectionResult& detection,
        const std::optional<std::string>& policy_template = std::nullopt,
        std::optional<SecurityAction> action_override = std::nullopt) override;

    /// @brief Neutralization without the length check or policy
    /// @return The neutralized text and whether a rule, a fence or a marker
    ///         collapse fired; folding and run compaction alone do not count
    ///
    /// The output is a fixed point: neutralizing it again changes nothing.
    absl::StatusOr<std::pair<std::string, bool>> Neutralize(std::string_view text) const;

    /// @brief Trimmed template when non-blank, otherwise the default policy
    std::string ResolvePolicy(const std::optional<std::string>& policy_template) const;

    const SanitizerConfig& GetConfig() const { return config_; }

private:
    struct Rule {
        std::regex regex;
        bool preserve_leading_group;
    };

    /// One pass of every rule; returns true if anything was replaced
    bool ApplyRules(std::string& text) const;

    SanitizerConfig config_;
    std::vector<Rule> rules_;
    bool initialized_ = false;
};

/// @brief Create and initialize a sanitization service
absl::StatusOr<std::unique_ptr<SanitizationService>> CreateSanitizationService(
    SanitizerConfig config = {});

/// @brief The built-in replacement rules
const std::vector<std::string>& DefaultSanitizationPatterns();

}  // namespace promptguard::security

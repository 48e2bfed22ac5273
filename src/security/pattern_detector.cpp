/// @file pattern_detector.cpp
/// @brief Pattern and heuristic injection detector implementation

#include "security/pattern_detector.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/error.h"
#include "common/logging.h"
#include "security/text_normalizer.h"

namespace promptguard::security {

namespace {

constexpr auto kRegexFlags =
    std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

constexpr double kLegitimateRoleFactor = 0.3;
constexpr double kLegitimateContextFactor = 0.2;
constexpr double kContextIndicatorConfidence = 0.7;
constexpr double kContextStuffingConfidence = 0.4;
constexpr size_t kContextStuffingChars = 1000;
constexpr double kObfuscatedConfidence = 0.85;
constexpr double kEncodedContentConfidence = 0.55;
constexpr size_t kEncodedContentMinEscapes = 3;
constexpr double kExtraSignalBoost = 0.03;
constexpr double kMaxExtraSignalBoost = 0.09;
constexpr double kBlockConfidence = 0.9;
constexpr double kWarnConfidence = 0.5;
constexpr size_t kMinSeparatedLetters = 5;
constexpr int kMaxNeutralizePasses = 4;
constexpr std::string_view kObfuscatedPrefix = "obfuscated_";

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Parse count hex digits at pos; -1 if any is not a hex digit
long ParseHex(std::string_view text, size_t pos, size_t count) {
    if (pos + count > text.size()) {
        return -1;
    }
    long value = 0;
    for (size_t i = 0; i < count; ++i) {
        int digit = HexValue(text[pos + i]);
        if (digit < 0) return -1;
        value = (value << 4) | digit;
    }
    return value;
}

void AppendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80U) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800U) {
        out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp < 0x10000U) {
        out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp <= 0x10FFFFU) {
        out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
}

/// Decode one escape at pos; returns consumed length, 0 if none
size_t DecodeEscapeAt(std::string_view text, size_t pos, std::string& out) {
    const char c = text[pos];
    if (c == '%') {
        long value = ParseHex(text, pos + 1, 2);
        if (value >= 0) {
            out.push_back(static_cast<char>(value));
            return 3;
        }
    } else if (c == '\\' && pos + 1 < text.size()) {
        if (text[pos + 1] == 'u') {
            long value = ParseHex(text, pos + 2, 4);
            if (value >= 0) {
                AppendUtf8(out, static_cast<uint32_t>(value));
                return 6;
            }
        } else if (text[pos + 1] == 'x') {
            long value = ParseHex(text, pos + 2, 2);
            if (value >= 0) {
                out.push_back(static_cast<char>(value));
                return 4;
            }
        }
    } else if (c == '&' && pos + 2 < text.size() && text[pos + 1] == '#') {
        const bool hex = text[pos + 2] == 'x' || text[pos + 2] == 'X';
        size_t start = pos + (hex ? 3 : 2);
        size_t end = start;
        uint32_t value = 0;
        while (end < text.size() && end - start < 7) {
            int digit = hex ? HexValue(text[end])
                            : (std::isdigit(static_cast<unsigned char>(text[end]))
                                   ? text[end] - '0' : -1);
            if (digit < 0) break;
            value = value * (hex ? 16U : 10U) + static_cast<uint32_t>(digit);
            ++end;
        }
        if (end > start && end < text.size() && text[end] == ';') {
            AppendUtf8(out, value);
            return end - pos + 1;
        }
    }
    return 0;
}

size_t CountEscapes(std::string_view text) {
    size_t count = 0;
    std::string scratch;
    for (size_t i = 0; i < text.size();) {
        size_t consumed = DecodeEscapeAt(text, i, scratch);
        if (consumed > 0) {
            ++count;
            i += consumed;
        } else {
            ++i;
        }
    }
    return count;
}

bool IsAsciiAlpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool IsLetterSeparator(char c) {
    return c == ' ' || c == '-' || c == '_' || c == '.';
}

bool IsIsolatedLetter(std::string_view text, size_t pos) {
    return IsAsciiAlpha(text[pos]) &&
           (pos == 0 || !IsAsciiAlpha(text[pos - 1])) &&
           (pos + 1 == text.size() || !IsAsciiAlpha(text[pos + 1]));
}

std::string CollapseWhitespace(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!result.empty() && result.back() != ' ') {
                result.push_back(' ');
            }
        } else {
            result.push_back(c);
        }
    }
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

bool ContainsAny(const std::string& lowered, const std::vector<std::string_view>& phrases) {
    return std::any_of(phrases.begin(), phrases.end(), [&](std::string_view phrase) {
        return absl::StrContains(lowered, absl::string_view(phrase.data(), phrase.size()));
    });
}

std::string StripWordPunctuation(std::string_view word) {
    constexpr std::string_view kPunctuation = ".,!?;:\"()[]{}";
    size_t start = 0;
    size_t end = word.size();
    while (start < end && kPunctuation.find(word[start]) != std::string_view::npos) ++start;
    while (end > start && kPunctuation.find(word[end - 1]) != std::string_view::npos) --end;
    return std::string(word.substr(start, end - start));
}

}  // namespace

// ============================================================================
// Free functions
// ============================================================================

std::string DecodeEscapes(std::string_view text) {
    std::string output;
    output.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        size_t consumed = DecodeEscapeAt(text, i, output);
        if (consumed > 0) {
            i += consumed;
        } else {
            output.push_back(text[i]);
            ++i;
        }
    }
    return output;
}

std::string CollapseSeparatedLetters(std::string_view text) {
    std::string output;
    output.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (!IsIsolatedLetter(text, i)) {
            output.push_back(text[i]);
            ++i;
            continue;
        }

        // Extend the run while single letters are separated by short gaps;
        // gaps wider than one character mark a word boundary
        std::string letters(1, text[i]);
        size_t j = i + 1;
        while (true) {
            size_t k = j;
            while (k < text.size() && IsLetterSeparator(text[k])) ++k;
            const size_t gap = k - j;
            if (gap == 0 || gap > 3 || k >= text.size() || !IsIsolatedLetter(text, k)) {
                break;
            }
            if (gap > 1) letters.push_back(' ');
            letters.push_back(text[k]);
            j = k + 1;
        }

        const auto letter_count = static_cast<size_t>(
            std::count_if(letters.begin(), letters.end(), IsAsciiAlpha));
        if (letter_count >= kMinSeparatedLetters) {
            output += letters;
        } else {
            output.append(text.substr(i, j - i));
        }
        i = j;
    }
    return output;
}

// ============================================================================
// PatternInjectionDetector
// ============================================================================

PatternInjectionDetector::PatternInjectionDetector(PatternDetectorConfig config)
    : config_(std::move(config)) {}

PatternInjectionDetector::~PatternInjectionDetector() = default;

absl::Status PatternInjectionDetector::Initialize() {
    if (initialized_) {
        return absl::OkStatus();
    }

    const auto& patterns = DefaultInjectionPatterns();
    compiled_patterns_.reserve(patterns.size());
    for (const auto& spec : patterns) {
        try {
            compiled_patterns_.push_back(
                {std::regex(std::string(spec.regex), kRegexFlags), &spec});
        } catch (const std::regex_error& e) {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("Failed to compile pattern '", absl::string_view(spec.label.data(), spec.label.size()),
                                          "': ", e.what()));
        }
    }

    const std::vector<std::pair<std::string, std::string>> rules = {
        {R"re(\b(?:system|assistant|user)[ \t]{0,8}:[ \t]{0,8})re", ""},
        {std::string(patterns[0].regex), "[INSTRUCTION_OVERRIDE_REMOVED]"},
        {std::string(patterns[1].regex), "[INSTRUCTION_OVERRIDE_REMOVED]"},
        {R"re((?:^|\n)[ \t]{0,8}(?:-{3,}|#{3,})[ \t]{0,8}(?=\r?\n|$))re", "\n"},
        {R"re(\b(?:you\s{1,8}are\s{1,8}now|act\s{1,8}as|pretend\s{1,8}to\s{1,8}be|)re"
         R"re(role-?\s?play\s{1,8}as)\b)re",
         "[ROLE_CHANGE_REMOVED]"},
        {R"re(\.env\b)re", "[CONFIG_ACCESS_REMOVED]"},
        {R"re(\b(?:override|bypass|skip|disable)\s{1,8}(?:security|safety|filters?|checks?))re",
         "[SECURITY_BYPASS_REMOVED]"},
    };
    for (const auto& [pattern, replacement] : rules) {
        try {
            neutralization_rules_.push_back({std::regex(pattern, kRegexFlags), replacement});
        } catch (const std::regex_error& e) {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("Failed to compile neutralization rule: ", e.what()));
        }
    }

    PROMPTGUARD_LOG_DEBUG("Pattern detector initialized with {} signatures (table v{})",
                          compiled_patterns_.size(), kPatternTableVersion);
    initialized_ = true;
    return absl::OkStatus();
}

absl::StatusOr<DetectionResult> PatternInjectionDetector::Detect(
    std::string_view text, const DetectionContext& context) {
    if (!initialized_) {
        return absl::FailedPreconditionError("Detector not initialized");
    }

    std::vector<Contribution> contributions;
    bool force_block = false;

    // Retrieval parameters are checked only when supplied
    if (context.top_k.has_value() || context.similarity_threshold.has_value()) {
        auto validation = ValidateQueryParameters(
            context.top_k.value_or(config_.min_top_k),
            context.similarity_threshold.value_or(config_.max_similarity_threshold));
        for (const auto& violation : validation.violations) {
            contributions.push_back({violation, InjectionType::kParameterManipulation,
                                     SecuritySeverity::kHigh, 0.9});
        }
        force_block = !validation.is_valid;
    }

    if (absl::StripAsciiWhitespace(absl::string_view(text.data(), text.size())).empty()) {
        if (contributions.empty()) {
            return DetectionResult::Neutral();
        }
        return Score(std::move(contributions), force_block);
    }

    auto window = ValidateContextWindow(text);
    if (!window.is_valid) {
        for (const auto& violation : window.violations) {
            contributions.push_back({violation, InjectionType::kOther,
                                     SecuritySeverity::kHigh, 1.0});
        }
        return Score(std::move(contributions), true);
    }

    // Runs are compacted before the scan prefix is taken, so padding cannot
    // push a payload past max_scan_chars
    const std::string compacted = CompactRuns(NormalizeUnicode(text), kMaxScannedRun);
    const std::string normalized(Utf8Prefix(compacted, config_.max_scan_chars));
    const std::string lowered = absl::AsciiStrToLower(normalized);

    MatchSignatures(normalized, lowered, "", contributions);
    AnalyzeContext(lowered, Utf8Length(text), contributions);
    AnalyzeRepetition(lowered, contributions);
    AnalyzeObfuscation(normalized, contributions);

    return Score(std::move(contributions), force_block);
}

ValidationResult PatternInjectionDetector::ValidateContextWindow(std::string_view text) const {
    ValidationResult result;
    const auto estimated_tokens = static_cast<int64_t>(Utf8Length(text) / 4);
    if (estimated_tokens > config_.max_context_tokens) {
        result.is_valid = false;
        result.violations.push_back("context_window_exceeded");
        result.recommended_action = SecurityAction::kBlock;
    }
    return result;
}

ValidationResult PatternInjectionDetector::ValidateQueryParameters(
    int64_t top_k, double similarity_threshold) const {
    ValidationResult result;
    if (top_k < config_.min_top_k || top_k > config_.max_top_k) {
        result.violations.push_back("invalid_top_k");
    }
    // NaN fails both comparisons, so test for the valid range explicitly
    if (!(similarity_threshold >= config_.min_similarity_threshold &&
          similarity_threshold <= config_.max_similarity_threshold)) {
        result.violations.push_back("invalid_similarity_threshold");
    }
    if (!result.violations.empty()) {
        result.is_valid = false;
        result.recommended_action = SecurityAction::kBlock;
    }
    return result;
}

absl::StatusOr<std::string> PatternInjectionDetector::Neutralize(std::string_view text) const {
    if (!initialized_) {
        return absl::FailedPreconditionError("Detector not initialized");
    }

    std::string current =
        CollapseWhitespace(CompactRuns(NormalizeUnicode(text), kMaxScannedRun));
    for (int pass = 0; pass < kMaxNeutralizePasses; ++pass) {
        std::string next = current;
        for (const auto& rule : neutralization_rules_) {
            next = std::regex_replace(next, rule.regex, rule.replacement);
        }
        next = CollapseWhitespace(next);
        if (next == current) {
            break;
        }
        current = std::move(next);
    }

    if (current.empty()) {
        return std::string(kNeutralizedQueryPlaceholder);
    }
    return current;
}

DetectorInfo PatternInjectionDetector::GetInfo() const {
    DetectorInfo info;
    info.detection_threshold = config_.detection_threshold;
    info.accuracy_target = config_.accuracy_target;
    info.max_context_tokens = config_.max_context_tokens;
    info.max_scan_chars = config_.max_scan_chars;
    info.min_top_k = config_.min_top_k;
    info.max_top_k = config_.max_top_k;
    info.min_similarity_threshold = config_.min_similarity_threshold;
    info.max_similarity_threshold = config_.max_similarity_threshold;
    info.pattern_table_version = kPatternTableVersion;
    info.pattern_count = DefaultInjectionPatterns().size();
    return info;
}

// ============================================================================
// Private Implementation
// ============================================================================

void PatternInjectionDetector::MatchSignatures(
    const std::string& text,
    const std::string& lowered,
    const std::string& prefix,
    std::vector<Contribution>& out) const {
    const bool legitimate_role = ContainsAny(lowered, LegitimateRoleNouns());

    for (const auto& pattern : compiled_patterns_) {
        if (!std::regex_search(text, pattern.regex)) {
            continue;
        }

        const auto& spec = *pattern.spec;
        Contribution contribution{absl::StrCat(prefix, absl::string_view(spec.label.data(), spec.label.size())), spec.type,
                                  spec.severity, spec.weight};
        if (spec.damping == PatternDamping::kLegitimateRole && legitimate_role) {
            contribution.confidence *= kLegitimateRoleFactor;
            contribution.severity = SecuritySeverity::kLow;
        }
        out.push_back(std::move(contribution));
    }
}

void PatternInjectionDetector::AnalyzeContext(
    const std::string& lowered,
    size_t char_count,
    std::vector<Contribution>& out) const {
    if (ContainsAny(lowered, ContextBoundaryIndicators())) {
        Contribution contribution{"context_indicator", InjectionType::kContextManipulation,
                                  SecuritySeverity::kMedium, kContextIndicatorConfidence};
        if (ContainsAny(lowered, LegitimateContextMarkers())) {
            contribution.confidence *= kLegitimateContextFactor;
            contribution.severity = SecuritySeverity::kLow;
        }
        out.push_back(std::move(contribution));
    }

    // Very long prompts may be stuffing the context window
    if (char_count > kContextStuffingChars) {
        out.push_back({"context_stuffing", InjectionType::kContextManipulation,
                       SecuritySeverity::kLow, kContextStuffingConfidence});
    }
}

void PatternInjectionDetector::AnalyzeRepetition(
    const std::string& lowered,
    std::vector<Contribution>& out) const {
    std::vector<absl::string_view> words =
        absl::StrSplit(lowered, absl::ByAnyChar(" \t\r\n"), absl::SkipEmpty());
    if (words.size() <= 10) {
        return;
    }

    static const std::unordered_set<std::string_view> kTechnical(
        TechnicalTerms().begin(), TechnicalTerms().end());

    std::unordered_map<std::string, size_t> frequency;
    size_t technical_count = 0;
    for (auto word : words) {
        std::string stripped = StripWordPunctuation(std::string_view(word.data(), word.size()));
        if (kTechnical.count(stripped) > 0) {
            ++technical_count;
        }
        ++frequency[std::move(stripped)];
    }

    size_t max_freq = 0;
    size_t max_non_technical_freq = 0;
    bool has_non_technical = false;
    for (const auto& [word, count] : frequency) {
        max_freq = std::max(max_freq, count);
        if (kTechnical.count(word) == 0) {
            has_non_technical = true;
            max_non_technical_freq = std::max(max_non_technical_freq, count);
        }
    }
    if (!has_non_technical) {
        return;
    }

    const double word_count = static_cast<double>(words.size());
    const bool technical = static_cast<double>(technical_count) / word_count > 0.2;
    const double threshold = technical ? 0.4 : 0.3;
    const size_t relevant = technical ? max_non_technical_freq : max_freq;

    if (static_cast<double>(relevant) > word_count * threshold) {
        out.push_back({"excessive_repetition", InjectionType::kOther,
                       technical ? SecuritySeverity::kLow : SecuritySeverity::kMedium,
                       technical ? 0.3 : 0.5});
    }
}

void PatternInjectionDetector::AnalyzeObfuscation(
    const std::string& text,
    std::vector<Contribution>& out) const {
    const size_t escapes = CountEscapes(text);
    const std::string decoded =
        CompactRuns(CollapseSeparatedLetters(DecodeEscapes(text)), kMaxScannedRun);
    if (decoded == text) {
        return;
    }

    const std::string decoded_lower = absl::AsciiStrToLower(decoded);

    std::vector<Contribution> hidden;
    MatchSignatures(decoded, decoded_lower, std::string(kObfuscatedPrefix), hidden);

    // Signatures already visible in the plain text are not obfuscated
    bool found = false;
    for (auto& contribution : hidden) {
        const std::string plain_label = contribution.label.substr(kObfuscatedPrefix.size());
        const bool already_seen = std::any_of(out.begin(), out.end(),
            [&](const Contribution& c) { return c.label == plain_label; });
        if (already_seen || contribution.confidence < kWarnConfidence) {
            continue;
        }
        contribution.confidence = std::min(contribution.confidence, kObfuscatedConfidence);
        out.push_back(std::move(contribution));
        found = true;
    }

    if (!found) {
        std::string compact;
        compact.reserve(decoded_lower.size());
        for (char c : decoded_lower) {
            if (c >= 'a' && c <= 'z') compact.push_back(c);
        }
        if (ContainsAny(compact, ObfuscatedKeywords())) {
            out.push_back({"obfuscated_instruction", InjectionType::kInstructionOverride,
                           SecuritySeverity::kHigh, kObfuscatedConfidence});
        }
    }

    if (escapes >= kEncodedContentMinEscapes) {
        out.push_back({"encoded_content", InjectionType::kOther,
                       SecuritySeverity::kMedium, kEncodedContentConfidence});
    }
}

absl::StatusOr<DetectionResult> PatternInjectionDetector::Score(
    std::vector<Contribution> contributions,
    bool force_block) const {
    if (contributions.empty()) {
        return DetectionResult::Create(false, 0.0, {}, InjectionType::kNone,
                                       SecuritySeverity::kLow, SecurityAction::kAllow);
    }

    // Highest confidence wins; earlier (higher priority) signatures break ties
    const auto primary = std::max_element(
        contributions.begin(), contributions.end(),
        [](const Contribution& a, const Contribution& b) {
            return a.confidence < b.confidence;
        });

    SecuritySeverity severity = primary->severity;
    std::vector<std::string> labels;
    size_t extra_signals = 0;
    for (const auto& contribution : contributions) {
        if (std::find(labels.begin(), labels.end(), contribution.label) != labels.end()) {
            continue;
        }
        labels.push_back(contribution.label);
        if (contribution.confidence >= kWarnConfidence) {
            severity = HigherSeverity(severity, contribution.severity);
            if (&contribution != &*primary) {
                ++extra_signals;
            }
        }
    }

    const double boost = std::min(kMaxExtraSignalBoost, kExtraSignalBoost * extra_signals);
    const double confidence = std::clamp(primary->confidence + boost, 0.0, 1.0);

    const SecurityAction action =
        force_block ? SecurityAction::kBlock : RecommendAction(confidence, severity);

    return DetectionResult::Create(confidence >= config_.detection_threshold, confidence,
                                   std::move(labels), primary->type, severity, action);
}

SecurityAction PatternInjectionDetector::RecommendAction(
    double confidence, SecuritySeverity severity) const {
    if (confidence >= kBlockConfidence) {
        return SecurityAction::kBlock;
    }
    if (confidence >= kWarnConfidence || Rank(severity) >= Rank(SecuritySeverity::kMedium)) {
        return SecurityAction::kWarn;
    }
    return SecurityAction::kAllow;
}

// ============================================================================
// Factory
// ============================================================================

absl::StatusOr<std::unique_ptr<PatternInjectionDetector>> CreatePatternInjectionDetector(
    PatternDetectorConfig config) {
    auto detector = std::make_unique<PatternInjectionDetector>(std::move(config));
    PROMPTGUARD_RETURN_IF_ERROR(detector->Initialize());
    return detector;
}

}  // namespace promptguard::security

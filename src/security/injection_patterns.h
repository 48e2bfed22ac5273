#pragma once

/// @file injection_patterns.h
/// @brief Versioned signature table for pattern-based injection detection
///
/// The table is data: adding a signature never requires touching the
/// detector's control flow. Bump kPatternTableVersion on every change so
/// audit consumers can correlate verdicts with the rules that produced them.

#include <string_view>
#include <vector>

#include "security/types.h"

namespace promptguard::security {

inline constexpr int kPatternTableVersion = 4;

/// @brief How a signature's weight is adjusted by surrounding text
enum class PatternDamping {
    kNone,
    kLegitimateRole,  ///< "act as a financial advisor" style requests
};

/// @brief One detection signature
struct InjectionPatternSpec {
    std::string_view label;    ///< Stable identifier reported in detected_patterns
    std::string_view regex;    ///< ECMAScript syntax, matched case-insensitively
    InjectionType type;
    SecuritySeverity severity;
    double weight;             ///< Confidence contributed by a match
    PatternDamping damping = PatternDamping::kNone;
};

/// @brief The built-in signature table, in priority order
const std::vector<InjectionPatternSpec>& DefaultInjectionPatterns();

/// @brief Nouns that mark a role request as a legitimate persona
const std::vector<std::string_view>& LegitimateRoleNouns();

/// @brief Phrases suggesting an attempt to rewrite conversation state
const std::vector<std::string_view>& ContextBoundaryIndicators();

/// @brief Phrases typical of ordinary questions; damp context indicators
const std::vector<std::string_view>& LegitimateContextMarkers();

/// @brief Domain vocabulary that is legitimately repeated
const std::vector<std::string_view>& TechnicalTerms();

/// @brief Letters-only fragments checked against de-obfuscated text
const std::vector<std::string_view>& ObfuscatedKeywords();

}  // namespace promptguard::security

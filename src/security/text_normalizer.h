#pragma once

/// @file text_normalizer.h
/// @brief UTF-8 helpers used before pattern matching
///
/// Folding maps compatibility characters (fullwidth Latin, exotic spaces,
/// lookalike angle brackets) onto ASCII and strips invisible code points,
/// so that "ｉｇｎｏｒｅ" or "ig​nore" match the same rules as "ignore".
/// Invalid UTF-8 bytes are passed through unchanged.

#include <cstddef>
#include <string>
#include <string_view>

namespace promptguard::security {

/// @brief Fold text to the canonical form the detector and sanitizer match on
std::string NormalizeUnicode(std::string_view text);

/// @brief Number of code points in text
size_t Utf8Length(std::string_view text);

/// @brief The first max_codepoints code points of text (never splits a sequence)
std::string_view Utf8Prefix(std::string_view text, size_t max_codepoints);

/// Longest whitespace or repeated-byte run kept by CompactRuns before matching;
/// the signature tables bound their whitespace quantifiers to the same length
constexpr size_t kMaxScannedRun = 8;

/// @brief Bound every run of repeated input before regex matching
///
/// A whitespace run longer than max_run becomes a single '\n' when it
/// contains a line break and a single ' ' otherwise, so line-start rules
/// still see their line. A run of one repeated non-whitespace byte is cut
/// to max_run bytes. Shorter runs are kept as they are.
std::string CompactRuns(std::string_view text, size_t max_run);

}  // namespace promptguard::security

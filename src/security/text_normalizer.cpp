/// @file text_normalizer.cpp
/// @brief UTF-8 decoding and compatibility folding

#include "security/text_normalizer.h"

#include <algorithm>
#include <cstdint>

#include <absl/strings/ascii.h>

namespace promptguard::security {

namespace {

/// Decode one code point starting at index; advances index past it.
/// Malformed sequences decode as the single lead byte.
uint32_t DecodeCodepoint(std::string_view input, size_t& index) {
    const auto lead = static_cast<unsigned char>(input[index]);
    if (lead < 0x80U) {
        ++index;
        return lead;
    }

    size_t extra = 0;
    uint32_t value = 0;
    if ((lead & 0xE0U) == 0xC0U) {
        extra = 1;
        value = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
        extra = 2;
        value = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
        extra = 3;
        value = lead & 0x07U;
    } else {
        ++index;
        return lead;
    }

    if (index + extra >= input.size()) {
        ++index;
        return lead;
    }

    for (size_t i = 1; i <= extra; ++i) {
        const auto cont = static_cast<unsigned char>(input[index + i]);
        if ((cont & 0xC0U) != 0x80U) {
            ++index;
            return lead;
        }
        value = (value << 6U) | static_cast<uint32_t>(cont & 0x3FU);
    }

    index += extra + 1;
    return value;
}

bool IsInvisible(uint32_t cp) {
    switch (cp) {
        case 0x00ADU:  // soft hyphen
        case 0x180EU:
        case 0x200BU:
        case 0x200CU:
        case 0x200DU:
        case 0x2060U:
        case 0xFEFFU:
            return true;
        default:
            return false;
    }
}

bool IsSpaceLike(uint32_t cp) {
    return cp == 0x00A0U || cp == 0x1680U || (cp >= 0x2000U && cp <= 0x200AU) ||
           cp == 0x202FU || cp == 0x205FU || cp == 0x3000U;
}

/// ASCII replacement for a compatibility code point, or 0 when none applies
char FoldToAscii(uint32_t cp) {
    // Fullwidth ASCII variants (！ through ～)
    if (cp >= 0xFF01U && cp <= 0xFF5EU) {
        return static_cast<char>(cp - 0xFEE0U);
    }
    switch (cp) {
        case 0x2018U:
        case 0x2019U:
        case 0x201BU:
            return '\'';
        case 0x201CU:
        case 0x201DU:
        case 0x201FU:
            return '"';
        case 0x2010U:
        case 0x2011U:
        case 0x2012U:
        case 0x2013U:
        case 0x2014U:
        case 0x2212U:
            return '-';
        case 0x2329U:
        case 0x3008U:
        case 0x2039U:
        case 0x27E8U:
        case 0xFE64U:
            return '<';
        case 0x232AU:
        case 0x3009U:
        case 0x203AU:
        case 0x27E9U:
        case 0xFE65U:
            return '>';
        default:
            return 0;
    }
}

}  // namespace

std::string NormalizeUnicode(std::string_view text) {
    std::string output;
    output.reserve(text.size());

    size_t index = 0;
    while (index < text.size()) {
        const size_t start = index;
        const uint32_t cp = DecodeCodepoint(text, index);

        if (cp < 0x80U) {
            output.push_back(static_cast<char>(cp));
            continue;
        }
        if (index - start == 1) {
            // Malformed byte
            output.push_back(text[start]);
            continue;
        }
        if (IsInvisible(cp)) {
            continue;
        }
        if (IsSpaceLike(cp)) {
            output.push_back(' ');
            continue;
        }
        if (char folded = FoldToAscii(cp); folded != 0) {
            output.push_back(folded);
            continue;
        }
        output.append(text.substr(start, index - start));
    }

    return output;
}

size_t Utf8Length(std::string_view text) {
    size_t count = 0;
    size_t index = 0;
    while (index < text.size()) {
        DecodeCodepoint(text, index);
        ++count;
    }
    return count;
}

std::string_view Utf8Prefix(std::string_view text, size_t max_codepoints) {
    size_t index = 0;
    size_t count = 0;
    while (index < text.size() && count < max_codepoints) {
        DecodeCodepoint(text, index);
        ++count;
    }
    return text.substr(0, index);
}

std::string CompactRuns(std::string_view text, size_t max_run) {
    std::string output;
    output.reserve(text.size());

    size_t index = 0;
    while (index < text.size()) {
        const char c = text[index];
        size_t end = index + 1;

        if (absl::ascii_isspace(static_cast<unsigned char>(c))) {
            bool has_newline = c == '\n';
            while (end < text.size() &&
                   absl::ascii_isspace(static_cast<unsigned char>(text[end]))) {
                has_newline = has_newline || text[end] == '\n';
                ++end;
            }
            if (end - index > max_run) {
                output.push_back(has_newline ? '\n' : ' ');
            } else {
                output.append(text.substr(index, end - index));
            }
        } else {
            while (end < text.size() && text[end] == c) {
                ++end;
            }
            output.append(std::min(end - index, max_run), c);
        }
        index = end;
    }

    return output;
}

}  // namespace promptguard::security

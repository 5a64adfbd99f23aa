#pragma once

#include "types.hpp"
#include <string>
#include <string_view>

namespace jade::unicode {

// Unicode scalar value (surrogates only appear transiently while decoding)
using CodePoint = char32_t;

constexpr CodePoint REPLACEMENT_CHARACTER = 0xFFFD;
constexpr CodePoint INVALID_CODE_POINT = 0xFFFFFFFF;

constexpr CodePoint ZERO_WIDTH_SPACE = 0x200B;
constexpr CodePoint ZERO_WIDTH_NON_JOINER = 0x200C;
constexpr CodePoint ZERO_WIDTH_JOINER = 0x200D;
constexpr CodePoint BYTE_ORDER_MARK = 0xFEFF;

[[nodiscard]] constexpr bool is_surrogate(CodePoint cp) {
    return cp >= 0xD800 && cp <= 0xDFFF;
}

[[nodiscard]] constexpr bool is_high_surrogate(CodePoint cp) {
    return cp >= 0xD800 && cp <= 0xDBFF;
}

[[nodiscard]] constexpr bool is_low_surrogate(CodePoint cp) {
    return cp >= 0xDC00 && cp <= 0xDFFF;
}

[[nodiscard]] constexpr bool is_valid(CodePoint cp) {
    return cp <= 0x10FFFF && !is_surrogate(cp);
}

[[nodiscard]] constexpr bool is_private_use(CodePoint cp) {
    return (cp >= 0xE000 && cp <= 0xF8FF) ||
           (cp >= 0xF0000 && cp <= 0xFFFFD) ||
           (cp >= 0x100000 && cp <= 0x10FFFD);
}

// U+FDD0..U+FDEF and the last two code points of every plane
[[nodiscard]] constexpr bool is_noncharacter(CodePoint cp) {
    return (cp >= 0xFDD0 && cp <= 0xFDEF) ||
           (cp <= 0x10FFFF && (cp & 0xFFFE) == 0xFFFE);
}

// ============================================================================
// UTF-8 encoding/decoding
// ============================================================================

enum class Utf8Status : u8 {
    Ok,
    EncodedSurrogate,  // Well-formed 3-byte pattern carrying U+D800..U+DFFF
    Malformed,
};

struct Utf8DecodeResult {
    CodePoint code_point;
    usize bytes_consumed;
    Utf8Status status;
};

// Decodes one sequence. Never consumes zero bytes for non-empty input.
[[nodiscard]] Utf8DecodeResult utf8_decode(const char* data, usize length);

// Encodes any value below 0x110000, surrogates included (WTF-8).
// Returns the number of bytes written, 0 for out-of-range values.
[[nodiscard]] usize utf8_encode(CodePoint cp, char* buffer);

void utf8_append(std::string& out, CodePoint cp);
void utf8_append(std::string& out, std::u32string_view cps);

[[nodiscard]] usize utf8_encoded_length(CodePoint cp);

// Number of sequences utf8_decode would produce for the text
[[nodiscard]] usize code_point_count(std::string_view text);

// ============================================================================
// Lossy whole-string decoding
// ============================================================================

struct DecodedText {
    std::u32string code_points;
    usize surrogates_removed{0};    // unpaired surrogates dropped
    usize sequences_replaced{0};    // malformed sequences turned into U+FFFD
};

// Decodes UTF-8 (tolerating WTF-8 and CESU-8 surrogate pairs). A surrogate
// pair spelled as two 3-byte sequences is joined into one scalar; a lone
// surrogate is dropped; every other malformed sequence becomes one U+FFFD.
[[nodiscard]] DecodedText decode_lossy(std::string_view text);

// Converts UTF-16 to UTF-8. Unpaired surrogates are kept as 3-byte WTF-8
// sequences so that decode_lossy can account for each of them.
[[nodiscard]] std::string utf16_to_utf8(std::u16string_view text);

} // namespace jade::unicode

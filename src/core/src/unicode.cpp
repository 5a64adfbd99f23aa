#include "jade/core/unicode.hpp"

namespace jade::unicode {

// ============================================================================
// UTF-8 implementation
// ============================================================================

Utf8DecodeResult utf8_decode(const char* data, usize length) {
    if (length == 0 || data == nullptr) {
        return {INVALID_CODE_POINT, 0, Utf8Status::Malformed};
    }

    auto byte = static_cast<u8>(data[0]);

    if ((byte & 0x80) == 0) {
        return {static_cast<CodePoint>(byte), 1, Utf8Status::Ok};
    }

    usize seq_len;
    CodePoint cp;

    if ((byte & 0xE0) == 0xC0) {
        seq_len = 2;
        cp = byte & 0x1F;
    } else if ((byte & 0xF0) == 0xE0) {
        seq_len = 3;
        cp = byte & 0x0F;
    } else if ((byte & 0xF8) == 0xF0) {
        seq_len = 4;
        cp = byte & 0x07;
    } else {
        // Stray continuation byte or invalid lead
        return {REPLACEMENT_CHARACTER, 1, Utf8Status::Malformed};
    }

    for (usize i = 1; i < seq_len; ++i) {
        if (i >= length) {
            return {REPLACEMENT_CHARACTER, i, Utf8Status::Malformed};
        }
        byte = static_cast<u8>(data[i]);
        if ((byte & 0xC0) != 0x80) {
            return {REPLACEMENT_CHARACTER, i, Utf8Status::Malformed};
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    // Overlong forms
    if ((seq_len == 2 && cp < 0x80) ||
        (seq_len == 3 && cp < 0x800) ||
        (seq_len == 4 && cp < 0x10000)) {
        return {REPLACEMENT_CHARACTER, seq_len, Utf8Status::Malformed};
    }

    if (cp > 0x10FFFF) {
        return {REPLACEMENT_CHARACTER, seq_len, Utf8Status::Malformed};
    }

    if (is_surrogate(cp)) {
        return {cp, seq_len, Utf8Status::EncodedSurrogate};
    }

    return {cp, seq_len, Utf8Status::Ok};
}

usize utf8_encode(CodePoint cp, char* buffer) {
    if (cp < 0x80) {
        buffer[0] = static_cast<char>(cp);
        return 1;
    }
    if (cp < 0x800) {
        buffer[0] = static_cast<char>(0xC0 | (cp >> 6));
        buffer[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000) {
        buffer[0] = static_cast<char>(0xE0 | (cp >> 12));
        buffer[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buffer[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    }
    if (cp <= 0x10FFFF) {
        buffer[0] = static_cast<char>(0xF0 | (cp >> 18));
        buffer[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        buffer[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buffer[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }
    return 0;
}

void utf8_append(std::string& out, CodePoint cp) {
    char buffer[4];
    usize len = utf8_encode(cp, buffer);
    out.append(buffer, len);
}

void utf8_append(std::string& out, std::u32string_view cps) {
    out.reserve(out.size() + cps.size());
    for (auto cp : cps) {
        utf8_append(out, cp);
    }
}

usize utf8_encoded_length(CodePoint cp) {
    if (cp < 0x80) return 1;
    if (cp < 0x800) return 2;
    if (cp < 0x10000) return 3;
    if (cp <= 0x10FFFF) return 4;
    return 0;
}

usize code_point_count(std::string_view text) {
    usize count = 0;
    usize i = 0;
    while (i < text.size()) {
        auto decoded = utf8_decode(text.data() + i, text.size() - i);
        i += decoded.bytes_consumed;
        ++count;
    }
    return count;
}

// ============================================================================
// Lossy decoding
// ============================================================================

DecodedText decode_lossy(std::string_view text) {
    DecodedText result;
    result.code_points.reserve(text.size());

    usize i = 0;
    while (i < text.size()) {
        auto decoded = utf8_decode(text.data() + i, text.size() - i);
        i += decoded.bytes_consumed;

        switch (decoded.status) {
            case Utf8Status::Ok:
                result.code_points.push_back(decoded.code_point);
                break;

            case Utf8Status::Malformed:
                result.code_points.push_back(REPLACEMENT_CHARACTER);
                ++result.sequences_replaced;
                break;

            case Utf8Status::EncodedSurrogate: {
                if (is_high_surrogate(decoded.code_point) && i < text.size()) {
                    auto next = utf8_decode(text.data() + i, text.size() - i);
                    if (next.status == Utf8Status::EncodedSurrogate &&
                        is_low_surrogate(next.code_point)) {
                        CodePoint joined = 0x10000 +
                            ((decoded.code_point - 0xD800) << 10) +
                            (next.code_point - 0xDC00);
                        result.code_points.push_back(joined);
                        i += next.bytes_consumed;
                        break;
                    }
                }
                ++result.surrogates_removed;
                break;
            }
        }
    }

    return result;
}

std::string utf16_to_utf8(std::u16string_view text) {
    std::string out;
    out.reserve(text.size() * 3);

    for (usize i = 0; i < text.size(); ++i) {
        CodePoint unit = text[i];
        if (is_high_surrogate(unit) && i + 1 < text.size() &&
            is_low_surrogate(static_cast<CodePoint>(text[i + 1]))) {
            CodePoint low = text[i + 1];
            utf8_append(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
            ++i;
            continue;
        }
        // Lone surrogates are written as-is (WTF-8)
        utf8_append(out, unit);
    }

    return out;
}

} // namespace jade::unicode

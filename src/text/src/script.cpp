/**
 * Codepoint classification by Unicode block ranges
 */

#include "jade/text/script.hpp"
#include <algorithm>
#include <unicode/uchar.h>

namespace jade::text {

namespace {

using S = Script;

// Keep sorted by `first`. Gaps fall through to Other: Greek, Cyrillic, the
// Indic blocks, combining diacriticals, private use, unassigned planes.
constexpr ScriptRange SCRIPT_RANGES[] = {
    {0x0000, 0x001F, S::Control},
    {0x0020, 0x002F, S::Punctuation},
    {0x0030, 0x0039, S::Digit},
    {0x003A, 0x0040, S::Punctuation},
    {0x0041, 0x005A, S::Latin},
    {0x005B, 0x0060, S::Punctuation},
    {0x0061, 0x007A, S::Latin},
    {0x007B, 0x007E, S::Punctuation},
    {0x007F, 0x009F, S::Control},
    {0x00A0, 0x00A9, S::Punctuation},
    {0x00AA, 0x00AA, S::Latin},
    {0x00AB, 0x00B9, S::Punctuation},
    {0x00BA, 0x00BA, S::Latin},
    {0x00BB, 0x00BF, S::Punctuation},
    {0x00C0, 0x00D6, S::Latin},
    {0x00D7, 0x00D7, S::Punctuation},
    {0x00D8, 0x00F6, S::Latin},
    {0x00F7, 0x00F7, S::Punctuation},
    {0x00F8, 0x02FF, S::Latin},         // Latin Extended-A/B, IPA, modifier letters

    // Thai letters, marks, digits and the baht sign U+0E3F
    {0x0E01, 0x0E3A, S::Thai},
    {0x0E3F, 0x0E5B, S::Thai},

    {0x1100, 0x11FF, S::Hangul},        // Hangul Jamo
    {0x1E00, 0x1EFF, S::Latin},         // Latin Extended Additional

    // General Punctuation, with format characters split out
    {0x2000, 0x200A, S::Punctuation},
    {0x200B, 0x200F, S::Control},
    {0x2010, 0x2027, S::Punctuation},
    {0x2028, 0x202E, S::Control},
    {0x202F, 0x205F, S::Punctuation},
    {0x2060, 0x206F, S::Control},

    {0x2070, 0x209F, S::Punctuation},   // super/subscripts
    {0x20A0, 0x20CF, S::Punctuation},   // currency
    {0x2100, 0x22FF, S::Punctuation},   // letterlike, number forms, arrows, math
    {0x2300, 0x2319, S::Punctuation},
    {0x231A, 0x231B, S::Emoji},
    {0x231C, 0x23E8, S::Punctuation},
    {0x23E9, 0x23F3, S::Emoji},
    {0x23F4, 0x23F7, S::Punctuation},
    {0x23F8, 0x23FA, S::Emoji},
    {0x23FB, 0x25FF, S::Punctuation},   // enclosed alphanumerics, box drawing, shapes
    {0x2600, 0x27BF, S::Emoji},         // Misc Symbols, Dingbats
    {0x27C0, 0x2B4F, S::Punctuation},
    {0x2B50, 0x2B50, S::Emoji},
    {0x2B51, 0x2B54, S::Punctuation},
    {0x2B55, 0x2B55, S::Emoji},
    {0x2B56, 0x2BFF, S::Punctuation},
    {0x2C60, 0x2C7F, S::Latin},         // Latin Extended-C
    {0x2E00, 0x2E7F, S::Punctuation},

    // CJK
    {0x2E80, 0x2FDF, S::Han},           // radicals, Kangxi
    {0x2FF0, 0x2FFF, S::Han},
    {0x3000, 0x3004, S::Punctuation},
    {0x3005, 0x3007, S::Han},
    {0x3008, 0x3020, S::Punctuation},
    {0x3021, 0x302F, S::Han},
    {0x3030, 0x303F, S::Punctuation},
    {0x3041, 0x3096, S::Kana},
    {0x3099, 0x30FF, S::Kana},
    {0x3131, 0x318E, S::Hangul},        // compatibility jamo
    {0x3190, 0x319F, S::Han},           // kanbun
    {0x31C0, 0x31E5, S::Han},           // strokes
    {0x31F0, 0x31FF, S::Kana},
    {0x3200, 0x33FF, S::Punctuation},   // enclosed CJK, compatibility
    {0x3400, 0x4DBF, S::Han},           // Extension A
    {0x4DC0, 0x4DFF, S::Punctuation},
    {0x4E00, 0x9FFF, S::Han},
    {0xA720, 0xA7FF, S::Latin},         // Latin Extended-D
    {0xA960, 0xA97F, S::Hangul},
    {0xAB30, 0xAB6F, S::Latin},         // Latin Extended-E
    {0xAC00, 0xD7A3, S::Hangul},
    {0xD7B0, 0xD7FF, S::Hangul},
    {0xD800, 0xDFFF, S::Control},       // surrogates
    {0xF900, 0xFAFF, S::Han},
    {0xFB00, 0xFB06, S::Latin},
    {0xFE00, 0xFE0F, S::Emoji},         // variation selectors
    {0xFE10, 0xFE19, S::Punctuation},
    {0xFE30, 0xFE6F, S::Punctuation},
    {0xFEFF, 0xFEFF, S::Control},

    // Halfwidth and fullwidth forms
    {0xFF01, 0xFF0F, S::Punctuation},
    {0xFF10, 0xFF19, S::Digit},
    {0xFF1A, 0xFF20, S::Punctuation},
    {0xFF21, 0xFF3A, S::Latin},
    {0xFF3B, 0xFF40, S::Punctuation},
    {0xFF41, 0xFF5A, S::Latin},
    {0xFF5B, 0xFF65, S::Punctuation},
    {0xFF66, 0xFF9F, S::Kana},
    {0xFFA0, 0xFFDC, S::Hangul},
    {0xFFE0, 0xFFEE, S::Punctuation},
    {0xFFF9, 0xFFFB, S::Control},
    {0xFFFC, 0xFFFD, S::Punctuation},

    {0x1B000, 0x1B16F, S::Kana},        // Kana Supplement, Extended-A, small kana

    // Emoji planes. Skin tones U+1F3FB..1F3FF sit inside 1F300..1F64F.
    {0x1F000, 0x1F0FF, S::Emoji},       // mahjong, playing cards
    {0x1F100, 0x1F1E5, S::Punctuation},
    {0x1F1E6, 0x1F1FF, S::Emoji},       // regional indicators
    {0x1F200, 0x1F64F, S::Emoji},
    {0x1F650, 0x1F67F, S::Punctuation},
    {0x1F680, 0x1F6FF, S::Emoji},
    {0x1F700, 0x1F77F, S::Punctuation},
    {0x1F780, 0x1F7FF, S::Emoji},
    {0x1F800, 0x1F8FF, S::Punctuation},
    {0x1F900, 0x1F9FF, S::Emoji},
    {0x1FA00, 0x1FA6F, S::Punctuation},
    {0x1FA70, 0x1FAFF, S::Emoji},

    // CJK Extensions B through I, compatibility supplement
    {0x20000, 0x2A6DF, S::Han},
    {0x2A700, 0x2EE5F, S::Han},
    {0x2F800, 0x2FA1F, S::Han},
    {0x30000, 0x323AF, S::Han},

    {0xE0001, 0xE0001, S::Control},
    {0xE0020, 0xE007F, S::Emoji},       // tag sequences for subdivision flags
};

constexpr bool ranges_are_sorted() {
    for (usize i = 0; i < std::size(SCRIPT_RANGES); ++i) {
        if (SCRIPT_RANGES[i].first > SCRIPT_RANGES[i].last) return false;
        if (i > 0 && SCRIPT_RANGES[i - 1].last >= SCRIPT_RANGES[i].first) return false;
    }
    return true;
}

static_assert(ranges_are_sorted(), "SCRIPT_RANGES must be sorted and non-overlapping");

} // anonymous namespace

std::span<const ScriptRange> script_ranges() noexcept {
    return SCRIPT_RANGES;
}

Script classify(unicode::CodePoint cp) noexcept {
    auto begin = std::begin(SCRIPT_RANGES);
    auto end = std::end(SCRIPT_RANGES);

    // First range starting after cp; the candidate is the one before it
    auto it = std::upper_bound(begin, end, cp,
        [](unicode::CodePoint value, const ScriptRange& range) {
            return value < range.first;
        });

    if (it == begin) return Script::Other;
    --it;
    return cp <= it->last ? it->script : Script::Other;
}

std::string_view script_name(Script script) noexcept {
    switch (script) {
        case Script::Thai: return "Thai";
        case Script::Latin: return "Latin";
        case Script::Han: return "Han";
        case Script::Kana: return "Kana";
        case Script::Hangul: return "Hangul";
        case Script::Emoji: return "Emoji";
        case Script::Digit: return "Digit";
        case Script::Punctuation: return "Punctuation";
        case Script::Control: return "Control";
        case Script::Other: return "Other";
    }
    return "Other";
}

bool is_combining_mark(unicode::CodePoint cp) noexcept {
    if (cp > 0x10FFFF) return false;
    auto mask = U_GET_GC_MASK(static_cast<UChar32>(cp));
    return (mask & U_GC_M_MASK) != 0;
}

bool is_whitespace(unicode::CodePoint cp) noexcept {
    if (cp > 0x10FFFF) return false;
    return u_isUWhiteSpace(static_cast<UChar32>(cp));
}

} // namespace jade::text

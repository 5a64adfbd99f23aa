#pragma once

#include "jade/core/types.hpp"
#include "jade/core/unicode.hpp"
#include <array>
#include <span>
#include <string_view>

namespace jade::text {

// ============================================================================
// Script tags
// ============================================================================

enum class Script : u8 {
    Thai,
    Latin,
    Han,
    Kana,
    Hangul,
    Emoji,
    Digit,
    Punctuation,
    Control,
    Other,
};

constexpr usize SCRIPT_COUNT = 10;

constexpr std::array<Script, SCRIPT_COUNT> ALL_SCRIPTS = {
    Script::Thai, Script::Latin, Script::Han, Script::Kana, Script::Hangul,
    Script::Emoji, Script::Digit, Script::Punctuation, Script::Control, Script::Other,
};

[[nodiscard]] constexpr usize script_index(Script script) {
    return static_cast<usize>(script);
}

[[nodiscard]] std::string_view script_name(Script script) noexcept;

// Digits and punctuation render legibly in any font and never pick one
[[nodiscard]] constexpr bool is_script_neutral(Script script) {
    return script == Script::Digit || script == Script::Punctuation ||
           script == Script::Control;
}

// ============================================================================
// Codepoint Classifier
// ============================================================================

struct ScriptRange {
    unicode::CodePoint first;
    unicode::CodePoint last;   // inclusive
    Script script;
};

// Sorted, non-overlapping. Code points outside every range are Other.
[[nodiscard]] std::span<const ScriptRange> script_ranges() noexcept;

// Total over all 32-bit values; unassigned and out-of-range values are Other
[[nodiscard]] Script classify(unicode::CodePoint cp) noexcept;

// General category Mn, Mc or Me
[[nodiscard]] bool is_combining_mark(unicode::CodePoint cp) noexcept;

[[nodiscard]] constexpr bool is_joiner(unicode::CodePoint cp) {
    return cp == unicode::ZERO_WIDTH_JOINER;
}

// Unicode White_Space property (covers tab, newline and the Zs spaces)
[[nodiscard]] bool is_whitespace(unicode::CodePoint cp) noexcept;

} // namespace jade::text

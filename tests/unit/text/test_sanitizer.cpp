#include <gtest/gtest.h>
#include "jade/text/sanitizer.hpp"
#include "jade/text/script_run.hpp"
#include <format>
#include <iterator>
#include <random>
#include <string>

namespace {

// Printable form of generated input for failure messages
std::string hex_bytes(std::string_view text) {
    std::string out;
    for (unsigned char c : text) {
        std::format_to(std::back_inserter(out), "{:02X} ", c);
    }
    return out;
}

} // namespace

using namespace jade;
using namespace jade::text;

// ============================================================================
// Decoding
// ============================================================================

TEST(SanitizerTest, EmptyInput) {
    auto result = sanitize("");
    EXPECT_EQ(result.sanitized_text, "");
    EXPECT_EQ(result.removed_count, 0u);
    EXPECT_EQ(result.replaced_count, 0u);
    EXPECT_FALSE(result.degraded);
}

TEST(SanitizerTest, PlainTextUnchanged) {
    auto result = sanitize("Chinese Drama 2025");
    EXPECT_EQ(result.original_text, "Chinese Drama 2025");
    EXPECT_EQ(result.sanitized_text, "Chinese Drama 2025");
    EXPECT_EQ(result.removed_count, 0u);
    EXPECT_FALSE(result.degraded);
}

TEST(SanitizerTest, LoneHighSurrogateRemoved) {
    auto result = sanitize("\xED\xA0\xBD" "abc def");
    EXPECT_EQ(result.sanitized_text, "abc def");
    EXPECT_EQ(result.removed_count, 1u);
    EXPECT_EQ(result.replaced_count, 0u);
}

TEST(SanitizerTest, Utf16LoneSurrogateRemoved) {
    std::u16string source = u"Trailer ";
    source.push_back(char16_t(0xD83D));
    source += u"2025";

    auto result = sanitize(unicode::utf16_to_utf8(source));
    EXPECT_EQ(result.sanitized_text, "Trailer 2025");
    EXPECT_EQ(result.removed_count, 1u);
}

TEST(SanitizerTest, MalformedBytesReplaced) {
    auto result = sanitize("a\xFF" "b");
    EXPECT_EQ(result.sanitized_text, "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(result.replaced_count, 1u);
    EXPECT_EQ(result.removed_count, 0u);
}

// ============================================================================
// NFC and controls
// ============================================================================

TEST(SanitizerTest, ComposesToNfc) {
    auto result = sanitize("Cafe\xCC\x81");
    EXPECT_EQ(result.sanitized_text, "Caf\xC3\xA9");
}

TEST(SanitizerTest, StripsControlsKeepsTabAndNewline) {
    auto result = sanitize("a\x01" "b\r\nc\td\x7F" "\xC2\x85");
    EXPECT_EQ(result.sanitized_text, "ab\nc\td");
    EXPECT_EQ(result.removed_count, 4u);
}

TEST(SanitizerTest, RecomposesAfterRemovingControl) {
    auto result = sanitize("e\x01\xCC\x81");
    EXPECT_EQ(result.sanitized_text, "\xC3\xA9");
    EXPECT_EQ(result.removed_count, 1u);
}

TEST(SanitizerTest, NormalizeNfcDirect) {
    auto result = normalize_nfc(U"Å");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), U"Å");
}

// ============================================================================
// Thai clusters
// ============================================================================

TEST(ThaiClusterTest, SaraAmSpellingsMatch) {
    auto result = sanitize("กำ กํา");
    EXPECT_EQ(result.sanitized_text, "กำ กำ");
    EXPECT_EQ(result.composed_count, 1u);

    auto space = result.sanitized_text.find(' ');
    ASSERT_NE(space, std::string::npos);
    EXPECT_EQ(result.sanitized_text.substr(0, space), result.sanitized_text.substr(space + 1));
}

TEST(ThaiClusterTest, SaraAmWithToneMark) {
    // NO NU + NIKHAHIT + MAI THO + SARA AA, in both mark orders
    auto a = sanitize("นํ้า");
    auto b = sanitize("น้ํา");
    auto composed = sanitize("น้ำ");

    EXPECT_EQ(a.sanitized_text, "น้ำ");
    EXPECT_EQ(b.sanitized_text, a.sanitized_text);
    EXPECT_EQ(composed.sanitized_text, a.sanitized_text);
    EXPECT_EQ(a.composed_count, 1u);
    EXPECT_EQ(composed.composed_count, 0u);
}

TEST(ThaiClusterTest, AboveVowelBeforeToneMark) {
    auto swapped = sanitize("ก่ิ");
    auto canonical = sanitize("กิ่");
    EXPECT_EQ(swapped.sanitized_text, "กิ่");
    EXPECT_EQ(canonical.sanitized_text, swapped.sanitized_text);
}

TEST(ThaiClusterTest, BelowMarksFollowCombiningClass) {
    // SARA U (class 103) and PHINTHU (class 9) split by THANTHAKHAT
    auto once = sanitize("\u0E01\u0E38\u0E4C\u0E3A");
    EXPECT_EQ(once.sanitized_text, "\u0E01\u0E3A\u0E38\u0E4C");
    EXPECT_EQ(sanitize(once.sanitized_text).sanitized_text, once.sanitized_text);

    auto reversed = sanitize("\u0E01\u0E3A\u0E4C\u0E38");
    EXPECT_EQ(reversed.sanitized_text, once.sanitized_text);
}

TEST(ThaiClusterTest, ToneTypedAfterSaraAm) {
    std::string composed = "\u0E01\u0E48\u0E33";

    EXPECT_EQ(sanitize(composed).sanitized_text, composed);
    EXPECT_EQ(sanitize("\u0E01\u0E4D\u0E32\u0E48").sanitized_text, composed);
    EXPECT_EQ(sanitize("\u0E01\u0E33\u0E48").sanitized_text, composed);
    EXPECT_EQ(sanitize("\u0E01\u0E4D\u0E48\u0E32").sanitized_text, composed);
}

TEST(ThaiClusterTest, RepeatedSaraAmKeepsMarksFirst) {
    std::u32string text = U"\u0E01\u0E33\u0E33\u0E48";
    EXPECT_EQ(thai::canonicalize_clusters(text), 0u);
    EXPECT_EQ(text, U"\u0E01\u0E48\u0E33\u0E33");

    std::u32string again = text;
    thai::canonicalize_clusters(again);
    EXPECT_EQ(again, text);
}

TEST(ThaiClusterTest, ClusterBesideForeignMarkKeepsOrder) {
    // COMBINING TILDE OVERLAY has class 1; moving MAI EK next to it would
    // hand NFC a pair to reorder
    std::string text = "\u0E01\u0E48\u0E34\u0334";
    auto once = sanitize(text);
    EXPECT_EQ(once.sanitized_text, text);
    EXPECT_EQ(sanitize(once.sanitized_text).sanitized_text, once.sanitized_text);
}

TEST(ThaiClusterTest, MarkRanks) {
    EXPECT_LT(thai::mark_rank(0x0E38), thai::mark_rank(0x0E34));
    EXPECT_LT(thai::mark_rank(0x0E47), thai::mark_rank(thai::NIKHAHIT));
    EXPECT_LT(thai::mark_rank(thai::NIKHAHIT), thai::mark_rank(0x0E48));
    EXPECT_LT(thai::mark_rank(0x0E4B), thai::mark_rank(0x0E4C));
    EXPECT_EQ(thai::mark_rank(0x0E01), 0);
    EXPECT_FALSE(thai::is_mark(thai::SARA_AA));
    EXPECT_TRUE(thai::is_mark(0x0E31));
}

TEST(ThaiClusterTest, CanonicalizeInPlace) {
    std::u32string text = U"กํ่าข";
    EXPECT_EQ(thai::canonicalize_clusters(text), 1u);
    EXPECT_EQ(text, U"ก่ำข");
}

TEST(ThaiClusterTest, NikhahitWithoutSaraAaStays) {
    std::u32string text = U"กํ";
    EXPECT_EQ(thai::canonicalize_clusters(text), 0u);
    EXPECT_EQ(text, U"กํ");
}

// ============================================================================
// Zero-width and format characters
// ============================================================================

TEST(ZeroWidthTest, InvisiblesRemoved) {
    auto result = sanitize("a\u200Bb\u200Cc\uFEFFd\u00ADe\u202Ef\u2066g\u2060h");
    EXPECT_EQ(result.sanitized_text, "abcdefgh");
    EXPECT_EQ(result.removed_count, 7u);
}

TEST(ZeroWidthTest, EmojiZwjSequenceKept) {
    std::string family = "👨\u200D👩\u200D👧";
    auto result = sanitize(family);
    EXPECT_EQ(result.sanitized_text, family);
    EXPECT_EQ(result.removed_count, 0u);
}

TEST(ZeroWidthTest, ZwjBetweenLettersRemoved) {
    auto result = sanitize("a\u200Db");
    EXPECT_EQ(result.sanitized_text, "ab");
    EXPECT_EQ(result.removed_count, 1u);
}

TEST(ZeroWidthTest, RepeatedZwjCollapsed) {
    auto result = sanitize("👨\u200D\u200D👩");
    EXPECT_EQ(result.sanitized_text, "👨\u200D👩");
    EXPECT_EQ(result.removed_count, 1u);
}

TEST(ZeroWidthTest, DanglingZwjRemoved) {
    auto result = sanitize("👍\u200D");
    EXPECT_EQ(result.sanitized_text, "👍");
}

TEST(ZeroWidthTest, ComplexScriptZwjFollowsOption) {
    // Devanagari KA + VIRAMA + ZWJ + SSA
    std::string conjunct = "क्\u200Dष";

    auto kept = Sanitizer(SanitizerOptions{true}).sanitize(conjunct);
    EXPECT_EQ(kept.sanitized_text, conjunct);

    auto dropped = Sanitizer(SanitizerOptions{false}).sanitize(conjunct);
    EXPECT_EQ(dropped.sanitized_text, "क्ष");
    EXPECT_EQ(dropped.removed_count, 1u);
}

TEST(ZeroWidthTest, ZwjJudgedByRecomposedBase) {
    // LATIN LETTER SMALL CAPITAL A is Latin script but not a Latin-table letter
    auto once = sanitize("a\u200B\u0301\u200D\u1D00");
    EXPECT_EQ(once.sanitized_text, "\u00E1\u1D00");
    EXPECT_EQ(sanitize(once.sanitized_text).sanitized_text, once.sanitized_text);
}

TEST(ZeroWidthTest, ZwjBeforeMarkRemoved) {
    // The VIRAMA after the joiner is reordered behind the overlay once both are adjacent
    auto once = sanitize("क\u200D\u094D\u200B\u0334");
    EXPECT_EQ(once.sanitized_text, "क\u0334\u094D");
    EXPECT_EQ(once.removed_count, 2u);
    EXPECT_EQ(sanitize(once.sanitized_text).sanitized_text, once.sanitized_text);
}

TEST(ZeroWidthTest, ZwjAcrossScriptsRemoved) {
    auto result = sanitize("क\u200DЖ");
    EXPECT_EQ(result.sanitized_text, "कЖ");
}

// ============================================================================
// Private use and noncharacters
// ============================================================================

TEST(SanitizerTest, PrivateUseAndNoncharactersReplaced) {
    auto result = sanitize("a\uE000b\uFDD0c\U000F0001");
    EXPECT_EQ(result.sanitized_text, "a�b�c�");
    EXPECT_EQ(result.replaced_count, 3u);
}

TEST(SanitizerTest, ZwjBesidePrivateUseRemoved) {
    auto result = sanitize("\uE000\u200D\uE001");
    EXPECT_EQ(result.sanitized_text, "��");
    EXPECT_EQ(result.removed_count, 1u);
    EXPECT_EQ(result.replaced_count, 2u);
}

// ============================================================================
// Whole-string properties
// ============================================================================

TEST(SanitizerTest, EmojiSurviveUnchanged) {
    std::string title = "99คืนในป่า 💖💌♻️ | การผจญภัยครั้งใหม่";
    auto result = sanitize(title);
    EXPECT_EQ(result.sanitized_text, title);
    EXPECT_EQ(result.removed_count, 0u);
    EXPECT_EQ(result.replaced_count, 0u);
}

TEST(SanitizerTest, Idempotent) {
    const char* samples[] = {
        "",
        "กำ กํา",
        "น้ํา ก่ิ",
        "e\x01\xCC\x81",
        "e\u200B\xCC\x81",
        "ก่\u200Bุ",
        "👨\u200D\u200B👩 a\u200Db",
        "\xED\xA0\xBD\xED\xB2\x96 \xED\xB2\x96",
        "\xFF\xFE\xC0\xAF",
        "क्\u200Dष",
        "\uE000\u200D\uE001",
        "Trailer:Memory Wiped! Chen Zheyuan一笑随歌 | Chinese Drama 2025",
        "\u202Eevil\u202C\r\n",
    };
    for (const char* sample : samples) {
        auto once = sanitize(sample);
        auto twice = sanitize(once.sanitized_text);
        EXPECT_EQ(twice.sanitized_text, once.sanitized_text) << "input: " << sample;
        EXPECT_EQ(twice.removed_count, 0u) << "input: " << sample;
        EXPECT_EQ(twice.replaced_count, 0u) << "input: " << sample;
        EXPECT_EQ(twice.composed_count, 0u) << "input: " << sample;
    }
}

TEST(SanitizerTest, GeneratedInputsAreFixedPoints) {
    const char* pieces[] = {
        // Thai base, marks of class 0, 9, 103 and 107, SARA AA and SARA AM
        "\u0E01", "\u0E31", "\u0E34", "\u0E38", "\u0E39", "\u0E3A", "\u0E47",
        "\u0E48", "\u0E49", "\u0E4C", "\u0E4D", "\u0E32", "\u0E33",
        // zero-width and bidi
        "\u200B", "\u200C", "\u200D", "\u200D", "\uFEFF", "\u00AD", "\u200E",
        "\u202E", "\u2066", "\u2060",
        // emoji and modifiers
        "\U0001F468", "\U0001F469", "\U0001F3FD", "\uFE0F", "\u2764",
        // C0 and C1 controls
        "\x01", "\r", "\t", "\n", "\x7F", "\xC2\x85",
        // private use, noncharacter, malformed byte
        "\uE000", "\U000F0001", "\uFDD0", "\xFF",
        // WTF-8 surrogate halves
        "\xED\xA0\xBD", "\xED\xB2\x96",
        // other scripts and combining marks
        "a", "e", " ", "7", "\u0301", "\u0334", "\u0915", "\u094D", "\u0937",
    };

    std::mt19937 rng(20250611);
    std::uniform_int_distribution<usize> pick(0, std::size(pieces) - 1);
    std::uniform_int_distribution<int> length(1, 12);

    for (int n = 0; n < 5000; ++n) {
        std::string input;
        for (int k = length(rng); k > 0; --k) {
            input += pieces[pick(rng)];
        }

        auto once = sanitize(input);
        auto twice = sanitize(once.sanitized_text);
        ASSERT_FALSE(once.degraded) << hex_bytes(input);
        ASSERT_EQ(twice.sanitized_text, once.sanitized_text) << hex_bytes(input);
        ASSERT_EQ(twice.removed_count, 0u) << hex_bytes(input);
        ASSERT_EQ(twice.replaced_count, 0u) << hex_bytes(input);
        ASSERT_EQ(twice.composed_count, 0u) << hex_bytes(input);

        usize covered = 0;
        usize code_points = 0;
        for (const auto& run : segment(once.sanitized_text)) {
            ASSERT_EQ(run.start, covered) << hex_bytes(input);
            ASSERT_GT(run.end, run.start) << hex_bytes(input);
            covered = run.end;
            code_points += run.code_point_count;
        }
        ASSERT_EQ(covered, once.sanitized_text.size()) << hex_bytes(input);
        ASSERT_EQ(code_points, unicode::code_point_count(once.sanitized_text)) << hex_bytes(input);
    }
}

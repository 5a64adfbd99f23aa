#pragma once

#include "jade/core/types.hpp"
#include "jade/core/unicode.hpp"
#include <string>
#include <string_view>

namespace jade::text {

// ============================================================================
// Sanitization result
// ============================================================================

struct SanitizationResult {
    std::string original_text;
    std::string sanitized_text;
    usize removed_count{0};     // controls, lone surrogates, zero-width and bidi format characters
    usize replaced_count{0};    // malformed sequences, private use and noncharacters
    usize composed_count{0};    // NIKHAHIT + SARA AA pairs collapsed into SARA AM
    bool degraded{false};       // a step failed; later steps were skipped
};

// ============================================================================
// Sanitizer
// ============================================================================

struct SanitizerOptions {
    // Keep ZWJ between two letters of the same complex script (Indic conjuncts)
    bool allow_zwj_in_complex_scripts{true};
};

/**
 * Cleans untrusted UTF-8 for rendering.
 *
 * Steps, always in this order:
 *   decode (drop lone surrogates, U+FFFD for malformed bytes), NFC,
 *   strip C0/C1 controls except tab and newline, Thai cluster
 *   canonicalization, zero-width and bidi cleanup, private use and
 *   noncharacters to U+FFFD.
 *
 * The output is a fixed point: sanitizing it again changes nothing.
 */
class Sanitizer {
public:
    Sanitizer() = default;
    explicit Sanitizer(SanitizerOptions options);

    [[nodiscard]] SanitizationResult sanitize(std::string_view text) const noexcept;

    [[nodiscard]] const SanitizerOptions& options() const { return m_options; }

private:
    SanitizerOptions m_options;
};

// Sanitize with default options
[[nodiscard]] SanitizationResult sanitize(std::string_view text) noexcept;

// ============================================================================
// Individual steps
// ============================================================================

// Canonical composition through ICU
[[nodiscard]] Result<std::u32string, std::string> normalize_nfc(std::u32string_view text);

namespace thai {

constexpr unicode::CodePoint SARA_AA = 0x0E32;
constexpr unicode::CodePoint SARA_AM = 0x0E33;
constexpr unicode::CodePoint NIKHAHIT = 0x0E4D;

// Non-spacing marks that stack on a Thai base
[[nodiscard]] constexpr bool is_mark(unicode::CodePoint cp) {
    return cp == 0x0E31 || (cp >= 0x0E34 && cp <= 0x0E3A) ||
           (cp >= 0x0E47 && cp <= 0x0E4E);
}

// Position of a mark inside a canonical cluster:
// below vowels, above vowels and MAITAIKHU, NIKHAHIT, tone marks,
// THANTHAKHAT and YAMAKKAN. Non-marks rank 0. Within a rank, marks
// follow canonical combining class so NFC leaves the cluster alone.
[[nodiscard]] constexpr int mark_rank(unicode::CodePoint cp) {
    if (cp >= 0x0E38 && cp <= 0x0E3A) return 1;
    if (cp == 0x0E31 || (cp >= 0x0E34 && cp <= 0x0E37) || cp == 0x0E47) return 2;
    if (cp == NIKHAHIT) return 3;
    if (cp >= 0x0E48 && cp <= 0x0E4B) return 4;
    if (cp == 0x0E4C || cp == 0x0E4E) return 5;
    return 0;
}

// Reorders mark sequences in place and folds NIKHAHIT + SARA AA into
// SARA AM, which always ends its cluster. Clusters touching a non-Thai
// combining mark keep their NFC order. Returns the number of SARA AM
// compositions.
usize canonicalize_clusters(std::u32string& text);

} // namespace thai

} // namespace jade::text

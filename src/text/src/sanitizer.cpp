/**
 * Sanitizer - untrusted UTF-8 to renderable NFC text
 */

#include "jade/text/sanitizer.hpp"
#include "jade/text/script.hpp"
#include "jade/core/logger.hpp"
#include <algorithm>
#include <exception>
#include <optional>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/uscript.h>
#include <unicode/utf16.h>

namespace jade::text {

namespace {

Logger& log() {
    static Logger& logger = logging::get("jade.sanitizer");
    return logger;
}

// ============================================================================
// Step helpers
// ============================================================================

bool is_stripped_control(unicode::CodePoint cp) {
    if (cp == '\n' || cp == '\t') return false;
    return cp < 0x20 || (cp >= 0x7F && cp <= 0x9F);
}

// Zero-width, invisible and bidi format characters removed outright
bool is_removed_format(unicode::CodePoint cp) {
    switch (cp) {
        case 0x00AD:    // soft hyphen
        case 0x061C:    // arabic letter mark
        case 0x200B:
        case 0x200C:
        case 0x200E:    // LRM
        case 0x200F:    // RLM
        case 0xFEFF:
            return true;
        default:
            break;
    }
    return (cp >= 0x202A && cp <= 0x202E) ||
           (cp >= 0x2060 && cp <= 0x2064) ||
           (cp >= 0x2066 && cp <= 0x2069);
}

bool is_replaced(unicode::CodePoint cp) {
    return unicode::is_private_use(cp) || unicode::is_noncharacter(cp);
}

UScriptCode script_code(unicode::CodePoint cp) {
    UErrorCode status = U_ZERO_ERROR;
    UScriptCode code = uscript_getScript(static_cast<UChar32>(cp), &status);
    return U_FAILURE(status) ? USCRIPT_INVALID_CODE : code;
}

u8 combining_class(unicode::CodePoint cp) {
    return u_getCombiningClass(static_cast<UChar32>(cp));
}

// Last starter of `text` that is not inherited, or nullopt. NFC moves and
// merges only non-starters, so this survives recomposition.
std::optional<unicode::CodePoint> trailing_base(const std::u32string& text) {
    for (auto it = text.rbegin(); it != text.rend(); ++it) {
        if (combining_class(*it) == 0 && script_code(*it) != USCRIPT_INHERITED) return *it;
    }
    return std::nullopt;
}

bool joins_complex_script(const std::u32string& out, unicode::CodePoint next) {
    auto base = trailing_base(out);
    if (!base || combining_class(next) != 0) return false;
    if (classify(*base) != Script::Other || classify(next) != Script::Other) return false;
    if (is_replaced(*base) || is_replaced(next)) return false;

    UScriptCode left = script_code(*base);
    UScriptCode right = script_code(next);
    return left == right &&
           left != USCRIPT_COMMON &&
           left != USCRIPT_INHERITED &&
           left != USCRIPT_UNKNOWN &&
           left != USCRIPT_INVALID_CODE;
}

usize strip_controls(std::u32string& text) {
    auto before = text.size();
    std::erase_if(text, is_stripped_control);
    return before - text.size();
}

usize strip_zero_width(std::u32string& text, const SanitizerOptions& options) {
    std::u32string out;
    out.reserve(text.size());
    usize removed = 0;

    for (usize i = 0; i < text.size(); ++i) {
        unicode::CodePoint cp = text[i];

        if (is_removed_format(cp)) {
            ++removed;
            continue;
        }

        if (is_joiner(cp)) {
            usize j = i + 1;
            while (j < text.size() && is_removed_format(text[j])) ++j;

            bool keep = false;
            if (!out.empty() && j < text.size() && !is_joiner(out.back())) {
                unicode::CodePoint next = text[j];
                keep = (classify(out.back()) == Script::Emoji && classify(next) == Script::Emoji) ||
                       (options.allow_zwj_in_complex_scripts && joins_complex_script(out, next));
            }
            if (!keep) {
                ++removed;
                continue;
            }
        }

        out.push_back(cp);
    }

    text = std::move(out);
    return removed;
}

usize replace_unsafe(std::u32string& text) {
    usize replaced = 0;
    for (auto& cp : text) {
        if (is_replaced(cp)) {
            cp = unicode::REPLACEMENT_CHARACTER;
            ++replaced;
        }
    }
    return replaced;
}

// A combining mark NFC would reorder against Thai marks
bool is_foreign_nonstarter(unicode::CodePoint cp) {
    return !thai::is_mark(cp) && combining_class(cp) != 0;
}

std::string encode(std::u32string_view text) {
    std::string out;
    out.reserve(text.size());
    unicode::utf8_append(out, text);
    return out;
}

} // anonymous namespace

// ============================================================================
// NFC
// ============================================================================

Result<std::u32string, std::string> normalize_nfc(std::u32string_view text) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) {
        return make_error(std::string("NFC instance unavailable: ") + u_errorName(status));
    }

    auto source = icu::UnicodeString::fromUTF32(
        reinterpret_cast<const UChar32*>(text.data()), static_cast<int32_t>(text.size()));

    icu::UnicodeString normalized = nfc->normalize(source, status);
    if (U_FAILURE(status)) {
        return make_error(std::string("NFC normalization failed: ") + u_errorName(status));
    }

    std::u32string out;
    out.reserve(static_cast<usize>(normalized.length()));
    for (int32_t i = 0; i < normalized.length();) {
        UChar32 c = normalized.char32At(i);
        out.push_back(static_cast<unicode::CodePoint>(c));
        i += U16_LENGTH(c);
    }
    return out;
}

// ============================================================================
// Thai clusters
// ============================================================================

namespace thai {

usize canonicalize_clusters(std::u32string& text) {
    std::u32string out;
    out.reserve(text.size());
    usize composed = 0;

    usize i = 0;
    while (i < text.size()) {
        if (!is_mark(text[i]) && text[i] != SARA_AM) {
            out.push_back(text[i++]);
            continue;
        }

        // A cluster runs over marks and SARA AM, and over SARA AA while an
        // unused NIKHAHIT precedes it
        std::u32string marks;
        usize nikhahit = 0;
        usize sara_am = 0;
        usize folds = 0;
        usize end = i;
        for (; end < text.size(); ++end) {
            unicode::CodePoint cp = text[end];
            if (is_mark(cp)) {
                marks.push_back(cp);
                if (cp == NIKHAHIT) ++nikhahit;
            } else if (cp == SARA_AM) {
                ++sara_am;
            } else if (cp == SARA_AA && nikhahit > folds) {
                ++folds;
            } else {
                break;
            }
        }

        bool blocked = (!out.empty() && is_foreign_nonstarter(out.back())) ||
                       (end < text.size() && is_foreign_nonstarter(text[end]));
        if (blocked) {
            out.append(text, i, end - i);
            i = end;
            continue;
        }

        std::stable_sort(marks.begin(), marks.end(),
            [](unicode::CodePoint a, unicode::CodePoint b) {
                int ra = mark_rank(a);
                int rb = mark_rank(b);
                if (ra != rb) return ra < rb;
                return combining_class(a) < combining_class(b);
            });

        for (usize n = 0; n < folds; ++n) {
            marks.erase(marks.find(NIKHAHIT), 1);
        }
        out += marks;
        out.append(sara_am + folds, SARA_AM);
        composed += folds;
        i = end;
    }

    text = std::move(out);
    return composed;
}

} // namespace thai

// ============================================================================
// Sanitizer
// ============================================================================

Sanitizer::Sanitizer(SanitizerOptions options) : m_options(options) {}

SanitizationResult Sanitizer::sanitize(std::string_view text) const noexcept {
    SanitizationResult result;
    std::optional<std::u32string> fallback;

    try {
        result.original_text.assign(text);

        auto decoded = unicode::decode_lossy(text);
        result.removed_count = decoded.surrogates_removed;
        result.replaced_count = decoded.sequences_replaced;

        auto normalized = normalize_nfc(decoded.code_points);
        if (!normalized) {
            log().warn_fmt("normalization failed, passing text through: {}", normalized.error());
            result.sanitized_text = encode(decoded.code_points);
            result.degraded = true;
            return result;
        }
        fallback = normalized.value();

        std::u32string cps = std::move(normalized).value();

        // Removing a character can bring a base next to marks it composes
        // with, so each removing step is followed by recomposition.
        auto recompose = [&cps]() -> bool {
            auto again = normalize_nfc(cps);
            if (!again) {
                log().warn_fmt("renormalization failed: {}", again.error());
                return false;
            }
            cps = std::move(again).value();
            return true;
        };

        usize controls = strip_controls(cps);
        result.removed_count += controls;
        if (controls > 0 && !recompose()) {
            result.sanitized_text = encode(*fallback);
            result.degraded = true;
            return result;
        }

        result.composed_count = thai::canonicalize_clusters(cps);

        usize zero_width = strip_zero_width(cps, m_options);
        result.removed_count += zero_width;
        if (zero_width > 0) {
            if (!recompose()) {
                result.sanitized_text = encode(*fallback);
                result.degraded = true;
                return result;
            }
            result.composed_count += thai::canonicalize_clusters(cps);
        }

        result.replaced_count += replace_unsafe(cps);
        result.sanitized_text = encode(cps);
    } catch (const std::exception& e) {
        log().warn_fmt("sanitization aborted: {}", e.what());
        result.degraded = true;
        result.sanitized_text = fallback ? encode(*fallback) : std::string{};
    }

    return result;
}

SanitizationResult sanitize(std::string_view text) noexcept {
    static const Sanitizer sanitizer;
    return sanitizer.sanitize(text);
}

} // namespace jade::text

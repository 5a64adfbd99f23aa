#pragma once

#include "font_registry.hpp"
#include "script_run.hpp"
#include <array>
#include <optional>
#include <span>
#include <string>

namespace jade::text {

// ============================================================================
// Field kinds and weights
// ============================================================================

enum class FieldKind : u8 {
    Title,
    Metadata,
};

[[nodiscard]] std::string_view field_kind_name(FieldKind kind) noexcept;

// Per-script multiplier applied to tallied code point counts
class ScriptWeights {
public:
    ScriptWeights() { m_weights.fill(1.0); }

    ScriptWeights& set(Script script, f64 weight) {
        m_weights[script_index(script)] = weight;
        return *this;
    }

    [[nodiscard]] f64 get(Script script) const { return m_weights[script_index(script)]; }

    bool operator==(const ScriptWeights&) const = default;

private:
    std::array<f64, SCRIPT_COUNT> m_weights;
};

// Equal-weight winners resolve in this order
constexpr std::array<Script, 7> TIE_BREAK_ORDER = {
    Script::Thai, Script::Latin, Script::Han, Script::Kana,
    Script::Hangul, Script::Other, Script::Emoji,
};

// ============================================================================
// Font decision
// ============================================================================

struct ScriptTally {
    Script script;
    usize code_points;
    f64 weighted;

    bool operator==(const ScriptTally&) const = default;
};

struct FontDecision {
    std::string field_id;
    std::string chosen_font;
    std::optional<Script> winning_script;   // empty when nothing was tallied
    std::vector<ScriptTally> script_weights; // tallied scripts in tie-break order
    bool tie_break_applied{false};
};

/**
 * Picks one font for a whole field.
 *
 * Counts the letters of each script over all runs (digits, punctuation and
 * controls are ignored), scales each count by the field kind's weight and
 * takes the first candidate of the heaviest script. Only one font per field:
 * the renderer cannot mix fonts inside a text node.
 */
[[nodiscard]] FontDecision select_font(std::string field_id,
                                       std::span<const ScriptRun> runs,
                                       FieldKind kind,
                                       const FontRegistry& registry,
                                       const ScriptWeights& weights);

} // namespace jade::text

#pragma once

#include "script.hpp"
#include <string_view>
#include <vector>

namespace jade::text {

// ============================================================================
// Script Run - maximal substring attributed to one script
// ============================================================================

struct ScriptRun {
    Script script{Script::Other};
    usize start{0};               // byte offset, inclusive
    usize end{0};                 // byte offset, exclusive
    usize code_point_count{0};    // scalar values in [start, end)
    usize significant_count{0};   // code points other than digits, punctuation and controls

    [[nodiscard]] usize byte_length() const { return end - start; }

    [[nodiscard]] std::string_view text_in(std::string_view source) const {
        return source.substr(start, end - start);
    }

    [[nodiscard]] bool operator==(const ScriptRun& other) const = default;
};

// ============================================================================
// Script Run Iterator
// ============================================================================

/**
 * Walks UTF-8 text by scalar value and yields gap-free script runs.
 *
 * A run only ends when a code point of a different script arrives that is
 * neither transparent (digits, punctuation, whitespace and other controls)
 * nor a combining mark / ZWJ. Leading transparent code points take the
 * script of the first real letter after them; a combining mark at the very
 * start opens an Other run. The iterator holds a view, so the text must
 * outlive it.
 */
class ScriptRunIterator {
public:
    explicit ScriptRunIterator(std::string_view text);

    // Fills `run` with the next run. Returns false once the text is exhausted.
    bool consume(ScriptRun& run);

    // Restart from the beginning of the text
    void reset() { m_pos = 0; }

    [[nodiscard]] bool at_end() const { return m_pos >= m_text.size(); }

private:
    std::string_view m_text;
    usize m_pos{0};
};

// Collects every run of the text
[[nodiscard]] std::vector<ScriptRun> segment(std::string_view text);

} // namespace jade::text

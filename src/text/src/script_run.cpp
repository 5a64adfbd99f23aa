#include "jade/text/script_run.hpp"
#include <optional>

namespace jade::text {

namespace {

struct ClassifiedCodePoint {
    unicode::CodePoint cp;
    usize length;
    Script script;
    bool inherits;      // combining mark or ZWJ
    bool transparent;   // digit, punctuation, control
};

ClassifiedCodePoint classify_at(std::string_view text, usize pos) {
    auto decoded = unicode::utf8_decode(text.data() + pos, text.size() - pos);

    ClassifiedCodePoint result{decoded.code_point, decoded.bytes_consumed, Script::Other, false, false};
    if (decoded.status == unicode::Utf8Status::Malformed) {
        return result;
    }

    result.script = classify(decoded.code_point);
    result.inherits = is_combining_mark(decoded.code_point) || is_joiner(decoded.code_point);
    result.transparent = is_script_neutral(result.script);
    return result;
}

// Script of a run made only of transparent code points
Script neutral_run_script(const ClassifiedCodePoint& first) {
    if (first.script == Script::Control && is_whitespace(first.cp)) {
        return Script::Punctuation;
    }
    return first.script;
}

} // anonymous namespace

ScriptRunIterator::ScriptRunIterator(std::string_view text) : m_text(text) {}

bool ScriptRunIterator::consume(ScriptRun& run) {
    if (m_pos >= m_text.size()) {
        return false;
    }

    run = ScriptRun{};
    run.start = m_pos;

    std::optional<Script> script;
    Script neutral = Script::Other;

    while (m_pos < m_text.size()) {
        auto current = classify_at(m_text, m_pos);
        bool first = run.code_point_count == 0;

        if (first) {
            if (current.inherits) {
                // Only reachable at the start of the text: no base to attach to
                script = Script::Other;
            } else if (current.transparent) {
                neutral = neutral_run_script(current);
            } else {
                script = current.script;
            }
        } else if (!current.inherits && !current.transparent) {
            if (!script) {
                script = current.script;
            } else if (*script != current.script) {
                break;
            }
        }

        m_pos += current.length;
        ++run.code_point_count;
        if (!current.transparent) {
            ++run.significant_count;
        }
    }

    run.script = script.value_or(neutral);
    run.end = m_pos;
    return true;
}

std::vector<ScriptRun> segment(std::string_view text) {
    std::vector<ScriptRun> runs;
    ScriptRunIterator iterator(text);
    ScriptRun run;
    while (iterator.consume(run)) {
        runs.push_back(run);
    }
    return runs;
}

} // namespace jade::text

#include "jade/text/font_selector.hpp"
#include "jade/core/logger.hpp"
#include <cmath>

namespace jade::text {

namespace {

constexpr f64 WEIGHT_EPSILON = 1e-9;

Logger& log() {
    static Logger& logger = logging::get("jade.fonts");
    return logger;
}

} // anonymous namespace

std::string_view field_kind_name(FieldKind kind) noexcept {
    switch (kind) {
        case FieldKind::Title: return "title";
        case FieldKind::Metadata: return "metadata";
    }
    return "title";
}

FontDecision select_font(std::string field_id,
                         std::span<const ScriptRun> runs,
                         FieldKind kind,
                         const FontRegistry& registry,
                         const ScriptWeights& weights) {
    std::array<usize, SCRIPT_COUNT> counts{};
    for (const auto& run : runs) {
        if (is_script_neutral(run.script)) continue;
        counts[script_index(run.script)] += run.significant_count;
    }

    FontDecision decision;
    decision.field_id = std::move(field_id);

    const ScriptTally* best = nullptr;
    usize tied = 0;

    for (auto script : TIE_BREAK_ORDER) {
        usize count = counts[script_index(script)];
        if (count == 0) continue;
        decision.script_weights.push_back({script, count, static_cast<f64>(count) * weights.get(script)});
    }

    // Earlier entries win ties, so only a strictly heavier script replaces the leader
    for (const auto& tally : decision.script_weights) {
        if (!best || tally.weighted > best->weighted + WEIGHT_EPSILON) {
            best = &tally;
            tied = 1;
        } else if (std::abs(tally.weighted - best->weighted) <= WEIGHT_EPSILON) {
            ++tied;
        }
    }

    if (!best) {
        decision.chosen_font = registry.fallback_family();
        log().debug_fmt("{} [{}]: no letters, using fallback {}",
                        decision.field_id, field_kind_name(kind), decision.chosen_font);
        return decision;
    }

    decision.winning_script = best->script;
    decision.tie_break_applied = tied > 1;
    decision.chosen_font = registry.candidates(best->script).front();

    log().debug_fmt("{} [{}]: {} wins with {:.2f}{}, font {}",
                    decision.field_id, field_kind_name(kind), script_name(best->script),
                    best->weighted, decision.tie_break_applied ? " (tie)" : "",
                    decision.chosen_font);
    return decision;
}

} // namespace jade::text

#pragma once

#include "font_registry.hpp"
#include "font_selector.hpp"
#include <string>

namespace jade::text {

// ============================================================================
// Pipeline configuration
// ============================================================================

inline ScriptWeights default_title_weights() {
    ScriptWeights weights;
    // Emoji count half in titles
    weights.set(Script::Emoji, 0.5);
    return weights;
}

struct PipelineConfig {
    std::string fallback_family{DEFAULT_FALLBACK_FAMILY};

    ScriptWeights title_weights{default_title_weights()};
    ScriptWeights metadata_weights;

    bool allow_zwj_in_complex_scripts{true};
    bool record_diagnostics{true};

    [[nodiscard]] const ScriptWeights& weights_for(FieldKind kind) const {
        return kind == FieldKind::Title ? title_weights : metadata_weights;
    }
};

} // namespace jade::text

#include "jade/text/pipeline.hpp"
#include "jade/core/logger.hpp"
#include <exception>
#include <variant>
#include <vector>

namespace jade::text {

namespace {

Logger& log() {
    static Logger& logger = logging::get("jade.pipeline");
    return logger;
}

// Missing assets ahead of the chosen font, including the chosen one
std::vector<MissingFont> passed_over(const FontRegistry& registry, const FontDecision& decision) {
    std::vector<MissingFont> missing;
    if (!decision.winning_script) {
        const auto* fallback = std::get_if<MissingFont>(&registry.fallback_asset());
        if (fallback && fallback->family == decision.chosen_font) {
            missing.push_back(*fallback);
        }
        return missing;
    }

    for (const auto& asset : registry.chain(*decision.winning_script)) {
        if (const auto* m = std::get_if<MissingFont>(&asset)) {
            missing.push_back(*m);
        }
        if (asset_family(asset) == decision.chosen_font) break;
    }
    return missing;
}

} // anonymous namespace

TextPipeline::TextPipeline(const FontRegistry& registry, PipelineConfig config,
                           DiagnosticsSink* sink)
    : m_registry(registry),
      m_config(std::move(config)),
      m_sanitizer(SanitizerOptions{m_config.allow_zwj_in_complex_scripts}),
      m_sink(m_config.record_diagnostics ? sink : nullptr) {

    if (m_registry.contains(m_config.fallback_family)) {
        m_empty_family = m_config.fallback_family;
    } else {
        log().warn_fmt("configured fallback {} is not registered, using {}",
                       m_config.fallback_family, m_registry.fallback_family());
        m_empty_family = m_registry.fallback_family();
    }
}

ProcessedField TextPipeline::process(const Field& field) const noexcept {
    ProcessedField out;

    try {
        auto sanitized = m_sanitizer.sanitize(field.text);
        out.sanitized_text = sanitized.sanitized_text;
        out.diagnostics.degraded = sanitized.degraded;

        auto runs = segment(sanitized.sanitized_text);
        auto decision = select_font(field.id, runs, field.kind, m_registry,
                                    m_config.weights_for(field.kind));
        if (!decision.winning_script) {
            decision.chosen_font = m_empty_family;
        }
        out.font_family = decision.chosen_font;

        auto& record = out.diagnostics;
        record.field_id = field.id;
        record.kind = field.kind;
        record.original = std::move(sanitized.original_text);
        record.sanitized = std::move(sanitized.sanitized_text);
        record.runs = std::move(runs);
        record.missing_fonts = passed_over(m_registry, decision);
        record.decision = std::move(decision);
        record.removed_count = sanitized.removed_count;
        record.replaced_count = sanitized.replaced_count;
    } catch (const std::exception& e) {
        fail(out, field, e.what());
    } catch (...) {
        fail(out, field, "unknown exception");
    }

    emit(out.diagnostics);
    return out;
}

SanitizationResult TextPipeline::sanitize_only(std::string_view text) const noexcept {
    return m_sanitizer.sanitize(text);
}

// Keeps whatever text the sanitizer produced
void TextPipeline::fail(ProcessedField& out, const Field& field, std::string_view what) const {
    log().error_fmt("processing {} failed: {}", field.id, what);
    out.font_family = m_empty_family;

    auto& record = out.diagnostics;
    record.field_id = field.id;
    record.kind = field.kind;
    record.original = field.text;
    record.sanitized = out.sanitized_text;
    record.runs.clear();
    record.missing_fonts.clear();
    record.decision = FontDecision{};
    record.decision.field_id = field.id;
    record.decision.chosen_font = m_empty_family;
    record.degraded = true;
}

void TextPipeline::emit(const DiagnosticRecord& record) const noexcept {
    if (!m_sink) return;

    try {
        m_sink->record(record);
    } catch (const std::exception& e) {
        log().warn_fmt("diagnostics sink failed for {}: {}", record.field_id, e.what());
    } catch (...) {
        log().warn_fmt("diagnostics sink failed for {}", record.field_id);
    }
}

} // namespace jade::text

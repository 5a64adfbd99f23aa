#pragma once

#include "diagnostics.hpp"
#include "font_registry.hpp"
#include "pipeline_config.hpp"
#include "sanitizer.hpp"
#include <string>
#include <string_view>

namespace jade::text {

// ============================================================================
// Fields
// ============================================================================

struct Field {
    std::string id;
    std::string text;
    FieldKind kind{FieldKind::Title};
};

struct ProcessedField {
    std::string sanitized_text;
    std::string font_family;
    DiagnosticRecord diagnostics;
};

// ============================================================================
// Text Pipeline
// ============================================================================

/**
 * Sanitize, segment and pick a font for display fields.
 *
 * The registry and the sink are borrowed and must outlive the pipeline.
 * A null sink (or record_diagnostics = false) disables diagnostics.
 * process() holds no mutable state and may run concurrently. It never
 * throws; a failure after sanitizing keeps the sanitized text, picks the
 * fallback family and marks the record degraded.
 */
class TextPipeline {
public:
    TextPipeline(const FontRegistry& registry, PipelineConfig config,
                 DiagnosticsSink* sink = nullptr);

    [[nodiscard]] ProcessedField process(const Field& field) const noexcept;

    [[nodiscard]] SanitizationResult sanitize_only(std::string_view text) const noexcept;

    [[nodiscard]] const PipelineConfig& config() const { return m_config; }
    [[nodiscard]] const FontRegistry& registry() const { return m_registry; }

private:
    void fail(ProcessedField& out, const Field& field, std::string_view what) const;
    void emit(const DiagnosticRecord& record) const noexcept;

    const FontRegistry& m_registry;
    PipelineConfig m_config;
    Sanitizer m_sanitizer;
    DiagnosticsSink* m_sink;
    std::string m_empty_family;
};

} // namespace jade::text

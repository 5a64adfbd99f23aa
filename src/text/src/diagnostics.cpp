#include "jade/text/diagnostics.hpp"
#include <format>
#include <iterator>

namespace jade::text {

namespace {

// Quotes a value and escapes what would break the one-line format
void append_quoted(std::string& out, std::string_view value) {
    out.push_back('"');
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:   out.push_back(c); break;
        }
    }
    out.push_back('"');
}

} // anonymous namespace

std::string format_record(const DiagnosticRecord& record) {
    std::string out;
    auto it = std::back_inserter(out);

    out += "field=";
    append_quoted(out, record.field_id);
    std::format_to(it, " kind={}", field_kind_name(record.kind));

    out += " original=";
    append_quoted(out, record.original);
    out += " sanitized=";
    append_quoted(out, record.sanitized);

    out += " runs=";
    for (usize i = 0; i < record.runs.size(); ++i) {
        const auto& run = record.runs[i];
        std::format_to(it, "{}{}[{},{})", i ? "," : "", script_name(run.script), run.start, run.end);
    }

    out += " weights=";
    for (usize i = 0; i < record.decision.script_weights.size(); ++i) {
        const auto& tally = record.decision.script_weights[i];
        std::format_to(it, "{}{}:{:.2f}", i ? "," : "", script_name(tally.script), tally.weighted);
    }

    out += " missing=";
    for (usize i = 0; i < record.missing_fonts.size(); ++i) {
        std::format_to(it, "{}{}", i ? "," : "", record.missing_fonts[i].family);
    }

    std::format_to(it, " script={} font={} tie_break={} removed={} replaced={} degraded={}",
                   record.decision.winning_script ? script_name(*record.decision.winning_script)
                                                  : std::string_view("none"),
                   record.decision.chosen_font,
                   record.decision.tie_break_applied,
                   record.removed_count,
                   record.replaced_count,
                   record.degraded);
    return out;
}

// ============================================================================
// LoggerDiagnosticsSink
// ============================================================================

LoggerDiagnosticsSink::LoggerDiagnosticsSink(LogLevel level)
    : m_logger(logging::get("jade.diagnostics")), m_level(level) {}

void LoggerDiagnosticsSink::record(const DiagnosticRecord& record) {
    LogLevel level = m_level;
    if ((record.degraded || !record.missing_fonts.empty()) && level < LogLevel::Warn) {
        level = LogLevel::Warn;
    }
    if (!m_logger.is_enabled(level)) return;

    auto line = format_record(record);
    switch (level) {
        case LogLevel::Trace: m_logger.trace(line); break;
        case LogLevel::Debug: m_logger.debug(line); break;
        case LogLevel::Warn:  m_logger.warn(line); break;
        case LogLevel::Error:
        case LogLevel::Fatal: m_logger.error(line); break;
        default:              m_logger.info(line); break;
    }
}

// ============================================================================
// MemoryDiagnosticsSink
// ============================================================================

void MemoryDiagnosticsSink::record(const DiagnosticRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.push_back(record);
}

std::vector<DiagnosticRecord> MemoryDiagnosticsSink::records() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

usize MemoryDiagnosticsSink::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

void MemoryDiagnosticsSink::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.clear();
}

} // namespace jade::text

#pragma once

#include "font_selector.hpp"
#include "script_run.hpp"
#include "jade/core/logger.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace jade::text {

// ============================================================================
// Diagnostic record
// ============================================================================

struct DiagnosticRecord {
    std::string field_id;
    FieldKind kind{FieldKind::Title};
    std::string original;
    std::string sanitized;
    std::vector<ScriptRun> runs;
    FontDecision decision;
    std::vector<MissingFont> missing_fonts;     // unusable assets passed over for the chosen font
    usize removed_count{0};
    usize replaced_count{0};
    bool degraded{false};
};

// One line of space-separated key=value pairs; text values are quoted
[[nodiscard]] std::string format_record(const DiagnosticRecord& record);

// ============================================================================
// Sinks
// ============================================================================

// Observes processed fields. Implementations may throw; callers contain it.
class DiagnosticsSink {
public:
    virtual ~DiagnosticsSink() = default;
    virtual void record(const DiagnosticRecord& record) = 0;
};

// Writes each record through a named logger. Records with missing fonts
// or a degraded sanitization are raised to at least Warn.
class LoggerDiagnosticsSink : public DiagnosticsSink {
public:
    explicit LoggerDiagnosticsSink(LogLevel level = LogLevel::Info);

    void record(const DiagnosticRecord& record) override;

private:
    Logger& m_logger;
    LogLevel m_level;
};

// Keeps every record in memory
class MemoryDiagnosticsSink : public DiagnosticsSink {
public:
    void record(const DiagnosticRecord& record) override;

    [[nodiscard]] std::vector<DiagnosticRecord> records() const;
    [[nodiscard]] usize size() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::vector<DiagnosticRecord> m_records;
};

} // namespace jade::text

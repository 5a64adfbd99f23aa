#include <gtest/gtest.h>
#include "jade/text/diagnostics.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace jade;
using namespace jade::text;

namespace {

DiagnosticRecord sample_record() {
    DiagnosticRecord record;
    record.field_id = "video-42";
    record.kind = FieldKind::Metadata;
    record.original = "Hi \"there\"\n";
    record.sanitized = "Hi \"there\"\n";
    record.runs = segment(record.sanitized);
    record.decision.field_id = record.field_id;
    record.decision.chosen_font = "NotoSans";
    record.decision.winning_script = Script::Latin;
    record.decision.script_weights = {{Script::Latin, 7, 7.0}};
    record.removed_count = 2;
    record.replaced_count = 1;
    return record;
}

class CaptureSink : public LogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> out) : m_out(std::move(out)) {}

    void write(const LogRecord& record) override {
        if (record.logger_name == "jade.diagnostics") {
            m_out->emplace_back(record.message);
        }
    }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> m_out;
};

} // namespace

TEST(DiagnosticsFormatTest, KeyValueLine) {
    auto line = format_record(sample_record());

    EXPECT_NE(line.find("field=\"video-42\""), std::string::npos);
    EXPECT_NE(line.find("kind=metadata"), std::string::npos);
    EXPECT_NE(line.find("original=\"Hi \\\"there\\\"\\n\""), std::string::npos);
    EXPECT_NE(line.find("runs=Latin[0,"), std::string::npos);
    EXPECT_NE(line.find("weights=Latin:7.00"), std::string::npos);
    EXPECT_NE(line.find("script=Latin"), std::string::npos);
    EXPECT_NE(line.find("font=NotoSans"), std::string::npos);
    EXPECT_NE(line.find("removed=2"), std::string::npos);
    EXPECT_NE(line.find("replaced=1"), std::string::npos);
    EXPECT_NE(line.find("degraded=false"), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(DiagnosticsFormatTest, NoWinningScript) {
    DiagnosticRecord record;
    record.field_id = "empty";
    record.decision.chosen_font = "NotoSans";

    auto line = format_record(record);
    EXPECT_NE(line.find("script=none"), std::string::npos);
    EXPECT_NE(line.find("runs= "), std::string::npos);
}

TEST(MemoryDiagnosticsSinkTest, KeepsRecords) {
    MemoryDiagnosticsSink sink;
    sink.record(sample_record());
    sink.record(sample_record());

    EXPECT_EQ(sink.size(), 2u);
    EXPECT_EQ(sink.records()[1].field_id, "video-42");

    sink.clear();
    EXPECT_EQ(sink.size(), 0u);
}

TEST(DiagnosticsFormatTest, MissingFontsListed) {
    auto record = sample_record();
    EXPECT_NE(format_record(record).find("missing= "), std::string::npos);

    record.missing_fonts = {{"NotoSansKR", "absent"}, {"NotoSans", "not probed"}};
    EXPECT_NE(format_record(record).find("missing=NotoSansKR,NotoSans "), std::string::npos);
}

TEST(LoggerDiagnosticsSinkTest, MissingFontsRaiseLevel) {
    logging::shutdown();
    auto lines = std::make_shared<std::vector<std::string>>();
    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<CaptureSink>(lines));
    logging::init(std::move(sinks));
    auto previous = logging::level();
    logging::set_level(LogLevel::Warn);

    LoggerDiagnosticsSink sink(LogLevel::Info);
    auto quiet = sample_record();
    auto loud = sample_record();
    loud.field_id = "video-43";
    loud.missing_fonts = {{"NotoSansKR", "absent"}};
    sink.record(quiet);
    sink.record(loud);

    logging::set_level(previous);
    logging::shutdown();

    ASSERT_EQ(lines->size(), 1u);
    EXPECT_NE((*lines)[0].find("field=\"video-43\""), std::string::npos);
}

TEST(LoggerDiagnosticsSinkTest, WritesOneLine) {
    logging::shutdown();
    auto lines = std::make_shared<std::vector<std::string>>();
    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<CaptureSink>(lines));
    logging::init(std::move(sinks));

    LoggerDiagnosticsSink sink;
    sink.record(sample_record());

    logging::shutdown();

    ASSERT_EQ(lines->size(), 1u);
    EXPECT_EQ((*lines)[0], format_record(sample_record()));
}

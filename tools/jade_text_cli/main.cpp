/**
 * Text pipeline CLI Tool
 * Usage: jade-text [--metadata] [--fonts DIR]... [--diagnostics] [--log-file PATH] [file.txt]
 * Each input line is processed as one field; reads stdin without a file.
 * Repeated --fonts directories are searched in order.
 */

#include "jade/text/pipeline.hpp"
#include "jade/text/font_probe.hpp"
#include "jade/core/logger.hpp"
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace jade;
using namespace jade::text;

int main(int argc, char* argv[]) {
    FieldKind kind = FieldKind::Title;
    std::vector<std::string> font_dirs;
    bool diagnostics = false;
    const char* log_file = nullptr;
    const char* path = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--metadata") == 0) {
            kind = FieldKind::Metadata;
        } else if (std::strcmp(argv[i], "--diagnostics") == 0) {
            diagnostics = true;
        } else if (std::strcmp(argv[i], "--fonts") == 0 && i + 1 < argc) {
            font_dirs.emplace_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else {
            path = argv[i];
        }
    }

    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<ConsoleSink>());
    bool log_file_failed = false;
    if (log_file) {
        auto file_sink = std::make_unique<FileSink>(log_file);
        log_file_failed = !file_sink->is_open();
        if (!log_file_failed) {
            sinks.push_back(std::move(file_sink));
        }
    }
    logging::init(std::move(sinks));
    logging::set_level(diagnostics ? LogLevel::Info : LogLevel::Warn);

    if (log_file_failed) {
        JADE_LOG_WARN_FMT("cannot open log file {}, logging to stderr only", log_file);
    }

    if (font_dirs.empty()) {
        font_dirs = default_font_dirs();
    }

    std::ifstream file;
    if (path) {
        file.open(path);
        if (!file) {
            JADE_LOG_ERROR_FMT("cannot open input file {}", path);
            logging::shutdown();
            return 1;
        }
    }
    std::istream& input = path ? static_cast<std::istream&>(file) : std::cin;

    FreeTypeFontProbe probe;
    PipelineConfig config;
    const auto& registry = FontRegistry::install_shared(
        FontRegistry::build_default_seed(probe, font_dirs), config.fallback_family);

    LoggerDiagnosticsSink sink;
    TextPipeline pipeline(registry, config, diagnostics ? &sink : nullptr);

    std::string line;
    usize line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        auto result = pipeline.process({std::to_string(line_number), line, kind});

        std::cout << result.font_family << "\t" << result.sanitized_text;
        if (result.diagnostics.removed_count || result.diagnostics.replaced_count) {
            std::cout << "\t(removed " << result.diagnostics.removed_count
                      << ", replaced " << result.diagnostics.replaced_count << ")";
        }
        std::cout << "\n";
    }

    JADE_LOG_INFO_FMT("processed {} fields", line_number);
    logging::shutdown();
    return 0;
}

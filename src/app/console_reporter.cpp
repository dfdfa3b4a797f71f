#include "app/console_reporter.hpp"

#include "core/logging/logger.hpp"
#include "input/path_extractor.hpp"

namespace eolfix::app {

using protocol::FileOutcome;
using protocol::InputSource;

namespace {

// Lines shown before the omission marker once input is truncated.
std::size_t leading_lines(const std::size_t max_lines) {
    return max_lines >= 5 ? 2 : 1;
}

void section(const std::string& title) {
    LOG_DEBUG("== " + title + " ==");
}

}  // namespace

std::vector<std::string> preview_lines(const std::vector<std::string>& lines,
                                       const std::size_t max_lines) {
    std::vector<std::string> preview;
    if (lines.size() <= max_lines) {
        for (std::size_t i = 0; i < lines.size(); ++i) {
            preview.push_back("Line " + std::to_string(i + 1) + ": " + lines[i]);
        }
        return preview;
    }

    const std::size_t first = leading_lines(max_lines);
    for (std::size_t i = 0; i < first; ++i) {
        preview.push_back("Line " + std::to_string(i + 1) + ": " + lines[i]);
    }
    preview.push_back("... (" + std::to_string(lines.size() - max_lines) +
                      " lines omitted) ...");
    for (std::size_t i = lines.size() - (max_lines - first); i < lines.size(); ++i) {
        preview.push_back("Line " + std::to_string(i + 1) + ": " + lines[i]);
    }
    return preview;
}

void ConsoleReporter::on_input(const std::string& raw,
                               const protocol::ExtractionResult& extraction) {
    if (!core::logging::Logger::get().enabled(core::logging::LogLevel::DEBUG)) {
        return;
    }

    section("INPUT PARSING");
    const auto lines = input::PathExtractor::non_blank_lines(raw);
    if (lines.empty()) {
        LOG_DEBUG("Empty input");
        return;
    }

    LOG_DEBUG("Input received (" + std::to_string(lines.size()) + " lines):");
    for (const auto& line : preview_lines(lines)) {
        LOG_DEBUG("  " + line);
    }

    if (extraction.source == InputSource::ToolCall) {
        LOG_DEBUG("JSON parsing successful");
    } else {
        LOG_DEBUG("JSON parsing failed, treating as plain text");
    }
    LOG_DEBUG("Input source: " + protocol::to_string(extraction.source));

    if (extraction.paths.empty()) {
        LOG_DEBUG("No file paths found");
        return;
    }
    LOG_DEBUG("Extracted file paths:");
    for (std::size_t i = 0; i < extraction.paths.size(); ++i) {
        LOG_DEBUG("  [" + std::to_string(i + 1) + "] " + extraction.paths[i]);
    }
    section("PROCESSING");
}

void ConsoleReporter::on_file(const protocol::FileReport& report) {
    const std::string progress = "[" + std::to_string(report.index) + "/" +
                                 std::to_string(report.total) + "] ";
    if (report.outcome == FileOutcome::SkippedFilteredOut) {
        LOG_DEBUG(progress + "Excluding file: " + report.path);
        return;
    }

    LOG_DEBUG(progress + "Processing: " + report.path);
    switch (report.outcome) {
        case FileOutcome::SkippedNotFound:
            LOG_DEBUG("  File does not exist, skipping");
            break;
        case FileOutcome::SkippedEmpty:
            LOG_DEBUG("  File is empty, skipping");
            break;
        case FileOutcome::Unchanged:
            LOG_DEBUG("  Already ends with newline");
            break;
        case FileOutcome::Repaired:
            LOG_DEBUG("  Newline added successfully");
            LOG_INFO("Added newline to " + report.path);
            break;
        case FileOutcome::Failed: {
            const std::string message =
                report.error.has_value() ? report.error->message : "unknown error";
            LOG_ERROR("Error processing " + report.path + ": " + message);
            break;
        }
        case FileOutcome::SkippedFilteredOut:
            break;
    }
    LOG_DEBUG("  Outcome: " + protocol::to_string(report.outcome));
}

void ConsoleReporter::on_summary(const protocol::RunReport& report) {
    section("SUMMARY");
    if (report.total == 0) {
        LOG_DEBUG("No files to process");
        return;
    }
    LOG_DEBUG("Total files: " + std::to_string(report.total));
    if (report.total > report.attempted) {
        LOG_DEBUG("Files excluded by patterns: " +
                  std::to_string(report.total - report.attempted));
    }
    LOG_DEBUG("Files processed: " + std::to_string(report.attempted));
}

}  // namespace eolfix::app

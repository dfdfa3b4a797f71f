#include "runtime/newline_runner.hpp"

#include <utility>
#include "input/path_extractor.hpp"
#include "tools/newline_normalizer.hpp"

namespace eolfix::runtime {

using protocol::FileOutcome;
using protocol::FileReport;
using protocol::RunReport;

protocol::RunReport NewlineRunner::run(const std::string& raw,
                                       const policy::PatternFilter& filter,
                                       RunObserver& observer) const {
    const input::PathExtractor extractor;
    const auto extraction = extractor.extract_detailed(raw);
    observer.on_input(raw, extraction);

    RunReport report;
    report.total = extraction.paths.size();
    report.results.reserve(extraction.paths.size());

    const tools::NewlineNormalizer normalizer;
    std::size_t index = 0;
    for (const auto& path : extraction.paths) {
        FileReport file_report;
        file_report.index = ++index;
        file_report.total = report.total;
        file_report.path = path;

        if (!filter.should_process(path)) {
            file_report.outcome = FileOutcome::SkippedFilteredOut;
        } else {
            ++report.attempted;
            auto normalized = normalizer.normalize(path);
            if (core::errors::is_error(normalized)) {
                file_report.outcome = FileOutcome::Failed;
                file_report.error = core::errors::get_error(normalized);
            } else {
                file_report.outcome = core::errors::get_value(normalized);
            }
        }

        observer.on_file(file_report);
        report.results.push_back(std::move(file_report));
    }

    observer.on_summary(report);
    return report;
}

}  // namespace eolfix::runtime

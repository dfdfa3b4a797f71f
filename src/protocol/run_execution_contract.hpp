#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/fix_errors.hpp"

namespace eolfix::protocol {

enum class FileOutcome {
    SkippedNotFound,
    SkippedEmpty,
    SkippedFilteredOut,
    Unchanged,
    Repaired,
    Failed
};

struct FileReport {
    std::size_t index = 0;  // 1-based position in the extracted path list
    std::size_t total = 0;
    std::string path;
    FileOutcome outcome = FileOutcome::Unchanged;
    std::optional<core::errors::FixError> error;  // set only for Failed
};

struct RunReport {
    std::vector<FileReport> results;
    std::size_t total = 0;
    std::size_t attempted = 0;
};

inline std::string to_string(const FileOutcome outcome) {
    switch (outcome) {
        case FileOutcome::SkippedNotFound:
            return "skipped_not_found";
        case FileOutcome::SkippedEmpty:
            return "skipped_empty";
        case FileOutcome::SkippedFilteredOut:
            return "skipped_filtered_out";
        case FileOutcome::Unchanged:
            return "unchanged";
        case FileOutcome::Repaired:
            return "repaired";
        case FileOutcome::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

}  // namespace eolfix::protocol

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "runtime/newline_runner.hpp"

namespace eolfix::app {

constexpr std::size_t kMaxPreviewLines = 3;

// Debug preview of the raw input: short input is shown whole, longer input
// keeps the first line and the last lines around an omission marker.
std::vector<std::string> preview_lines(const std::vector<std::string>& lines,
                                       std::size_t max_lines = kMaxPreviewLines);

// Renders run events through the global Logger.
class ConsoleReporter : public runtime::RunObserver {
public:
    void on_input(const std::string& raw,
                  const protocol::ExtractionResult& extraction) override;
    void on_file(const protocol::FileReport& report) override;
    void on_summary(const protocol::RunReport& report) override;
};

}  // namespace eolfix::app

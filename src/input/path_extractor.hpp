#pragma once

#include <optional>
#include <string>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace eolfix::input {

// Turns whatever the editing tool piped in into an ordered list of paths.
// A {"tool_input": {...}} object is read structurally; anything else is
// treated as one path per line. Never fails: bad input yields an empty list.
class PathExtractor {
public:
    std::vector<std::string> extract(const std::string& raw) const;

    protocol::ExtractionResult extract_detailed(const std::string& raw) const;

    // nullopt when the text is not a JSON object with a tool_input object.
    static std::optional<protocol::ToolInput> parse_tool_input(
        const std::string& text);

    static std::vector<std::string> collect_paths(
        const protocol::ToolInput& tool_input);

    static std::vector<std::string> non_blank_lines(const std::string& text);
};

}  // namespace eolfix::input

#include "input/path_extractor.hpp"

#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace eolfix::input {

using nlohmann::json;
using protocol::ExtractionResult;
using protocol::InputSource;
using protocol::ToolInput;

namespace {

constexpr const char* kWhitespace = " \t\r\n\f\v";

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(kWhitespace);
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(kWhitespace);
    return value.substr(begin, end - begin + 1);
}

std::string non_empty_string(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}  // namespace

std::vector<std::string> PathExtractor::non_blank_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = trim(line);
        if (!trimmed.empty()) {
            lines.push_back(std::move(trimmed));
        }
    }
    return lines;
}

std::optional<ToolInput> PathExtractor::parse_tool_input(const std::string& text) {
    const json document = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded() || !document.is_object()) {
        return std::nullopt;
    }

    const auto tool_input = document.find("tool_input");
    if (tool_input == document.end() || !tool_input->is_object()) {
        return std::nullopt;
    }

    ToolInput parsed;
    parsed.path = non_empty_string(*tool_input, "path");
    parsed.file_path = non_empty_string(*tool_input, "file_path");

    const auto paths = tool_input->find("paths");
    if (paths != tool_input->end() && paths->is_array()) {
        for (const auto& element : *paths) {
            if (!element.is_string()) {
                continue;
            }
            auto value = element.get<std::string>();
            if (!value.empty()) {
                parsed.paths.push_back(std::move(value));
            }
        }
    }
    return parsed;
}

std::vector<std::string> PathExtractor::collect_paths(const ToolInput& tool_input) {
    std::vector<std::string> paths;
    if (!tool_input.path.empty()) {
        paths.push_back(tool_input.path);
    }
    if (!tool_input.file_path.empty()) {
        paths.push_back(tool_input.file_path);
    }
    for (const auto& path : tool_input.paths) {
        if (!path.empty()) {
            paths.push_back(path);
        }
    }
    return paths;
}

ExtractionResult PathExtractor::extract_detailed(const std::string& raw) const {
    ExtractionResult result;
    const std::string trimmed = trim(raw);
    if (trimmed.empty()) {
        return result;
    }

    const auto lines = non_blank_lines(trimmed);
    std::string joined;
    for (const auto& line : lines) {
        if (!joined.empty()) {
            joined.push_back('\n');
        }
        joined += line;
    }

    // A tool call with no usable path is still a tool call: an empty result
    // here must not be reread as a list of bare paths.
    if (const auto tool_input = parse_tool_input(joined)) {
        result.source = InputSource::ToolCall;
        result.paths = collect_paths(*tool_input);
        return result;
    }

    result.source = InputSource::PlainText;
    result.paths = lines;
    return result;
}

std::vector<std::string> PathExtractor::extract(const std::string& raw) const {
    return extract_detailed(raw).paths;
}

}  // namespace eolfix::input

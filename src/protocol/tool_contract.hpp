#pragma once
#include <string>
#include <vector>

namespace eolfix::protocol {

    // Where the extracted paths came from
    enum class InputSource {
        Empty,      // Blank input, nothing to parse
        ToolCall,   // {"tool_input": {...}} payload from the editing tool
        PlainText   // One path per line
    };

    // The fields of a tool call that can name written files.
    // Edit/Write send file_path, MultiEdit-style calls send paths.
    struct ToolInput {
        std::string path;
        std::string file_path;
        std::vector<std::string> paths;
    };

    struct ExtractionResult {
        std::vector<std::string> paths;
        InputSource source = InputSource::Empty;
    };

    inline std::string to_string(const InputSource source) {
        switch (source) {
            case InputSource::Empty:
                return "empty";
            case InputSource::ToolCall:
                return "tool_call";
            case InputSource::PlainText:
                return "plain_text";
            default:
                return "unknown";
        }
    }

} // namespace eolfix::protocol

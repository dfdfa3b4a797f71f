#pragma once
#include <istream>
#include <string>

namespace eolfix::app {
    // True when stdin is a pipe or file rather than an interactive terminal.
    bool stdin_has_input();

    // Reads the stream to its end in one go.
    std::string read_all(std::istream& in);
}

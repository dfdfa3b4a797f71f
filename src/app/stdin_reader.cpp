#include "app/stdin_reader.hpp"

#include <iterator>
#include <unistd.h>

namespace eolfix::app {

    bool stdin_has_input() {
        return isatty(STDIN_FILENO) == 0;
    }

    std::string read_all(std::istream& in) {
        return std::string(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
    }

} // namespace eolfix::app

#pragma once
#include <string>
#include <vector>

namespace eolfix::protocol {

    // Include and exclude globs. At most one of the two lists may be non-empty.
    struct PatternSet {
        std::vector<std::string> include;
        std::vector<std::string> exclude;
    };

    // Represents the validated command line for one hook invocation
    struct RunConfig {
        bool debug = false;
        bool silent = false;
        bool show_help = false;
        bool show_version = false;
        PatternSet patterns;
    };

} // namespace eolfix::protocol

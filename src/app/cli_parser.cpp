#include "cli_parser.hpp"
#include <optional>
#include <vector>
#include "policy/pattern_filter.hpp"

namespace eolfix::app::cli {

    using namespace eolfix::core::errors;
    using eolfix::protocol::RunConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> exclude;
        std::optional<std::string> include;
        bool debug = false;
        bool silent = false;
        bool help = false;
        bool version = false;
    };

    std::string usage(const std::string& program_name) {
        return "eolfix - adds a missing trailing newline to files an editing tool just wrote\n"
               "Designed to run as a post-write hook; reads a tool call or a path list from stdin.\n"
               "\n"
               "Usage: " + program_name + " [options] < input.json\n"
               "\n"
               "Options:\n"
               "  -d, --debug      Enable debug output\n"
               "  -s, --silent     Silent mode - no output\n"
               "  -v, --version    Show version information\n"
               "  -h, --help       Show this help message\n"
               "  -e, --exclude    Exclude files matching glob patterns (comma-separated)\n"
               "  -i, --include    Include only files matching glob patterns (comma-separated)\n";
    }

    Result<RunConfig> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::string name = args[i];
            std::optional<std::string> inline_value;
            const auto equals = name.find('=');
            if (name.rfind("--", 0) == 0 && equals != std::string::npos) {
                inline_value = name.substr(equals + 1);
                name = name.substr(0, equals);
            }

            if (name == "-e" || name == "--exclude" || name == "-i" || name == "--include") {
                std::string value;
                if (inline_value) value = inline_value.value();
                else if (i + 1 < args.size()) value = args[++i];
                else return FixError{ErrorCategory::Input, "Missing value for " + name, "missing_value"};

                if (name == "-e" || name == "--exclude") raw.exclude = value;
                else raw.include = value;
                continue;
            }

            if (inline_value) {
                return FixError{ErrorCategory::Input, "Flag does not take a value: " + name, "unexpected_value"};
            }
            if (name == "-d" || name == "--debug") {
                raw.debug = true;
            } else if (name == "-s" || name == "--silent") {
                raw.silent = true;
            } else if (name == "-v" || name == "--version") {
                raw.version = true;
            } else if (name == "-h" || name == "--help") {
                raw.help = true;
            } else {
                return FixError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", "Run with --help to list the supported flags."};
            }
        }

        // 3. Validator Phase: Normalize values. Include/exclude exclusivity is
        // checked by PatternFilter::create, after help and version are handled.
        RunConfig config;
        config.debug = raw.debug;
        config.silent = raw.silent;
        config.show_help = raw.help;
        config.show_version = raw.version;

        if (raw.exclude) config.patterns.exclude = policy::split_patterns(raw.exclude.value());
        if (raw.include) config.patterns.include = policy::split_patterns(raw.include.value());

        return config;
    }

} // namespace eolfix::app::cli

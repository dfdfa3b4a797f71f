#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/console_reporter.hpp"
#include "app/stdin_reader.hpp"
#include "core/config/build_info.hpp"
#include "core/errors/fix_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/pattern_filter.hpp"
#include "runtime/newline_runner.hpp"

int main(int argc, char* argv[]) {
    using eolfix::core::logging::LogLevel;
    using eolfix::core::logging::Logger;

    const std::string program_name = argc > 0 ? argv[0] : "eolfix";

    // 1. Parse CLI input and return normalized input errors
    auto parsed = eolfix::app::cli::parse_and_validate(argc, argv);
    if (eolfix::core::errors::is_error(parsed)) {
        const auto& err = eolfix::core::errors::get_error(parsed);
        LOG_ERROR("Error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_ERROR("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& config = eolfix::core::errors::get_value(parsed);
    if (config.show_version) {
        std::cout << eolfix::core::config::version_banner(
                         eolfix::core::config::current_build_info())
                  << std::endl;
        return 0;
    }
    if (config.show_help) {
        std::cerr << eolfix::app::cli::usage(program_name);
        return 0;
    }

    // 2. Configure the global logger from the flags
    Logger::get().configure(config.debug ? LogLevel::DEBUG : LogLevel::INFO,
                            config.silent);

    // Configuration errors abort before any file is touched
    auto filter = eolfix::policy::PatternFilter::create(config.patterns);
    if (eolfix::core::errors::is_error(filter)) {
        const auto& err = eolfix::core::errors::get_error(filter);
        LOG_ERROR("Error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_ERROR("Hint: " + err.hint);
        }
        return 1;
    }

    // 3. Read the whole input once, then run the pipeline over it
    std::string raw_input;
    if (eolfix::app::stdin_has_input()) {
        raw_input = eolfix::app::read_all(std::cin);
    } else {
        LOG_DEBUG("No stdin input available");
    }

    eolfix::app::ConsoleReporter reporter;
    eolfix::runtime::NewlineRunner runner;
    const auto report = runner.run(raw_input, eolfix::core::errors::get_value(filter),
                                   reporter);

    // Per-file failures were reported by the reporter and do not change the exit code.
    LOG_DEBUG("Run finished: " + std::to_string(report.attempted) + " of " +
              std::to_string(report.total) + " files checked");
    return 0;
}

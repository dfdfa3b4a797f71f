#pragma once
#include <string>
#include "protocol/run_request.hpp"
#include "core/errors/fix_errors.hpp"

namespace eolfix::app::cli {
    eolfix::core::errors::Result<eolfix::protocol::RunConfig> parse_and_validate(int argc, char* argv[]);

    std::string usage(const std::string& program_name);
}

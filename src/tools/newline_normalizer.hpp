#pragma once

#include <string>
#include "core/errors/fix_errors.hpp"
#include "protocol/run_execution_contract.hpp"

namespace eolfix::tools {

constexpr char kNewlineByte = 0x0a;

// Makes sure one file ends with '\n' by looking only at its last byte.
// Missing and empty files are skipped and never opened for writing.
// I/O failures come back as Io errors; nothing is retried.
class NewlineNormalizer {
public:
    core::errors::Result<protocol::FileOutcome> normalize(
        const std::string& path) const;
};

}  // namespace eolfix::tools

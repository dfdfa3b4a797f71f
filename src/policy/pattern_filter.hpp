#pragma once

#include <string>
#include <vector>
#include "core/errors/fix_errors.hpp"
#include "protocol/run_request.hpp"

namespace eolfix::policy {

// Shell-glob match of one pattern against a path. Patterns without a '/'
// are also tried against the base name. Malformed patterns never match.
bool matches_glob(const std::string& pattern, const std::string& path);

// Splits "*.go, *.rs,," into {"*.go", "*.rs"}.
std::vector<std::string> split_patterns(const std::string& text);

class PatternFilter {
public:
    // Fails with a Config error when both include and exclude are set.
    static core::errors::Result<PatternFilter> create(protocol::PatternSet patterns);

    bool should_process(const std::string& path) const;

private:
    explicit PatternFilter(protocol::PatternSet patterns);

    static bool matches_any(const std::vector<std::string>& patterns,
                            const std::string& path);

    protocol::PatternSet patterns_;
};

}  // namespace eolfix::policy

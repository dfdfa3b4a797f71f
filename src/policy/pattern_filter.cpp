#include "policy/pattern_filter.hpp"

#include <cstddef>
#include <fnmatch.h>
#include <sstream>
#include <utility>

namespace eolfix::policy {

using core::errors::ErrorCategory;
using core::errors::FixError;

namespace {

std::string base_name(const std::string& path) {
    std::string trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    const auto slash = trimmed.find_last_of('/');
    if (slash == std::string::npos || trimmed.size() == 1) {
        return trimmed;
    }
    return trimmed.substr(slash + 1);
}

// glibc fnmatch reads a broken class as literal text; such patterns must
// match nothing instead. Rejects an unterminated or empty [...] class and a
// dangling escape.
bool is_well_formed(const std::string& pattern) {
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\') {
            if (++i == pattern.size()) {
                return false;
            }
            continue;
        }
        if (pattern[i] != '[') {
            continue;
        }

        ++i;
        if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
            ++i;
        }
        if (i >= pattern.size() || pattern[i] == ']') {
            return false;
        }
        while (i < pattern.size() && pattern[i] != ']') {
            if (pattern[i] == '\\' && ++i == pattern.size()) {
                return false;
            }
            ++i;
        }
        if (i == pattern.size()) {
            return false;
        }
    }
    return true;
}

bool fnmatch_path(const std::string& pattern, const std::string& subject) {
    return fnmatch(pattern.c_str(), subject.c_str(), FNM_PATHNAME) == 0;
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

}  // namespace

bool matches_glob(const std::string& pattern, const std::string& path) {
    if (pattern.empty() || !is_well_formed(pattern)) {
        return false;
    }
    if (fnmatch_path(pattern, path)) {
        return true;
    }
    if (pattern.find('/') != std::string::npos) {
        return false;
    }
    return fnmatch_path(pattern, base_name(path));
}

std::vector<std::string> split_patterns(const std::string& text) {
    std::vector<std::string> patterns;
    std::istringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        std::string trimmed = trim(item);
        if (!trimmed.empty()) {
            patterns.push_back(std::move(trimmed));
        }
    }
    return patterns;
}

PatternFilter::PatternFilter(protocol::PatternSet patterns)
    : patterns_(std::move(patterns)) {}

core::errors::Result<PatternFilter> PatternFilter::create(
    protocol::PatternSet patterns) {
    if (!patterns.include.empty() && !patterns.exclude.empty()) {
        return FixError{ErrorCategory::Config,
                        "--exclude and --include are mutually exclusive",
                        "conflicting_patterns",
                        "Pass either --include or --exclude, not both."};
    }
    return PatternFilter(std::move(patterns));
}

bool PatternFilter::matches_any(const std::vector<std::string>& patterns,
                                const std::string& path) {
    for (const auto& pattern : patterns) {
        if (matches_glob(pattern, path)) {
            return true;
        }
    }
    return false;
}

bool PatternFilter::should_process(const std::string& path) const {
    if (!patterns_.include.empty() && !matches_any(patterns_.include, path)) {
        return false;
    }
    if (!patterns_.exclude.empty() && matches_any(patterns_.exclude, path)) {
        return false;
    }
    return true;
}

}  // namespace eolfix::policy

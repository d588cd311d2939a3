#pragma once
#include "utils.hpp"
#include <string>
#include <vector>

namespace agentsync {

// True if `pattern` contains any of the wildcard characters * ? [
bool has_wildcard(const std::string& pattern);

// Shell-style match of one path component: *, ?, [abc], [!abc], [a-z].
bool wildcard_match(const std::string& pattern, const std::string& name);

// Expands a path pattern against the filesystem. A "**" component matches
// zero or more directories. Hidden entries only match patterns starting
// with '.'. Results are sorted.
std::vector<fs::path> expand_glob(const std::string& pattern);

} // namespace agentsync

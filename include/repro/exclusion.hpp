#pragma once

#include <string>
#include <vector>

namespace repro {

// ============================================================================
// Path Patterns
// ============================================================================
//
// Pattern forms, all matched against forward-slash relative paths:
//   "lib/runtime/legal/"   directory prefix (trailing slash)
//   "lib/*.so"             '*' matches within one path segment
//   "lib/**/*.class"       '**' matches any number of segments
//   "file?.txt"            '?' matches one non-'/' character
//   "*.exe"                no '/' at all: matched against the file name only

// Glob match of a whole path. '*' and '?' never cross '/'.
bool glob_match(const std::string& pattern, const std::string& path);

// Match one pattern using the rules above
bool path_matches(const std::string& pattern, const std::string& path);

// Returns an error message for an unusable pattern, empty if valid
std::string validate_pattern(const std::string& pattern);

// ============================================================================
// Path Matcher
// ============================================================================

// A set of patterns; a path matches if any pattern matches.
// Used for exclusion rules and for the signed-file list.
class PathMatcher {
public:
    PathMatcher() = default;
    explicit PathMatcher(std::vector<std::string> patterns);

    bool matches(const std::string& path) const;

    // The first pattern matching path, or empty
    std::string matching_pattern(const std::string& path) const;

    void add(const std::string& pattern) { patterns_.push_back(pattern); }
    bool empty() const { return patterns_.empty(); }
    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    std::vector<std::string> patterns_;
};

} // namespace repro

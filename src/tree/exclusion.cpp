#include "repro/exclusion.hpp"

namespace repro {

namespace {

bool match_from(const std::string& p, size_t pi, const std::string& s, size_t si) {
    while (pi < p.size()) {
        char c = p[pi];

        if (c == '*') {
            bool double_star = pi + 1 < p.size() && p[pi + 1] == '*';
            if (double_star) {
                size_t next = pi + 2;
                if (next < p.size() && p[next] == '/') {
                    // "**/" matches zero or more whole directories
                    for (size_t k = si; k <= s.size(); ++k) {
                        if ((k == si || s[k - 1] == '/') && match_from(p, next + 1, s, k)) {
                            return true;
                        }
                    }
                    return false;
                }
                for (size_t k = si; k <= s.size(); ++k) {
                    if (match_from(p, next, s, k)) return true;
                }
                return false;
            }

            for (size_t k = si; k <= s.size(); ++k) {
                if (match_from(p, pi + 1, s, k)) return true;
                if (k < s.size() && s[k] == '/') break;
            }
            return false;
        }

        if (si >= s.size()) return false;

        if (c == '?') {
            if (s[si] == '/') return false;
        } else if (c != s[si]) {
            return false;
        }
        ++pi;
        ++si;
    }
    return si == s.size();
}

std::string base_name(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_from(pattern, 0, path, 0);
}

bool path_matches(const std::string& pattern, const std::string& path) {
    if (pattern.empty()) return false;

    if (pattern.back() == '/') {
        if (pattern.find_first_of("*?") == std::string::npos) {
            return path.compare(0, pattern.size(), pattern) == 0;
        }
        return glob_match(pattern + "**", path);
    }

    if (pattern.find('/') == std::string::npos) {
        return glob_match(pattern, base_name(path));
    }

    return glob_match(pattern, path);
}

std::string validate_pattern(const std::string& pattern) {
    if (pattern.empty()) {
        return "empty pattern";
    }
    if (pattern.front() == '/') {
        return "pattern must be relative: " + pattern;
    }
    if (pattern.find('\\') != std::string::npos) {
        return "pattern must use forward slashes: " + pattern;
    }
    return "";
}

// ============================================================================
// PathMatcher
// ============================================================================

PathMatcher::PathMatcher(std::vector<std::string> patterns)
    : patterns_(std::move(patterns)) {}

bool PathMatcher::matches(const std::string& path) const {
    return !matching_pattern(path).empty();
}

std::string PathMatcher::matching_pattern(const std::string& path) const {
    for (const auto& pattern : patterns_) {
        if (path_matches(pattern, path)) {
            return pattern;
        }
    }
    return "";
}

} // namespace repro

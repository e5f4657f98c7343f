#pragma once

#include "repro/exclusion.hpp"
#include "repro/file_tree.hpp"
#include "repro/types.hpp"

#include <string>
#include <vector>

namespace repro {

// ============================================================================
// Diff Entries
// ============================================================================

struct DiffEntry {
    std::string path;
    PathClass classification = PathClass::Match;
    std::string detail;  // e.g. unreadable file, signature fallback
};

struct DiffResult {
    bool ok = false;
    std::string error;  // set on an invariant violation (unsorted input)
    std::vector<DiffEntry> entries;

    size_t count(PathClass c) const;
    size_t difference_count() const;  // everything that is not Match
};

inline bool is_difference(const DiffEntry& e) {
    return e.classification != PathClass::Match;
}

// ============================================================================
// Sorted Merge
// ============================================================================

// Two-pointer merge of two strictly increasing path lists (a = built,
// b = official). Entries come out in merge order. Returns ok == false if
// either list is unsorted or has duplicates.
DiffResult diff_sorted_paths(const std::vector<std::string>& built,
                             const std::vector<std::string>& official);

// ============================================================================
// File and Tree Comparison
// ============================================================================

struct FileComparison {
    bool ok = false;              // both digests were computed
    std::string error;
    std::string built_digest;
    std::string official_digest;
    bool match = false;
    std::vector<std::string> notes;
};

// Hash two files, optionally stripping signatures first
FileComparison compare_files(const std::string& built_file,
                             const std::string& official_file,
                             bool normalize_signature);

struct CompareOptions {
    unsigned jobs = 1;
    bool content_check = true;
    std::vector<std::string> skip_content;  // compared structurally only
    PathMatcher signed_files;
};

// Merge the path lists, then hash every Match pair and reclassify unequal
// pairs as ContentDiffers.
DiffResult compare_trees(const ArtifactTree& built,
                         const ArtifactTree& official,
                         const CompareOptions& options);

// ============================================================================
// Exclusions
// ============================================================================

struct ExclusionSplit {
    std::vector<DiffEntry> counted;   // differences that affect the verdict
    std::vector<DiffEntry> excluded;  // informational only
};

// Partition the differences of a diff; Match entries are dropped
ExclusionSplit filter_exclusions(const std::vector<DiffEntry>& entries,
                                 const PathMatcher& rules);

} // namespace repro

#pragma once

#include "repro/archive.hpp"
#include "repro/tree_diff.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace repro {

// ============================================================================
// Container Deep Inspection
// ============================================================================

constexpr size_t DEFAULT_DISPLAY_LIMIT = 20;

struct InspectOptions {
    size_t display_limit = DEFAULT_DISPLAY_LIMIT;
    unsigned jobs = 1;
    PathMatcher signed_files;
};

struct InspectionResult {
    bool ok = false;                     // both sides extracted
    std::string error;                   // extraction failure reason
    size_t diff_count = 0;
    std::vector<std::string> diff_paths; // first display_limit, merge order
    size_t built_files = 0;
    size_t official_files = 0;
};

// Extract both containers into private scratch directories and compare the
// extracted trees by path and content. Scratch directories are removed before
// returning. A container whose contents match passes even if the container
// files themselves differ.
InspectionResult deep_inspect(const std::string& built_container,
                              const std::string& official_container,
                              const ArchiveExtractor& extractor,
                              const InspectOptions& options = {});

} // namespace repro

#include "repro/tree_diff.hpp"
#include "repro/hasher.hpp"
#include "repro/platform.hpp"
#include "repro/signature.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace repro {

namespace {

// Returns the first index violating strict ordering, or list.size()
size_t find_order_violation(const std::vector<std::string>& list) {
    for (size_t i = 1; i < list.size(); ++i) {
        if (!(list[i - 1] < list[i])) {
            return i;
        }
    }
    return list.size();
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

size_t DiffResult::count(PathClass c) const {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
        [c](const DiffEntry& e) { return e.classification == c; }));
}

size_t DiffResult::difference_count() const {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(), is_difference));
}

// ============================================================================
// Sorted Merge
// ============================================================================

DiffResult diff_sorted_paths(const std::vector<std::string>& built,
                             const std::vector<std::string>& official) {
    DiffResult result;

    size_t bad = find_order_violation(built);
    if (bad != built.size()) {
        result.error = "built path list not strictly sorted at '" + built[bad] + "'";
        return result;
    }
    bad = find_order_violation(official);
    if (bad != official.size()) {
        result.error = "official path list not strictly sorted at '" + official[bad] + "'";
        return result;
    }

    result.entries.reserve(std::max(built.size(), official.size()));

    size_t i = 0;
    size_t j = 0;
    while (i < built.size() && j < official.size()) {
        const auto& a = built[i];
        const auto& b = official[j];
        if (a == b) {
            result.entries.push_back({a, PathClass::Match, ""});
            ++i;
            ++j;
        } else if (a < b) {
            result.entries.push_back({a, PathClass::MissingInOfficial, ""});
            ++i;
        } else {
            result.entries.push_back({b, PathClass::MissingInBuilt, ""});
            ++j;
        }
    }
    for (; i < built.size(); ++i) {
        result.entries.push_back({built[i], PathClass::MissingInOfficial, ""});
    }
    for (; j < official.size(); ++j) {
        result.entries.push_back({official[j], PathClass::MissingInBuilt, ""});
    }

    result.ok = true;
    return result;
}

// ============================================================================
// File Comparison
// ============================================================================

FileComparison compare_files(const std::string& built_file,
                             const std::string& official_file,
                             bool normalize_signature) {
    FileComparison result;

    HashResult built_hash;
    HashResult official_hash;

    if (normalize_signature) {
        auto built = normalize_signed_file(built_file);
        auto official = normalize_signed_file(official_file);
        if (!built.ok || !official.ok) {
            result.error = !built.ok ? built.error : official.error;
            return result;
        }
        if (!built.warning.empty()) {
            result.notes.push_back("built: " + built.warning);
        }
        if (!official.warning.empty()) {
            result.notes.push_back("official: " + official.warning);
        }
        if (built.stripped || official.stripped) {
            result.notes.push_back("signature removed before comparison");
        }
        built_hash = compute_sha256(built.data);
        official_hash = compute_sha256(official.data);
    } else {
        built_hash = compute_sha256(built_file);
        official_hash = compute_sha256(official_file);
    }

    if (!built_hash.ok) {
        result.error = built_hash.error;
        return result;
    }
    if (!official_hash.ok) {
        result.error = official_hash.error;
        return result;
    }

    result.built_digest = built_hash.hex_digest;
    result.official_digest = official_hash.hex_digest;
    result.match = result.built_digest == result.official_digest;
    result.ok = true;
    return result;
}

// ============================================================================
// Tree Comparison
// ============================================================================

DiffResult compare_trees(const ArtifactTree& built,
                         const ArtifactTree& official,
                         const CompareOptions& options) {
    DiffResult result = diff_sorted_paths(built.paths, official.paths);
    if (!result.ok || !options.content_check) {
        return result;
    }

    std::vector<size_t> plain_index;
    std::vector<std::string> plain_paths;
    std::vector<size_t> signed_index;

    for (size_t k = 0; k < result.entries.size(); ++k) {
        const auto& entry = result.entries[k];
        if (entry.classification != PathClass::Match) continue;
        if (contains(options.skip_content, entry.path)) continue;

        if (options.signed_files.matches(entry.path)) {
            signed_index.push_back(k);
        } else {
            plain_index.push_back(k);
            plain_paths.push_back(entry.path);
        }
    }

    auto built_digests = hash_files(built.root, plain_paths, options.jobs);
    auto official_digests = hash_files(official.root, plain_paths, options.jobs);

    for (size_t n = 0; n < plain_index.size(); ++n) {
        auto& entry = result.entries[plain_index[n]];
        const auto& a = built_digests[n];
        const auto& b = official_digests[n];
        if (!a.ok || !b.ok) {
            entry.classification = PathClass::ContentDiffers;
            entry.detail = "no digest: " + (!a.ok ? a.error : b.error);
            spdlog::error("{}: {}", entry.path, entry.detail);
        } else if (a.hex_digest != b.hex_digest) {
            entry.classification = PathClass::ContentDiffers;
        }
    }

    for (size_t k : signed_index) {
        auto& entry = result.entries[k];
        auto cmp = compare_files(join_path(built.root, entry.path),
                                 join_path(official.root, entry.path), true);
        if (!cmp.ok) {
            entry.classification = PathClass::ContentDiffers;
            entry.detail = "no digest: " + cmp.error;
            spdlog::error("{}: {}", entry.path, entry.detail);
            continue;
        }
        if (!cmp.match) {
            entry.classification = PathClass::ContentDiffers;
        }
        for (const auto& note : cmp.notes) {
            if (!entry.detail.empty()) entry.detail += "; ";
            entry.detail += note;
        }
    }

    spdlog::debug("{} vs {}: {} entries, {} differences", built.name, official.name,
                  result.entries.size(), result.difference_count());
    return result;
}

// ============================================================================
// Exclusions
// ============================================================================

ExclusionSplit filter_exclusions(const std::vector<DiffEntry>& entries,
                                 const PathMatcher& rules) {
    ExclusionSplit split;
    for (const auto& entry : entries) {
        if (!is_difference(entry)) continue;
        if (rules.matches(entry.path)) {
            split.excluded.push_back(entry);
        } else {
            split.counted.push_back(entry);
        }
    }
    return split;
}

} // namespace repro

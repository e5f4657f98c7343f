#include "repro/deep_inspect.hpp"
#include "repro/file_tree.hpp"
#include "repro/platform.hpp"

#include <spdlog/spdlog.h>

namespace repro {

InspectionResult deep_inspect(const std::string& built_container,
                              const std::string& official_container,
                              const ArchiveExtractor& extractor,
                              const InspectOptions& options) {
    InspectionResult result;

    ScratchDirectory built_dir(extractor.name() + "-built");
    if (!built_dir.ok()) {
        result.error = built_dir.error();
        return result;
    }
    ScratchDirectory official_dir(extractor.name() + "-official");
    if (!official_dir.ok()) {
        result.error = official_dir.error();
        return result;
    }

    auto built_extract = extractor.extract(built_container, built_dir.path());
    if (!built_extract.ok) {
        result.error = "failed to extract built " + get_filename(built_container) +
                       ": " + built_extract.error;
        return result;
    }
    auto official_extract = extractor.extract(official_container, official_dir.path());
    if (!official_extract.ok) {
        result.error = "failed to extract official " + get_filename(official_container) +
                       ": " + official_extract.error;
        return result;
    }

    auto built_tree = list_artifact_tree("built:" + get_filename(built_container),
                                         built_dir.path());
    if (!built_tree.ok) {
        result.error = built_tree.error;
        return result;
    }
    auto official_tree = list_artifact_tree("official:" + get_filename(official_container),
                                            official_dir.path());
    if (!official_tree.ok) {
        result.error = official_tree.error;
        return result;
    }

    CompareOptions compare;
    compare.jobs = options.jobs;
    compare.signed_files = options.signed_files;

    auto diff = compare_trees(built_tree.tree, official_tree.tree, compare);
    if (!diff.ok) {
        result.error = diff.error;
        return result;
    }

    result.built_files = built_tree.tree.size();
    result.official_files = official_tree.tree.size();

    for (const auto& entry : diff.entries) {
        if (!is_difference(entry)) continue;
        ++result.diff_count;
        if (result.diff_paths.size() < options.display_limit) {
            result.diff_paths.push_back(entry.path);
        }
    }

    spdlog::debug("{}: {} vs {} extracted files, {} differ", get_filename(built_container),
                  result.built_files, result.official_files, result.diff_count);

    result.ok = true;
    return result;
}

} // namespace repro

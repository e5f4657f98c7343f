#include "repro/engine.hpp"
#include "repro/archive.hpp"
#include "repro/deep_inspect.hpp"
#include "repro/exclusion.hpp"
#include "repro/file_tree.hpp"
#include "repro/platform.hpp"
#include "repro/tree_diff.hpp"

#include <exception>
#include <filesystem>
#include <memory>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace repro {

namespace {

// ============================================================================
// Artifact Roots
// ============================================================================

struct ResolvedRoot {
    bool ok = false;
    std::string error;
    std::string dir;
    std::string bundle;  // the .tar.gz the tree came from, if any
    std::unique_ptr<ScratchDirectory> scratch;
};

// A bundle holding exactly one top-level directory is rooted at it
std::string descend_single_directory(const std::string& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return dir;

    std::string only;
    size_t count = 0;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return dir;
        if (++count > 1) return dir;
        std::error_code status_ec;
        if (!it->is_directory(status_ec) || it->is_symlink(status_ec)) return dir;
        only = to_portable_path(it->path().string());
    }
    return count == 1 ? only : dir;
}

ResolvedRoot resolve_root(const std::string& name, const std::string& root) {
    ResolvedRoot resolved;

    if (root.empty()) {
        resolved.error = name + " root not specified";
        return resolved;
    }

    if (is_regular_file(root) && is_tar_gz_path(root)) {
        resolved.scratch = std::make_unique<ScratchDirectory>(name + "-bundle");
        if (!resolved.scratch->ok()) {
            resolved.error = resolved.scratch->error();
            return resolved;
        }
        TarGzExtractor extractor;
        auto extracted = extractor.extract(root, resolved.scratch->path());
        if (!extracted.ok) {
            resolved.error = "failed to unpack " + name + " bundle " + root + ": " +
                             extracted.error;
            return resolved;
        }
        resolved.dir = descend_single_directory(resolved.scratch->path());
        resolved.bundle = root;
        spdlog::info("{}: unpacked {} ({} files)", name, get_filename(root), extracted.file_count);
        resolved.ok = true;
        return resolved;
    }

    if (!path_exists(root)) {
        resolved.error = name + " root not found: " + root;
        return resolved;
    }
    if (!is_directory(root)) {
        resolved.error = name + " root is neither a directory nor a .tar.gz bundle: " + root;
        return resolved;
    }

    resolved.dir = root;
    resolved.ok = true;
    return resolved;
}

// ============================================================================
// Whole Artifact
// ============================================================================

FileVerdict compare_whole_artifact(const ComparisonInput& input,
                                   const ResolvedRoot& built,
                                   const ResolvedRoot& official,
                                   const ArtifactTree& built_tree,
                                   const ArtifactTree& official_tree,
                                   const PathMatcher& signed_files) {
    FileVerdict verdict;

    std::string built_file = input.built_artifact;
    std::string official_file = input.official_artifact;
    if (built_file.empty() && official_file.empty() &&
        !built.bundle.empty() && !official.bundle.empty()) {
        built_file = built.bundle;
        official_file = official.bundle;
    }

    if (!built_file.empty() && !official_file.empty()) {
        verdict.filename = get_filename(official_file);
        auto cmp = compare_files(built_file, official_file,
                                 signed_files.matches(get_filename(official_file)));
        if (!cmp.ok) {
            verdict.notes = "no digest: " + cmp.error;
            spdlog::error("whole artifact: {}", cmp.error);
            return verdict;
        }
        verdict.hash = cmp.built_digest;
        verdict.official_hash = cmp.official_digest;
        verdict.match = cmp.match;
        for (const auto& note : cmp.notes) {
            verdict.notes += verdict.notes.empty() ? note : "; " + note;
        }
        return verdict;
    }

    // No release files: compare the sha256sum manifests of both trees
    verdict.filename = input.profile.id.empty() ? "tree" : input.profile.id;
    unsigned jobs = input.profile.options.jobs;
    auto built_digest = compute_tree_digest(built_tree, jobs);
    auto official_digest = compute_tree_digest(official_tree, jobs);
    if (!built_digest.ok || !official_digest.ok) {
        verdict.notes = "no digest: " + (!built_digest.ok ? built_digest.error
                                                          : official_digest.error);
        verdict.hash = built_digest.hex_digest;
        verdict.official_hash = official_digest.hex_digest;
        return verdict;
    }
    verdict.hash = built_digest.hex_digest;
    verdict.official_hash = official_digest.hex_digest;
    verdict.match = verdict.hash == verdict.official_hash;
    verdict.notes = "tree digest";
    return verdict;
}

// ============================================================================
// Tiers
// ============================================================================

TierResult check_critical_files(const TargetProfile& profile,
                                const ArtifactTree& built,
                                const ArtifactTree& official,
                                const PathMatcher& signed_files,
                                VerdictAggregator& aggregator) {
    if (profile.critical_files.empty()) {
        return not_evaluated(Tier::CriticalBinaries, "no critical files configured");
    }

    TierResult tier;
    tier.tier = Tier::CriticalBinaries;
    tier.evaluated = true;

    size_t matched = 0;
    size_t differing = 0;
    std::vector<std::string> problems;

    for (const auto& path : profile.critical_files) {
        FileVerdict file;
        file.filename = path;

        auto built_entry = built.entry(path);
        auto official_entry = official.entry(path);
        if (!built_entry || !official_entry) {
            file.notes = !built_entry ? "missing in built" : "missing in official";
            problems.push_back(path + " " + file.notes);
            spdlog::error("critical file {}: {}", path, file.notes);
        } else if (signed_files.matches(path)) {
            auto cmp = compare_files(built_entry->absolute_path(),
                                     official_entry->absolute_path(), true);
            if (!cmp.ok) {
                file.notes = "no digest: " + cmp.error;
                problems.push_back(path + ": " + cmp.error);
                spdlog::error("critical file {}: {}", path, cmp.error);
            } else {
                file.hash = cmp.built_digest;
                file.official_hash = cmp.official_digest;
                file.match = cmp.match;
                for (const auto& note : cmp.notes) {
                    file.notes += file.notes.empty() ? note : "; " + note;
                }
            }
        } else {
            const HashResult& b = built_entry->digest();
            const HashResult& o = official_entry->digest();
            if (!b.ok || !o.ok) {
                std::string error = !b.ok ? b.error : o.error;
                file.notes = "no digest: " + error;
                problems.push_back(path + ": " + error);
                spdlog::error("critical file {}: {}", path, error);
            } else {
                file.hash = b.hex_digest;
                file.official_hash = o.hex_digest;
                file.match = b.hex_digest == o.hex_digest;
            }
        }

        if (built_entry && official_entry && !file.match &&
            built_entry->size() != official_entry->size()) {
            std::string sizes = "size " + std::to_string(built_entry->size()) + " vs " +
                                std::to_string(official_entry->size()) + " bytes";
            file.notes += file.notes.empty() ? sizes : "; " + sizes;
        }
        spdlog::debug("critical file {}: {}", path, file.match ? "match" : "MISMATCH");

        if (file.match) {
            ++matched;
        } else {
            ++differing;
            if (tier.diff_paths.size() < profile.options.display_limit) {
                tier.diff_paths.push_back(path);
            }
        }
        aggregator.add_file(std::move(file));
    }

    tier.passed = differing == 0;
    tier.diff_count = differing;
    tier.detail = std::to_string(matched) + "/" + std::to_string(profile.critical_files.size()) +
                  " match";
    for (const auto& p : problems) {
        tier.detail += "; " + p;
    }
    return tier;
}

TierResult check_containers(const TargetProfile& profile,
                            const ArtifactTree& built,
                            const ArtifactTree& official,
                            const PathMatcher& signed_files,
                            VerdictAggregator& aggregator) {
    if (profile.containers.empty()) {
        return not_evaluated(Tier::Modules, "no containers configured");
    }

    TierResult tier;
    tier.tier = Tier::Modules;
    tier.evaluated = true;
    tier.passed = true;

    size_t total_diffs = 0;
    bool count_known = true;
    std::vector<std::string> details;

    for (const auto& container : profile.containers) {
        const std::string& path = container.path;

        if (!built.contains(path) || !official.contains(path)) {
            std::string reason = path + (built.contains(path) ? " missing in official"
                                                              : " missing in built");
            spdlog::error("container {}", reason);
            details.push_back(reason);
            tier.passed = false;
            count_known = false;
            continue;
        }

        std::string built_file = join_path(built.root, path);
        std::string official_file = join_path(official.root, path);

        auto outer = compare_files(built_file, official_file, false);
        if (outer.ok && outer.match) {
            details.push_back(path + ": identical");
            continue;
        }
        FileVerdict container_file;
        container_file.filename = path;
        if (outer.ok) {
            container_file.hash = outer.built_digest;
            container_file.official_hash = outer.official_digest;
            spdlog::info("{}: container hash differs, inspecting contents", path);
        }

        auto extractor = make_extractor(container.format, profile.extractors);
        if (!extractor) {
            details.push_back(path + ": no extractor for format '" + container.format + "'");
            tier.passed = false;
            count_known = false;
            continue;
        }

        InspectOptions options;
        options.display_limit = profile.options.display_limit;
        options.jobs = profile.options.jobs;
        options.signed_files = signed_files;

        auto inspection = deep_inspect(built_file, official_file, *extractor, options);
        if (!inspection.ok) {
            spdlog::error("{}: {}", path, inspection.error);
            details.push_back(path + ": " + inspection.error);
            aggregator.add_note("modules_error=" + inspection.error);
            container_file.notes = "container hash differs; " + inspection.error;
            aggregator.add_file(std::move(container_file));
            tier.passed = false;
            count_known = false;
            continue;
        }

        total_diffs += inspection.diff_count;
        for (const auto& p : inspection.diff_paths) {
            if (tier.diff_paths.size() < profile.options.display_limit) {
                tier.diff_paths.push_back(p);
            }
        }

        if (inspection.diff_count == 0) {
            details.push_back(path + ": contents identical, container hash differs");
            container_file.notes = "container hash differs; contents identical";
        } else {
            details.push_back(path + ": " + std::to_string(inspection.diff_count) +
                              " extracted files differ");
            container_file.notes = "container hash differs; " +
                                   std::to_string(inspection.diff_count) +
                                   " extracted files differ";
            tier.passed = false;
        }
        aggregator.add_file(std::move(container_file));
    }

    if (count_known) {
        tier.diff_count = total_diffs;
        aggregator.add_note("modules_diff_count=" + std::to_string(total_diffs));
    }

    for (const auto& d : details) {
        tier.detail += tier.detail.empty() ? d : "; " + d;
    }
    return tier;
}

struct FilesetOutcome {
    bool ok = false;
    std::string error;
    TierResult tier;
    size_t excluded = 0;
};

FilesetOutcome check_fileset(const TargetProfile& profile,
                             const ArtifactTree& built,
                             const ArtifactTree& official,
                             const PathMatcher& signed_files,
                             VerdictAggregator& aggregator) {
    FilesetOutcome outcome;

    CompareOptions options;
    options.jobs = profile.options.jobs;
    options.content_check = profile.options.content_check;
    options.signed_files = signed_files;
    for (const auto& c : profile.containers) {
        options.skip_content.push_back(c.path);
    }

    auto diff = compare_trees(built, official, options);
    if (!diff.ok) {
        outcome.error = diff.error;
        return outcome;
    }

    PathMatcher exclusions(profile.exclusions);
    auto split = filter_exclusions(diff.entries, exclusions);

    TierResult& tier = outcome.tier;
    tier.tier = Tier::Files;
    tier.evaluated = true;
    tier.passed = split.counted.empty();
    tier.diff_count = split.counted.size();

    for (const auto& entry : split.counted) {
        if (tier.diff_paths.size() >= profile.options.display_limit) break;
        tier.diff_paths.push_back(entry.path);
    }

    size_t missing_built = 0;
    size_t missing_official = 0;
    size_t content = 0;
    for (const auto& entry : split.counted) {
        switch (entry.classification) {
            case PathClass::MissingInBuilt: ++missing_built; break;
            case PathClass::MissingInOfficial: ++missing_official; break;
            case PathClass::ContentDiffers: ++content; break;
            default: break;
        }
    }

    tier.detail = std::to_string(built.size()) + " built, " +
                  std::to_string(official.size()) + " official";
    if (!tier.passed) {
        tier.detail += "; " + std::to_string(missing_built) + " missing in built, " +
                       std::to_string(missing_official) + " missing in official, " +
                       std::to_string(content) + " content differs";
    }

    outcome.excluded = split.excluded.size();
    if (!split.excluded.empty()) {
        spdlog::warn("{} differences in excluded paths (informational)", split.excluded.size());
        std::string listed;
        size_t shown = 0;
        for (const auto& entry : split.excluded) {
            if (shown++ == profile.options.display_limit) break;
            spdlog::debug("excluded: {} ({})", entry.path,
                          path_class_to_string(entry.classification));
            listed += listed.empty() ? entry.path : "," + entry.path;
        }
        tier.detail += "; " + std::to_string(split.excluded.size()) + " excluded: " + listed;
        aggregator.add_note("excluded_differences=" + std::to_string(split.excluded.size()) +
                            " (" + listed + ")");
    }

    if (!profile.options.content_check) {
        aggregator.add_note("content_check=false");
    }

    outcome.ok = true;
    return outcome;
}

EngineResult fail(ErrorKind kind, const std::string& error, const ComparisonInput& input) {
    EngineResult result;
    result.kind = kind;
    result.error = error;
    result.record = make_error_record(kind, error, input.profile.build_type,
                                      input.profile.architecture);
    result.record.run = input.run;
    if (kind == ErrorKind::InputError) {
        spdlog::error("{}", error);
    } else {
        spdlog::critical("{}", error);
    }
    return result;
}

} // namespace

// ============================================================================
// run_comparison
// ============================================================================

namespace {

EngineResult run_pipeline(const ComparisonInput& input) {
    const TargetProfile& profile = input.profile;

    std::string invalid = validate_target_profile(profile);
    if (!invalid.empty()) {
        return fail(ErrorKind::InputError, invalid, input);
    }

    if (input.built_artifact.empty() != input.official_artifact.empty()) {
        return fail(ErrorKind::InputError,
                    "built and official artifacts must be given together", input);
    }

    auto built_root = resolve_root("built", input.built_root);
    if (!built_root.ok) {
        return fail(ErrorKind::InputError, built_root.error, input);
    }
    auto official_root = resolve_root("official", input.official_root);
    if (!official_root.ok) {
        return fail(ErrorKind::InputError, official_root.error, input);
    }

    auto built = list_artifact_tree("built", built_root.dir);
    if (!built.ok) {
        return fail(ErrorKind::InputError, built.error, input);
    }
    auto official = list_artifact_tree("official", official_root.dir);
    if (!official.ok) {
        return fail(ErrorKind::InputError, official.error, input);
    }

    spdlog::info("comparing {} built files against {} official files",
                 built.tree.size(), official.tree.size());

    PathMatcher signed_files(profile.signed_files);
    VerdictAggregator aggregator;

    auto step = aggregator.record(
        check_critical_files(profile, built.tree, official.tree, signed_files, aggregator));
    if (!step.ok) {
        return fail(ErrorKind::InternalError, step.error, input);
    }

    step = aggregator.record(
        check_containers(profile, built.tree, official.tree, signed_files, aggregator));
    if (!step.ok) {
        return fail(ErrorKind::InternalError, step.error, input);
    }

    auto fileset = check_fileset(profile, built.tree, official.tree, signed_files, aggregator);
    if (!fileset.ok) {
        return fail(ErrorKind::InternalError, fileset.error, input);
    }
    step = aggregator.record(fileset.tier);
    if (!step.ok) {
        return fail(ErrorKind::InternalError, step.error, input);
    }

    aggregator.set_whole_artifact(compare_whole_artifact(
        input, built_root, official_root, built.tree, official.tree, signed_files));

    FileCounts counts;
    counts.built = built.tree.size();
    counts.official = official.tree.size();
    counts.excluded = fileset.excluded;
    aggregator.set_file_counts(counts);

    auto finalized = aggregator.finalize(profile.build_type, profile.architecture, input.run);
    if (!finalized.ok) {
        return fail(ErrorKind::InternalError, finalized.error, input);
    }

    EngineResult result;
    result.ok = true;
    result.record = std::move(finalized.record);
    spdlog::info("verdict: {}", status_to_string(result.record.status));
    return result;
}

} // namespace

EngineResult run_comparison(const ComparisonInput& input) {
    try {
        return run_pipeline(input);
    } catch (const std::exception& e) {
        return fail(ErrorKind::InternalError, std::string("unexpected failure: ") + e.what(),
                    input);
    }
}

} // namespace repro

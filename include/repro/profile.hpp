#pragma once

#include "repro/archive.hpp"
#include "repro/deep_inspect.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace repro {

constexpr const char* TARGET_PROFILE_SCHEMA = "repro.target.profile.v1";

// ============================================================================
// Target Profile
// ============================================================================

struct ContainerSpec {
    std::string path;    // relative to the artifact root
    std::string format;  // extractor name: "jimage", "tar.gz", "zip", ...
};

struct ProfileOptions {
    size_t display_limit = DEFAULT_DISPLAY_LIMIT;
    unsigned jobs = 1;
    bool content_check = true;
};

// Everything that varies between verification targets. One engine runs every
// target; a target is only data.
struct TargetProfile {
    std::string schema = TARGET_PROFILE_SCHEMA;
    std::string source_path;

    std::string id;
    std::string build_type;
    std::string architecture;

    std::vector<std::string> critical_files;
    std::vector<ContainerSpec> containers;
    std::vector<std::string> exclusions;
    std::vector<std::string> signed_files;
    ExtractorTable extractors;
    ProfileOptions options;
};

struct ProfileParseResult {
    bool ok = false;
    std::string error;
    TargetProfile profile;
    std::vector<std::string> warnings;  // unknown keys, ignored values
};

// Parse a profile from JSON text
ProfileParseResult parse_target_profile(const std::string& json_str,
                                        const std::string& source_path = "");

// Read and parse a profile file
ProfileParseResult load_target_profile(const std::string& path);

// Check paths, patterns and container formats. Returns an error message, or
// empty if the profile is usable.
std::string validate_target_profile(const TargetProfile& profile);

// Resolved profile as pretty-printed JSON
std::string serialize_target_profile(const TargetProfile& profile);

// ============================================================================
// Container Arguments
// ============================================================================

// Format implied by a container path: "*.tar.gz" -> "tar.gz", "*.zip" ->
// "zip", "*.jar" -> "jar", ".../modules" -> "jimage". Empty if unknown.
std::string infer_container_format(const std::string& path);

// Parse "path[:format]"; the format is inferred when omitted
ContainerSpec parse_container_arg(const std::string& arg);

// Relative, non-empty and without ".." components
bool is_safe_relative_path(const std::string& path);

} // namespace repro

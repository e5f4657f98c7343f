#pragma once

#include "repro/profile.hpp"
#include "repro/types.hpp"
#include "repro/verdict.hpp"

#include <string>

namespace repro {

// ============================================================================
// Comparison Engine
// ============================================================================

struct ComparisonInput {
    std::string built_root;      // directory, or a .tar.gz bundle
    std::string official_root;   // directory, or a .tar.gz bundle

    // Release files for the whole-artifact hash; when empty, a bundle root
    // stands in, and failing that the tree digest of each side.
    std::string built_artifact;
    std::string official_artifact;

    TargetProfile profile;
    RunInfo run;
};

struct EngineResult {
    bool ok = false;             // false on input or internal errors
    ErrorKind kind = ErrorKind::None;
    std::string error;
    VerdictRecord record;        // always populated, also on errors

    ExitCode exit_code() const { return exit_code_for(kind, record.status); }
};

// Run one comparison: resolve roots, list both trees, evaluate the critical
// binaries, modules and files tiers, aggregate and return the verdict.
EngineResult run_comparison(const ComparisonInput& input);

} // namespace repro

#pragma once

#include <optional>
#include <string>

#ifndef REPRO_VERSION
#define REPRO_VERSION "0.4.0"
#endif

namespace repro {

// ============================================================================
// Path Classification (Tree Differ output)
// ============================================================================

enum class PathClass {
    Match,
    ContentDiffers,
    MissingInBuilt,     // present only in the official tree
    MissingInOfficial   // present only in the built tree
};

inline const char* path_class_to_string(PathClass c) {
    switch (c) {
        case PathClass::Match: return "match";
        case PathClass::ContentDiffers: return "content_differs";
        case PathClass::MissingInBuilt: return "missing_in_built";
        case PathClass::MissingInOfficial: return "missing_in_official";
        default: return "match";
    }
}

// ============================================================================
// Comparison Tiers
// ============================================================================

enum class Tier {
    CriticalBinaries,
    Modules,
    Files
};

// Canonical tier names, as they appear in report notes
inline const char* tier_to_string(Tier t) {
    switch (t) {
        case Tier::CriticalBinaries: return "critical_binaries";
        case Tier::Modules: return "modules";
        case Tier::Files: return "files";
        default: return "unknown";
    }
}

// ============================================================================
// Verdict Status
// ============================================================================

enum class VerdictStatus {
    Reproducible,
    NotReproducible
};

inline const char* status_to_string(VerdictStatus s) {
    switch (s) {
        case VerdictStatus::Reproducible: return "reproducible";
        case VerdictStatus::NotReproducible: return "not_reproducible";
        default: return "not_reproducible";
    }
}

// ============================================================================
// Process Exit Codes
// ============================================================================

enum class ExitCode : int {
    Success = 0,           // reproducible
    ComparisonFailed = 1,  // not reproducible, or fatal internal error
    InvalidInput = 2       // bad arguments, profile or artifact roots
};

inline int to_int(ExitCode c) { return static_cast<int>(c); }

// ============================================================================
// Engine Error Kinds
// ============================================================================

enum class ErrorKind {
    None,
    InputError,     // missing/unreadable root, malformed profile or file list
    InternalError   // invariant violation in an upstream stage
};

inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::InputError: return "input_error";
        case ErrorKind::InternalError: return "internal_error";
        default: return "none";
    }
}

// Map an engine outcome onto the fixed process exit codes
ExitCode exit_code_for(ErrorKind kind, VerdictStatus status);

} // namespace repro

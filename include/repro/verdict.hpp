#pragma once

#include "repro/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace repro {

// ============================================================================
// Tier Results
// ============================================================================

// Outcome of one comparison tier. Immutable once recorded.
struct TierResult {
    Tier tier = Tier::CriticalBinaries;
    bool evaluated = false;
    bool passed = false;
    std::optional<size_t> diff_count;
    std::vector<std::string> diff_paths;  // capped at the display limit
    std::string detail;
};

// A tier with no input (no critical files, no containers)
TierResult not_evaluated(Tier tier, const std::string& detail = "");

// ============================================================================
// Verdict Record
// ============================================================================

struct FileVerdict {
    std::string filename;
    std::string hash;
    std::string official_hash;
    bool match = false;
    std::string notes;
};

struct FileCounts {
    size_t built = 0;
    size_t official = 0;
    size_t excluded = 0;
};

// Identification shown in the plain-text summary
struct RunInfo {
    std::string app_id;
    std::string version;
    std::string commit;
};

struct VerdictRecord {
    std::string date;
    std::string script_version;
    std::string build_type;
    std::string architecture;
    VerdictStatus status = VerdictStatus::NotReproducible;
    std::string notes;
    std::vector<FileVerdict> files;  // whole artifact first
    std::vector<TierResult> tiers;
    FileCounts file_counts;
    RunInfo run;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

// Record emitted when a run cannot produce tier results
VerdictRecord make_error_record(ErrorKind kind, const std::string& error,
                                const std::string& build_type,
                                const std::string& architecture);

// ============================================================================
// Verdict Aggregator
// ============================================================================

enum class AggregatorState {
    Pending,
    CriticalChecked,
    ModulesChecked,
    FilesetChecked,
    Finalized
};

inline const char* aggregator_state_to_string(AggregatorState s) {
    switch (s) {
        case AggregatorState::Pending: return "pending";
        case AggregatorState::CriticalChecked: return "critical_checked";
        case AggregatorState::ModulesChecked: return "modules_checked";
        case AggregatorState::FilesetChecked: return "fileset_checked";
        case AggregatorState::Finalized: return "finalized";
        default: return "pending";
    }
}

struct AggregateResult {
    bool ok = false;
    std::string error;  // out-of-order transition
};

struct FinalizeResult {
    bool ok = false;
    std::string error;
    VerdictRecord record;
};

// Combines tier results, recorded strictly in the order critical binaries,
// modules, files. The verdict is reproducible iff every evaluated tier
// passed. The whole-artifact comparison is reported but does not decide.
class VerdictAggregator {
public:
    AggregatorState state() const { return state_; }

    // Record the next tier; fails if tier is not the one the state expects
    AggregateResult record(TierResult result);

    // Whole-artifact hash comparison (first entry of the record's files)
    void set_whole_artifact(FileVerdict verdict);

    // Per-file entries listed after the whole artifact
    void add_file(FileVerdict verdict);

    // Free-form note appended after the tier summary
    void add_note(const std::string& note);

    void set_file_counts(const FileCounts& counts) { counts_ = counts; }

    // Only valid once all three tiers are recorded
    FinalizeResult finalize(const std::string& build_type,
                            const std::string& architecture,
                            const RunInfo& run = {});

private:
    AggregatorState state_ = AggregatorState::Pending;
    std::vector<TierResult> tiers_;
    std::optional<FileVerdict> whole_artifact_;
    std::vector<FileVerdict> files_;
    std::vector<std::string> notes_;
    FileCounts counts_;
};

} // namespace repro

#include "repro/verdict.hpp"
#include "repro/platform.hpp"

#include <spdlog/spdlog.h>

namespace repro {

namespace {

std::optional<Tier> expected_tier(AggregatorState state) {
    switch (state) {
        case AggregatorState::Pending: return Tier::CriticalBinaries;
        case AggregatorState::CriticalChecked: return Tier::Modules;
        case AggregatorState::ModulesChecked: return Tier::Files;
        default: return std::nullopt;
    }
}

AggregatorState next_state(AggregatorState state) {
    switch (state) {
        case AggregatorState::Pending: return AggregatorState::CriticalChecked;
        case AggregatorState::CriticalChecked: return AggregatorState::ModulesChecked;
        case AggregatorState::ModulesChecked: return AggregatorState::FilesetChecked;
        default: return AggregatorState::Finalized;
    }
}

std::string tier_summary(const std::vector<TierResult>& tiers) {
    std::string summary;
    for (const auto& t : tiers) {
        if (!summary.empty()) summary += ' ';
        summary += tier_to_string(t.tier);
        summary += '=';
        summary += !t.evaluated ? "not_evaluated" : (t.passed ? "true" : "false");
    }
    return summary;
}

} // namespace

TierResult not_evaluated(Tier tier, const std::string& detail) {
    TierResult result;
    result.tier = tier;
    result.evaluated = false;
    result.passed = false;
    result.detail = detail;
    return result;
}

VerdictRecord make_error_record(ErrorKind kind, const std::string& error,
                                const std::string& build_type,
                                const std::string& architecture) {
    VerdictRecord record;
    record.date = get_current_timestamp();
    record.script_version = REPRO_VERSION;
    record.build_type = build_type;
    record.architecture = architecture;
    record.status = VerdictStatus::NotReproducible;
    record.error_kind = kind;
    record.error = error;
    record.notes = std::string(error_kind_to_string(kind)) + ": " + error;
    return record;
}

// ============================================================================
// VerdictAggregator
// ============================================================================

AggregateResult VerdictAggregator::record(TierResult result) {
    AggregateResult out;

    auto expected = expected_tier(state_);
    if (!expected) {
        out.error = std::string("cannot record tier ") + tier_to_string(result.tier) +
                    " in state " + aggregator_state_to_string(state_);
        return out;
    }
    if (*expected != result.tier) {
        out.error = std::string("out-of-order tier: expected ") + tier_to_string(*expected) +
                    ", got " + tier_to_string(result.tier);
        return out;
    }

    if (result.evaluated) {
        spdlog::info("{}: {}", tier_to_string(result.tier), result.passed ? "pass" : "FAIL");
    } else {
        spdlog::info("{}: not evaluated", tier_to_string(result.tier));
    }

    tiers_.push_back(std::move(result));
    state_ = next_state(state_);
    out.ok = true;
    return out;
}

void VerdictAggregator::set_whole_artifact(FileVerdict verdict) {
    whole_artifact_ = std::move(verdict);
}

void VerdictAggregator::add_file(FileVerdict verdict) {
    files_.push_back(std::move(verdict));
}

void VerdictAggregator::add_note(const std::string& note) {
    if (!note.empty()) {
        notes_.push_back(note);
    }
}

FinalizeResult VerdictAggregator::finalize(const std::string& build_type,
                                           const std::string& architecture,
                                           const RunInfo& run) {
    FinalizeResult out;

    if (state_ != AggregatorState::FilesetChecked) {
        out.error = std::string("cannot finalize in state ") + aggregator_state_to_string(state_);
        return out;
    }

    bool any_evaluated = false;
    bool all_passed = true;
    for (const auto& t : tiers_) {
        if (!t.evaluated) continue;
        any_evaluated = true;
        all_passed = all_passed && t.passed;
    }

    VerdictRecord& record = out.record;
    record.date = get_current_timestamp();
    record.script_version = REPRO_VERSION;
    record.build_type = build_type;
    record.architecture = architecture;
    record.status = any_evaluated && all_passed ? VerdictStatus::Reproducible
                                                : VerdictStatus::NotReproducible;
    record.tiers = tiers_;
    record.file_counts = counts_;
    record.run = run;

    std::string notes = tier_summary(tiers_);
    if (!any_evaluated) {
        notes += "; no tier evaluated";
    }
    for (const auto& note : notes_) {
        notes += "; ";
        notes += note;
    }

    if (whole_artifact_) {
        notes += "; whole_artifact_match=";
        notes += whole_artifact_->match ? "true" : "false";
        if (whole_artifact_->match != (record.status == VerdictStatus::Reproducible)) {
            spdlog::warn("whole-artifact hash {} but tiered verdict is {}",
                         whole_artifact_->match ? "matches" : "differs",
                         status_to_string(record.status));
        }
        FileVerdict whole = *whole_artifact_;
        whole.notes = whole.notes.empty() ? notes : notes + "; " + whole.notes;
        record.files.push_back(std::move(whole));
    } else {
        notes += "; whole_artifact_match=unknown";
    }
    record.notes = notes;

    for (const auto& f : files_) {
        record.files.push_back(f);
    }

    state_ = AggregatorState::Finalized;
    out.ok = true;
    return out;
}

} // namespace repro

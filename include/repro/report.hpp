#pragma once

#include "repro/verdict.hpp"

#include <optional>
#include <string>

namespace repro {

// ============================================================================
// Report Formats
// ============================================================================

enum class ReportFormat {
    Yaml,
    Json,
    Summary
};

inline const char* report_format_to_string(ReportFormat f) {
    switch (f) {
        case ReportFormat::Yaml: return "yaml";
        case ReportFormat::Json: return "json";
        case ReportFormat::Summary: return "summary";
        default: return "yaml";
    }
}

std::optional<ReportFormat> parse_report_format(const std::string& s);

// ============================================================================
// Rendering
// ============================================================================
//
// Field order is fixed; two renders of equal records are byte-identical.

// date / script_version / build_type / results[...]
std::string render_yaml(const VerdictRecord& record);

// Same structure as render_yaml
std::string render_json(const VerdictRecord& record);

// "===== Begin Results =====" block read by the build-server log scrapers
std::string render_summary(const VerdictRecord& record);

std::string render_report(const VerdictRecord& record, ReportFormat format);

// ============================================================================
// Persistence
// ============================================================================

struct WriteReportResult {
    bool ok = false;
    std::string error;
};

// Write a rendered report atomically
WriteReportResult write_report(const std::string& path, const std::string& text);

} // namespace repro

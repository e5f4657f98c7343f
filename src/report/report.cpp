#include "repro/report.hpp"
#include "repro/platform.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace repro {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

const std::string& or_na(const std::string& s) {
    static const std::string na = "N/A";
    return s.empty() ? na : s;
}

// ============================================================================
// YAML
// ============================================================================

void emit_file(YAML::Emitter& out, const FileVerdict& file) {
    out << YAML::BeginMap;
    out << YAML::Key << "filename" << YAML::Value << file.filename;
    out << YAML::Key << "hash" << YAML::Value << file.hash;
    out << YAML::Key << "match" << YAML::Value << file.match;
    out << YAML::Key << "official_hash" << YAML::Value << file.official_hash;
    out << YAML::Key << "notes" << YAML::Value << file.notes;
    out << YAML::EndMap;
}

void emit_tier(YAML::Emitter& out, const TierResult& tier) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << tier_to_string(tier.tier);
    out << YAML::Key << "evaluated" << YAML::Value << tier.evaluated;
    out << YAML::Key << "passed" << YAML::Value << tier.passed;
    out << YAML::Key << "diff_count" << YAML::Value;
    if (tier.diff_count) {
        out << static_cast<unsigned long long>(*tier.diff_count);
    } else {
        out << YAML::Null;
    }
    out << YAML::Key << "diff_paths" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : tier.diff_paths) {
        out << p;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "detail" << YAML::Value << tier.detail;
    out << YAML::EndMap;
}

// ============================================================================
// JSON
// ============================================================================

nlohmann::ordered_json file_to_json(const FileVerdict& file) {
    nlohmann::ordered_json j;
    j["filename"] = file.filename;
    j["hash"] = file.hash;
    j["match"] = file.match;
    j["official_hash"] = file.official_hash;
    j["notes"] = file.notes;
    return j;
}

nlohmann::ordered_json tier_to_json(const TierResult& tier) {
    nlohmann::ordered_json j;
    j["name"] = tier_to_string(tier.tier);
    j["evaluated"] = tier.evaluated;
    j["passed"] = tier.passed;
    if (tier.diff_count) {
        j["diff_count"] = *tier.diff_count;
    } else {
        j["diff_count"] = nullptr;
    }
    j["diff_paths"] = tier.diff_paths;
    j["detail"] = tier.detail;
    return j;
}

} // namespace

std::optional<ReportFormat> parse_report_format(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "yaml" || lower == "yml") return ReportFormat::Yaml;
    if (lower == "json") return ReportFormat::Json;
    if (lower == "summary" || lower == "text") return ReportFormat::Summary;
    return std::nullopt;
}

// ============================================================================
// Rendering
// ============================================================================

std::string render_yaml(const VerdictRecord& record) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "date" << YAML::Value << record.date;
    out << YAML::Key << "script_version" << YAML::Value << record.script_version;
    out << YAML::Key << "build_type" << YAML::Value << record.build_type;
    out << YAML::Key << "results" << YAML::Value << YAML::BeginSeq;

    out << YAML::BeginMap;
    out << YAML::Key << "architecture" << YAML::Value << record.architecture;
    out << YAML::Key << "status" << YAML::Value << status_to_string(record.status);
    out << YAML::Key << "notes" << YAML::Value << record.notes;
    if (record.error_kind != ErrorKind::None) {
        out << YAML::Key << "error" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "kind" << YAML::Value << error_kind_to_string(record.error_kind);
        out << YAML::Key << "message" << YAML::Value << record.error;
        out << YAML::EndMap;
    }

    out << YAML::Key << "files" << YAML::Value << YAML::BeginSeq;
    for (const auto& file : record.files) {
        emit_file(out, file);
    }
    out << YAML::EndSeq;

    out << YAML::Key << "tiers" << YAML::Value << YAML::BeginSeq;
    for (const auto& tier : record.tiers) {
        emit_tier(out, tier);
    }
    out << YAML::EndSeq;

    out << YAML::Key << "file_counts" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "built" << YAML::Value
        << static_cast<unsigned long long>(record.file_counts.built);
    out << YAML::Key << "official" << YAML::Value
        << static_cast<unsigned long long>(record.file_counts.official);
    out << YAML::Key << "excluded" << YAML::Value
        << static_cast<unsigned long long>(record.file_counts.excluded);
    out << YAML::EndMap;

    out << YAML::EndMap;
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::string text = out.c_str();
    text += '\n';
    return text;
}

std::string render_json(const VerdictRecord& record) {
    nlohmann::ordered_json result;
    result["architecture"] = record.architecture;
    result["status"] = status_to_string(record.status);
    result["notes"] = record.notes;
    if (record.error_kind != ErrorKind::None) {
        result["error"] = {
            {"kind", error_kind_to_string(record.error_kind)},
            {"message", record.error}
        };
    }

    result["files"] = nlohmann::ordered_json::array();
    for (const auto& file : record.files) {
        result["files"].push_back(file_to_json(file));
    }
    result["tiers"] = nlohmann::ordered_json::array();
    for (const auto& tier : record.tiers) {
        result["tiers"].push_back(tier_to_json(tier));
    }
    result["file_counts"] = {
        {"built", record.file_counts.built},
        {"official", record.file_counts.official},
        {"excluded", record.file_counts.excluded}
    };

    nlohmann::ordered_json j;
    j["date"] = record.date;
    j["script_version"] = record.script_version;
    j["build_type"] = record.build_type;
    j["results"] = nlohmann::ordered_json::array({result});
    return j.dump(2) + "\n";
}

std::string render_summary(const VerdictRecord& record) {
    std::ostringstream out;

    std::string app_hash;
    if (!record.files.empty()) {
        app_hash = record.files.front().official_hash;
    }

    out << "===== Begin Results =====\n";
    out << "appId:          " << or_na(record.run.app_id) << "\n";
    out << "signer:         N/A\n";
    out << "apkVersionName: " << or_na(record.run.version) << "\n";
    out << "apkVersionCode: N/A\n";
    out << "verdict:        " << status_to_string(record.status) << "\n";
    out << "appHash:        " << or_na(app_hash) << "\n";
    out << "commit:         " << or_na(record.run.commit) << "\n";
    out << "\n";
    out << "Diff:\n";
    out << (record.status == VerdictStatus::Reproducible ? "BUILDS MATCH BINARIES"
                                                        : "BUILDS DO NOT MATCH BINARIES")
        << "\n";
    for (const auto& file : record.files) {
        out << file.filename << " - " << or_na(record.architecture) << " - "
            << or_na(file.official_hash) << " - " << (file.match ? 1 : 0)
            << (file.match ? " (MATCHES)" : " (DOESN'T MATCH)") << "\n";
    }
    for (const auto& tier : record.tiers) {
        out << tier_to_string(tier.tier) << ": "
            << (!tier.evaluated ? "not evaluated" : (tier.passed ? "pass" : "FAIL"));
        if (!tier.detail.empty()) {
            out << " (" << tier.detail << ")";
        }
        out << "\n";
        for (const auto& p : tier.diff_paths) {
            out << "  - " << p << "\n";
        }
    }
    if (record.error_kind != ErrorKind::None) {
        out << "error: " << record.error << "\n";
    }
    out << "\n";
    out << "Revision, tag (and its signature):\n";
    out << "N/A - Binary verification only (no source checkout)\n";
    out << "\n";
    out << "===== End Results =====\n";
    return out.str();
}

std::string render_report(const VerdictRecord& record, ReportFormat format) {
    switch (format) {
        case ReportFormat::Json: return render_json(record);
        case ReportFormat::Summary: return render_summary(record);
        case ReportFormat::Yaml:
        default:
            return render_yaml(record);
    }
}

// ============================================================================
// Persistence
// ============================================================================

WriteReportResult write_report(const std::string& path, const std::string& text) {
    WriteReportResult result;

    std::string parent = get_parent_directory(path);
    if (!parent.empty() && !create_directories(parent)) {
        result.error = "failed to create directory: " + parent;
        return result;
    }

    auto written = atomic_write_file(path, text);
    if (!written.ok) {
        result.error = written.error;
        return result;
    }
    result.ok = true;
    return result;
}

} // namespace repro

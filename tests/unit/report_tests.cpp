#include <doctest/doctest.h>
#include <repro/report.hpp>

#include "../support/fixtures.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

using namespace repro;

namespace {

VerdictRecord sample_record() {
    VerdictRecord record;
    record.date = "2026-10-19T12:00:00Z";
    record.script_version = "0.4.0";
    record.build_type = "tarball";
    record.architecture = "x86_64-linux-gnu";
    record.status = VerdictStatus::NotReproducible;
    record.notes = "critical_binaries=true modules=false files=true; whole_artifact_match=false";

    FileVerdict whole;
    whole.filename = "Sparrow-2.0.0-x86_64.tar.gz";
    whole.hash = "1111";
    whole.official_hash = "2222";
    whole.match = false;
    whole.notes = record.notes;
    record.files.push_back(whole);

    TierResult critical;
    critical.tier = Tier::CriticalBinaries;
    critical.evaluated = true;
    critical.passed = true;
    critical.diff_count = 0;
    critical.detail = "4/4 match";
    record.tiers.push_back(critical);

    TierResult modules;
    modules.tier = Tier::Modules;
    modules.evaluated = true;
    modules.passed = false;
    modules.detail = "failed to extract official lib/runtime/lib/modules: corrupt";
    record.tiers.push_back(modules);

    TierResult files;
    files.tier = Tier::Files;
    files.evaluated = true;
    files.passed = true;
    files.diff_count = 0;
    record.tiers.push_back(files);

    record.file_counts = FileCounts{120, 121, 1};
    record.run = RunInfo{"sparrow", "2.0.0", ""};
    return record;
}

size_t pos(const std::string& text, const std::string& needle) {
    return text.find(needle);
}

} // namespace

TEST_CASE("parse_report_format") {
    CHECK(parse_report_format("YAML") == ReportFormat::Yaml);
    CHECK(parse_report_format("yml") == ReportFormat::Yaml);
    CHECK(parse_report_format("json") == ReportFormat::Json);
    CHECK(parse_report_format("text") == ReportFormat::Summary);
    CHECK_FALSE(parse_report_format("xml").has_value());
}

TEST_CASE("render_yaml structure and field order") {
    auto record = sample_record();
    std::string text = render_yaml(record);

    REQUIRE(!text.empty());
    CHECK(text.back() == '\n');
    CHECK(pos(text, "date:") < pos(text, "script_version:"));
    CHECK(pos(text, "script_version:") < pos(text, "build_type:"));
    CHECK(pos(text, "build_type:") < pos(text, "results:"));
    CHECK(pos(text, "architecture:") < pos(text, "status:"));
    CHECK(pos(text, "status:") < pos(text, "files:"));
    CHECK(pos(text, "files:") < pos(text, "tiers:"));
    CHECK(pos(text, "tiers:") < pos(text, "file_counts:"));

    YAML::Node doc = YAML::Load(text);
    CHECK(doc["build_type"].as<std::string>() == "tarball");
    auto result = doc["results"][0];
    CHECK(result["status"].as<std::string>() == "not_reproducible");
    CHECK(result["files"][0]["match"].as<bool>() == false);
    CHECK(result["files"][0]["official_hash"].as<std::string>() == "2222");
    CHECK(result["tiers"].size() == 3);
    CHECK(result["tiers"][1]["name"].as<std::string>() == "modules");
    CHECK(result["tiers"][1]["diff_count"].IsNull());
    CHECK(result["tiers"][0]["diff_count"].as<int>() == 0);
    CHECK(result["file_counts"]["excluded"].as<int>() == 1);
    CHECK_FALSE(result["error"]);
}

TEST_CASE("render_json structure") {
    auto record = sample_record();
    std::string text = render_json(record);
    CHECK(text.back() == '\n');

    auto j = nlohmann::json::parse(text);
    CHECK(j["script_version"] == "0.4.0");
    const auto& result = j["results"][0];
    CHECK(result["architecture"] == "x86_64-linux-gnu");
    CHECK(result["tiers"][1]["diff_count"].is_null());
    CHECK(result["tiers"][2]["passed"] == true);
    CHECK(result["file_counts"]["official"] == 121);
    CHECK_FALSE(result.contains("error"));

    CHECK(pos(text, "\"date\"") < pos(text, "\"results\""));
    CHECK(pos(text, "\"filename\"") < pos(text, "\"official_hash\""));
}

TEST_CASE("renders of equal records are byte-identical") {
    auto a = sample_record();
    auto b = sample_record();
    CHECK(render_yaml(a) == render_yaml(b));
    CHECK(render_json(a) == render_json(b));
    CHECK(render_summary(a) == render_summary(b));
}

TEST_CASE("error records carry an error block") {
    auto record = make_error_record(ErrorKind::InputError, "official root not found: /nope",
                                    "tarball", "x86_64");

    auto j = nlohmann::json::parse(render_json(record));
    CHECK(j["results"][0]["error"]["kind"] == "input_error");
    CHECK(j["results"][0]["error"]["message"] == "official root not found: /nope");
    CHECK(j["results"][0]["tiers"].empty());

    YAML::Node doc = YAML::Load(render_yaml(record));
    CHECK(doc["results"][0]["error"]["kind"].as<std::string>() == "input_error");

    CHECK(render_summary(record).find("error: official root not found: /nope") !=
          std::string::npos);
}

TEST_CASE("render_summary block") {
    auto record = sample_record();
    std::string text = render_summary(record);

    CHECK(text.rfind("===== Begin Results =====\n", 0) == 0);
    CHECK(pos(text, "appId:          sparrow\n") != std::string::npos);
    CHECK(pos(text, "apkVersionName: 2.0.0\n") != std::string::npos);
    CHECK(pos(text, "verdict:        not_reproducible\n") != std::string::npos);
    CHECK(pos(text, "appHash:        2222\n") != std::string::npos);
    CHECK(pos(text, "commit:         N/A\n") != std::string::npos);
    CHECK(pos(text, "BUILDS DO NOT MATCH BINARIES\n") != std::string::npos);
    CHECK(pos(text, "Sparrow-2.0.0-x86_64.tar.gz - x86_64-linux-gnu - 2222 - 0 (DOESN'T MATCH)\n") !=
          std::string::npos);
    CHECK(pos(text, "critical_binaries: pass (4/4 match)\n") != std::string::npos);
    CHECK(pos(text, "modules: FAIL (failed to extract official") != std::string::npos);
    CHECK(pos(text, "Revision, tag (and its signature):\n") != std::string::npos);
    CHECK(text.size() >= 24);
    CHECK(text.substr(text.size() - 24) == "===== End Results =====\n");
}

TEST_CASE("render_summary for a matching build") {
    auto record = sample_record();
    record.status = VerdictStatus::Reproducible;
    record.files[0].match = true;
    record.files[0].hash = "2222";
    std::string text = render_summary(record);
    CHECK(pos(text, "BUILDS MATCH BINARIES\n") != std::string::npos);
    CHECK(pos(text, " - 1 (MATCHES)\n") != std::string::npos);
}

TEST_CASE("write_report creates parent directories") {
    repro::test::TempDir dir;
    std::string path = dir.sub("reports/nested/sparrow.yaml");
    auto written = write_report(path, "status: ok\n");
    REQUIRE(written.ok);

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    CHECK(ss.str() == "status: ok\n");

    auto overwritten = write_report(path, "status: again\n");
    REQUIRE(overwritten.ok);
}

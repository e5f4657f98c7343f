/**
 * repro CLI - compare command
 *
 * Compare a built artifact tree with the official release and emit a verdict.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <repro/engine.hpp>
#include <repro/profile.hpp>
#include <repro/report.hpp>

namespace repro::cli::commands {

namespace {

struct CompareCommandOptions {
    std::string built;
    std::string official;
    std::string profile;
    std::vector<std::string> critical;
    std::vector<std::string> containers;
    std::vector<std::string> exclusions;
    std::vector<std::string> signed_files;
    std::string build_type;
    std::string architecture;
    std::string built_artifact;
    std::string official_artifact;
    std::string app_id;
    std::string version;
    std::string commit;
    std::string output;
    std::string format = "yaml";
    unsigned jobs = 0;
    size_t display_limit = 0;
    bool no_content_check = false;
};

// Command-line values extend (lists) or override (scalars) the profile
void apply_overrides(TargetProfile& profile, const CompareCommandOptions& cmd) {
    for (const auto& path : cmd.critical) {
        profile.critical_files.push_back(path);
    }
    for (const auto& arg : cmd.containers) {
        profile.containers.push_back(parse_container_arg(arg));
    }
    for (const auto& pattern : cmd.exclusions) {
        profile.exclusions.push_back(pattern);
    }
    for (const auto& pattern : cmd.signed_files) {
        profile.signed_files.push_back(pattern);
    }
    if (!cmd.build_type.empty()) profile.build_type = cmd.build_type;
    if (!cmd.architecture.empty()) profile.architecture = cmd.architecture;
    if (cmd.jobs > 0) profile.options.jobs = cmd.jobs;
    if (cmd.display_limit > 0) profile.options.display_limit = cmd.display_limit;
    if (cmd.no_content_check) profile.options.content_check = false;
}

int emit(const VerdictRecord& record, ReportFormat format, const std::string& output) {
    std::string text = render_report(record, format);

    if (output.empty()) {
        std::cout << text;
        std::cout.flush();
        return 0;
    }

    auto written = write_report(output, text);
    if (!written.ok) {
        spdlog::error("failed to write report {}: {}", output, written.error);
        return 1;
    }
    spdlog::info("report written to {}", output);
    return 0;
}

int cmd_compare(const GlobalOptions& opts, const CompareCommandOptions& cmd) {
    configure_logging(opts);

    ReportFormat format = opts.json ? ReportFormat::Json
                                    : parse_report_format(cmd.format).value_or(ReportFormat::Yaml);

    TargetProfile profile;
    if (!cmd.profile.empty()) {
        auto loaded = load_target_profile(cmd.profile);
        if (!loaded.ok) {
            std::string error = "invalid profile " + cmd.profile + ": " + loaded.error;
            spdlog::error("{}", error);
            auto record = make_error_record(ErrorKind::InputError, error,
                                            cmd.build_type, cmd.architecture);
            record.run = RunInfo{cmd.app_id, cmd.version, cmd.commit};
            emit(record, format, cmd.output);
            return to_int(ExitCode::InvalidInput);
        }
        for (const auto& warning : loaded.warnings) {
            spdlog::warn("{}: {}", cmd.profile, warning);
        }
        profile = loaded.profile;
    }
    apply_overrides(profile, cmd);

    ComparisonInput input;
    input.built_root = cmd.built;
    input.official_root = cmd.official;
    input.built_artifact = cmd.built_artifact;
    input.official_artifact = cmd.official_artifact;
    input.profile = profile;
    input.run = RunInfo{cmd.app_id.empty() ? profile.id : cmd.app_id, cmd.version, cmd.commit};

    auto result = run_comparison(input);

    if (emit(result.record, format, cmd.output) != 0) {
        return to_int(ExitCode::ComparisonFailed);
    }
    return to_int(result.exit_code());
}

} // namespace

void setup_compare(CLI::App* app, GlobalOptions& opts) {
    static CompareCommandOptions cmd;

    app->add_option("--built", cmd.built, "Built artifact directory or .tar.gz bundle")->required();
    app->add_option("--official", cmd.official, "Official artifact directory or .tar.gz bundle")->required();
    app->add_option("--profile", cmd.profile, "Target profile (JSON)");
    app->add_option("--critical", cmd.critical, "Critical file path (repeatable)");
    app->add_option("--container", cmd.containers, "Container path[:format] (repeatable)");
    app->add_option("--exclude", cmd.exclusions, "Informational-only path pattern (repeatable)");
    app->add_option("--signed", cmd.signed_files, "Signed file pattern (repeatable)");
    app->add_option("--build-type", cmd.build_type, "Build classification (apk, tarball, dmg, ...)");
    app->add_option("--arch", cmd.architecture, "Target architecture");
    app->add_option("--built-artifact", cmd.built_artifact, "Built release file for the whole-artifact hash");
    app->add_option("--official-artifact", cmd.official_artifact, "Official release file for the whole-artifact hash");
    app->add_option("--app-id", cmd.app_id, "Application id for the summary");
    app->add_option("--version", cmd.version, "Application version for the summary");
    app->add_option("--commit", cmd.commit, "Source commit for the summary");
    app->add_option("-o,--output", cmd.output, "Write the report to a file");
    app->add_option("--format", cmd.format, "Report format")
        ->check(CLI::IsMember({"yaml", "json", "summary"}));
    app->add_option("-j,--jobs", cmd.jobs, "Hashing threads")->check(CLI::PositiveNumber);
    app->add_option("--display-limit", cmd.display_limit, "Differing paths listed per tier")
        ->check(CLI::PositiveNumber);
    app->add_flag("--no-content-check", cmd.no_content_check, "Compare file sets by path only");

    app->callback([&opts]() {
        std::exit(cmd_compare(opts, cmd));
    });
}

} // namespace repro::cli::commands

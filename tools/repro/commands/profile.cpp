/**
 * repro CLI - profile command
 *
 * Validate a target profile and print its resolved form.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <repro/profile.hpp>

namespace repro::cli::commands {

namespace {

int cmd_profile_check(const GlobalOptions& opts, const std::string& path) {
    configure_logging(opts);

    auto loaded = load_target_profile(path);
    if (!loaded.ok) {
        print_error("invalid profile " + path + ": " + loaded.error, opts.json);
        return to_int(ExitCode::InvalidInput);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["profile"] = nlohmann::json::parse(serialize_target_profile(loaded.profile));
        j["warnings"] = loaded.warnings;
        output_json(j);
        return 0;
    }

    for (const auto& warning : loaded.warnings) {
        spdlog::warn("{}: {}", path, warning);
    }
    std::cout << serialize_target_profile(loaded.profile) << std::endl;
    return 0;
}

} // namespace

void setup_profile(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    static std::string check_path;
    auto* check_cmd = app->add_subcommand("check", "Validate a profile file");
    check_cmd->add_option("file", check_path, "Profile path")->required();
    check_cmd->callback([&opts]() {
        std::exit(cmd_profile_check(opts, check_path));
    });
}

} // namespace repro::cli::commands

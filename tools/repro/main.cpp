/**
 * repro CLI - Entry Point
 *
 * Reproducible-build comparison and verdict tool.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace repro::cli::commands {
    void setup_compare(CLI::App* app, GlobalOptions& opts);
    void setup_profile(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace repro::cli;

    CLI::App app{"repro - reproducible build verification"};
    app.set_version_flag("-V,--version", REPRO_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Commands
    auto* compare_cmd = app.add_subcommand("compare", "Compare a built artifact with the official release");
    commands::setup_compare(compare_cmd, opts);

    auto* profile_cmd = app.add_subcommand("profile", "Inspect target profiles");
    commands::setup_profile(profile_cmd, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        // Usage errors share the invalid-input exit code
        return code == 0 ? 0 : repro::to_int(repro::ExitCode::InvalidInput);
    }

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}

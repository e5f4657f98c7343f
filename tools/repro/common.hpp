/**
 * repro CLI - Common utilities and types
 */

#pragma once

#include <repro/platform.hpp>
#include <repro/types.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <string>

namespace repro::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route logs to stderr and pick the level.
 * Priority: -v / -q > REPRO_LOG_LEVEL > info
 */
inline void configure_logging(const GlobalOptions& opts) {
    auto logger = spdlog::stderr_color_mt("repro");
    logger->set_pattern("[%l] %v");
    spdlog::set_default_logger(logger);

    std::string level = get_env("REPRO_LOG_LEVEL").value_or("info");
    if (opts.verbose) {
        level = "debug";
    } else if (opts.quiet) {
        level = "error";
    }

    if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace repro::cli

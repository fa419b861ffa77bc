/**
 * binpack CLI - Common utilities and types
 */

#pragma once

#include <binpack/config.hpp>
#include <binpack/types.hpp>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <iostream>
#include <string>

namespace binpack::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Package selection flags shared by normalize and locate.
 */
inline void add_package_options(CLI::App* app, OptionOverrides& o) {
    app->add_option("--name", o.name, "Package name (default: $PKG_NAME)");
    app->add_option("--version", o.version, "Package version (default: $PKG_VERSION)");
    app->add_option("--platform", o.target_platform, "Target platform, e.g. linux-64 (default: $target_platform)");
    app->add_option("--work-dir", o.work_dir, "Directory holding the release file (default: current directory)");
    app->add_option("--config", o.config_path, "JSON configuration file (default: $BINPACK_CONFIG)");
}

/**
 * Route library logging to stderr so stdout stays clean for results.
 * -v wins over -q, both win over the config file.
 */
inline void setup_logging(const GlobalOptions& opts, const std::string& configured_level) {
    auto logger = spdlog::stderr_color_mt("binpack");
    logger->set_pattern("[%l] %v");
    spdlog::set_default_logger(logger);

    auto level = spdlog::level::from_str(configured_level);
    if (level == spdlog::level::off && configured_level != "off") {
        level = spdlog::level::info;
    }
    if (opts.quiet) level = spdlog::level::err;
    if (opts.verbose) level = spdlog::level::debug;
    spdlog::set_level(level);
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, ErrorCode code, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        j["code"] = error_code_to_string(code);
        j["exit_code"] = exit_code_for(code);
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace binpack::cli

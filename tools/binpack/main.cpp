/**
 * binpack CLI - Entry Point
 *
 * Normalizes unpacked pre-built release binaries into an installable layout.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#ifndef BINPACK_VERSION
#define BINPACK_VERSION "0.0.0"
#endif

// Forward declarations for commands
namespace binpack::cli::commands {
    void setup_normalize(CLI::App* app, GlobalOptions& opts);
    void setup_locate(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace binpack::cli;

    CLI::App app{"binpack - normalize pre-built release binaries"};
    app.set_version_flag("-V,--version", BINPACK_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Commands
    auto* normalize_cmd = app.add_subcommand("normalize", "Unpack the release file into the prefix and normalize it");
    commands::setup_normalize(normalize_cmd, opts);

    auto* locate_cmd = app.add_subcommand("locate", "Show which release file would be used");
    commands::setup_locate(locate_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}

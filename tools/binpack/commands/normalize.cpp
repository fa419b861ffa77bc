/**
 * binpack CLI - normalize command
 *
 * Unpack the release file of one package-platform unit into the prefix and
 * reshape it into bin/, extras/ and the reserved directories.
 */

#include "../common.hpp"
#include <binpack/normalizer.hpp>
#include <CLI/CLI.hpp>

namespace binpack::cli::commands {

namespace {

int cmd_normalize(const GlobalOptions& opts, const OptionOverrides& overrides) {
    auto resolved = resolve_normalize_options(overrides);
    setup_logging(opts, resolved.ok ? resolved.options.log_level : "info");
    if (!resolved.ok) {
        print_error(resolved.error, resolved.code, opts.json);
        return exit_code_for(resolved.code);
    }

    auto report = normalize_prefix(resolved.options);

    if (opts.json) {
        std::cout << serialize_report(report) << std::endl;
        return exit_code_for(report.code);
    }

    if (!report.ok) {
        print_error(report.error, report.code, false);
        return exit_code_for(report.code);
    }

    if (!opts.quiet) {
        size_t executables = 0;
        size_t auxiliary = 0;
        for (const auto& e : report.entries) {
            if (e.destination == EntryDestination::Executables) executables++;
            if (e.destination == EntryDestination::Auxiliary) auxiliary++;
        }
        print_success("Normalized " + report.package.archive_stem() + " into " + report.prefix, false);
        print_success("  artifact:  " + report.artifact.path + " (" +
                      archive_format_to_string(report.artifact.format) + ", sha256 " +
                      report.artifact.sha256 + ")", false);
        print_success("  flattened: " + std::to_string(report.flatten_iterations) + " levels", false);
        print_success("  bin/:      " + std::to_string(executables) + " executables", false);
        print_success("  extras/:   " + std::to_string(auxiliary) + " entries", false);
        for (const auto& r : report.renames) {
            print_success("  renamed:   " + r.from + " -> " + r.to, false);
        }
    }
    return 0;
}

} // namespace

void setup_normalize(CLI::App* app, GlobalOptions& opts) {
    static OptionOverrides overrides;

    add_package_options(app, overrides);
    app->add_option("--prefix", overrides.prefix, "Installation prefix (default: $PREFIX)");
    app->add_option("--rename-policy", overrides.rename_policy,
                    "Executable rename mode (default: $BINPACK_RENAME_POLICY)")
        ->check(CLI::IsMember({"first-separator", "before-version"}));

    app->callback([&opts]() {
        std::exit(cmd_normalize(opts, overrides));
    });
}

} // namespace binpack::cli::commands

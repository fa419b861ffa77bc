/**
 * binpack CLI - locate command
 *
 * Report the release file and format normalize would pick, without
 * touching any prefix.
 */

#include "../common.hpp"
#include <binpack/extractor.hpp>
#include <CLI/CLI.hpp>

namespace binpack::cli::commands {

namespace {

int cmd_locate(const GlobalOptions& opts, const OptionOverrides& overrides) {
    auto resolved = resolve_normalize_options(overrides, false, false);
    setup_logging(opts, resolved.ok ? resolved.options.log_level : "info");
    if (!resolved.ok) {
        print_error(resolved.error, resolved.code, opts.json);
        return exit_code_for(resolved.code);
    }

    const auto& options = resolved.options;
    auto located = locate_input_artifact(options.work_dir, options.package);
    if (!located.ok) {
        print_error(located.error, located.code, opts.json);
        return exit_code_for(located.code);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = located.artifact.path;
        j["file_name"] = located.artifact.file_name;
        j["format"] = archive_format_to_string(located.artifact.format);
        j["candidates"] = located.candidates;
        output_json(j);
    } else {
        print_success(located.artifact.path + " (" +
                      archive_format_to_string(located.artifact.format) + ")", false);
    }
    return 0;
}

} // namespace

void setup_locate(CLI::App* app, GlobalOptions& opts) {
    static OptionOverrides overrides;

    add_package_options(app, overrides);

    app->callback([&opts]() {
        std::exit(cmd_locate(opts, overrides));
    });
}

} // namespace binpack::cli::commands

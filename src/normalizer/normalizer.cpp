#include "binpack/normalizer.hpp"
#include "binpack/digest.hpp"
#include "binpack/flattener.hpp"
#include "binpack/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace binpack {

namespace {

NormalizeReport& fail(NormalizeReport& report, ErrorCode code, const std::string& message) {
    report.ok = false;
    report.code = code;
    report.error = message;
    return report;
}

// Absolute, normal form used for containment checks; falls back to the input
std::string absolute_path(const std::string& path) {
    std::error_code ec;
    auto p = fs::weakly_canonical(fs::absolute(path, ec), ec);
    if (ec) return path;
    return p.string();
}

} // namespace

NormalizeReport normalize_prefix(const NormalizeOptions& options, const ExecutableProbe& probe) {
    NormalizeReport report;
    report.package = options.package;
    report.prefix = options.prefix;
    report.probe = probe.name();
    report.rename_policy = rename_mode_to_string(options.rename.mode);
    report.started_at = get_current_timestamp();

    const auto& pkg = options.package;
    if (pkg.name.empty() || pkg.version.empty() || pkg.target_platform.empty()) {
        return fail(report, ErrorCode::InvalidConfiguration,
                    "package name, version and target platform are all required");
    }
    if (options.rename.mode == RenameMode::Unset) {
        return fail(report, ErrorCode::InvalidConfiguration,
                    "rename policy not configured; choose first-separator or before-version");
    }
    if (!is_writable_directory(options.prefix)) {
        return fail(report, ErrorCode::PrefixAccessFailure,
                    "prefix is not a writable directory: " + options.prefix);
    }
    if (path_exists(join_path(options.prefix, kAuxiliaryDir))) {
        return fail(report, ErrorCode::AlreadyNormalized,
                    options.prefix + " already contains " + kAuxiliaryDir + "/; refusing to normalize twice");
    }

    const std::string prefix_abs = absolute_path(options.prefix);
    if (is_within(prefix_abs, absolute_path(options.work_dir))) {
        return fail(report, ErrorCode::InvalidConfiguration,
                    "work directory " + options.work_dir + " lies inside prefix " + options.prefix);
    }

    spdlog::info("normalizing {} {} for {} into {}",
                 pkg.name, pkg.version, pkg.target_platform, options.prefix);

    // Extract
    auto located = locate_input_artifact(options.work_dir, pkg);
    if (!located.ok) {
        spdlog::error("{}", located.error);
        return fail(report, located.code, located.error);
    }
    report.artifact_found = true;
    report.artifact.path = located.artifact.path;
    report.artifact.format = located.artifact.format;

    auto digest = digest_file(located.artifact.path);
    if (!digest.ok) {
        spdlog::error("{}", digest.error);
        return fail(report, ErrorCode::ExtractionFailed, digest.error);
    }
    report.artifact.size = digest.size;
    report.artifact.sha256 = digest.sha256;

    auto extracted = extract_input_artifact(located.artifact, options.prefix, pkg);
    if (!extracted.ok) {
        return fail(report, extracted.code, extracted.error);
    }
    spdlog::debug("extracted {} entries", extracted.entries.size());

    // Flatten
    auto flattened = flatten_layout(options.prefix);
    if (!flattened.ok) {
        return fail(report, flattened.code, flattened.error);
    }
    report.flatten_iterations = flattened.iterations;
    report.flattened = flattened.removed;

    // Classify
    auto classified = classify_entries(options.prefix, probe);
    if (!classified.ok) {
        return fail(report, classified.code, classified.error);
    }
    report.entries = classified.entries;

    // Rename
    auto renamed = rename_executables(join_path(options.prefix, kExecutablesDir), pkg.version, options.rename);
    if (!renamed.ok) {
        return fail(report, renamed.code, renamed.error);
    }
    report.renames = renamed.renamed;

    spdlog::info("normalized {} into {} ({} entries, {} renamed)",
                 located.artifact.file_name, options.prefix, report.entries.size(), report.renames.size());

    report.ok = true;
    return report;
}

NormalizeReport normalize_prefix(const NormalizeOptions& options) {
    auto probe = make_executable_probe(options.package.target_platform);
    return normalize_prefix(options, *probe);
}

} // namespace binpack

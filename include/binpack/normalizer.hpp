#pragma once

#include "binpack/classifier.hpp"
#include "binpack/config.hpp"
#include "binpack/executable_probe.hpp"
#include "binpack/extractor.hpp"
#include "binpack/renamer.hpp"
#include "binpack/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace binpack {

// ============================================================================
// Normalize Report
// ============================================================================

struct ArtifactInfo {
    std::string path;
    ArchiveFormat format = ArchiveFormat::Bare;
    uint64_t size = 0;
    std::string sha256;
};

struct NormalizeReport {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;

    PackageDescriptor package;
    std::string prefix;
    std::string probe;                          // "unix" or "windows"
    std::string rename_policy;
    std::string started_at;

    bool artifact_found = false;
    ArtifactInfo artifact;
    size_t flatten_iterations = 0;
    std::vector<std::string> flattened;         // wrapper directory names
    std::vector<ClassifiedEntry> entries;
    std::vector<RenamedFile> renames;
};

// Serialize a report as a JSON document (pretty printed)
std::string serialize_report(const NormalizeReport& report);

// ============================================================================
// Pipeline
// ============================================================================

// Run extract -> flatten -> classify -> rename on options.prefix.
// Checks done before the prefix is touched:
//   - prefix must be an existing writable directory (PrefixAccessFailure)
//   - prefix must not already contain extras/ (AlreadyNormalized)
//   - work directory must not lie inside prefix (InvalidConfiguration)
//   - rename mode must be set (InvalidConfiguration)
// The first failing stage ends the run; its code and message are reported.
NormalizeReport normalize_prefix(const NormalizeOptions& options, const ExecutableProbe& probe);

// Same, with the probe chosen from options.package.target_platform
NormalizeReport normalize_prefix(const NormalizeOptions& options);

} // namespace binpack

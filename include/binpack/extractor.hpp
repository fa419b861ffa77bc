#pragma once

#include "binpack/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace binpack {

// ============================================================================
// Input Artifact Lookup
// ============================================================================

struct InputArtifact {
    std::string path;               // absolute or work-dir relative path
    std::string file_name;          // {stem}{suffix}
    ArchiveFormat format = ArchiveFormat::Bare;
};

struct LocateResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    InputArtifact artifact;
    std::vector<std::string> candidates;    // every file name that was tried, in order
};

// Find the single expected input artifact in work_dir.
// Candidates are tried in archive_format_lookup_order(); the first regular
// file (or symlink to one) wins. Failure is MissingInputArtifact and the
// message lists the candidates and the directory contents.
LocateResult locate_input_artifact(const std::string& work_dir, const PackageDescriptor& pkg);

// Render a directory listing in the spirit of `ls -alF`: one line per entry
// with type/permission string, size and name plus a type indicator.
std::string list_work_directory(const std::string& work_dir);

// ============================================================================
// Extraction
// ============================================================================

struct ExtractResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    std::vector<std::string> entries;   // prefix-relative paths materialized, in archive order
};

// Materialize an input artifact inside prefix.
//   - zip / tar.gz / tar.xz / tar.zst: every member extracted below prefix
//   - gz / xz / zst: payload decompressed to prefix/{pkg.name}, mode 0755
//   - bare: copied verbatim to prefix/{pkg.name}, mode 0755
// Archive members must stay inside prefix: absolute names, ".." escapes,
// escaping link targets and device/FIFO/socket entries fail the extraction.
// The artifact itself is never modified or copied into prefix.
ExtractResult extract_input_artifact(const InputArtifact& artifact,
                                     const std::string& prefix,
                                     const PackageDescriptor& pkg);

} // namespace binpack

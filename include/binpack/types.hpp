#pragma once

#include <array>
#include <string>

namespace binpack {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    None,
    MissingInputArtifact,   // no file matches the naming convention or formats
    PrefixAccessFailure,    // installation root missing or not writable
    ExtractionFailed,       // corrupt archive, decompression or copy failure
    LayoutConflict,         // two entries would land on the same path
    AlreadyNormalized,      // prefix already carries the normalized layout
    InvalidConfiguration,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::MissingInputArtifact: return "missing_input_artifact";
        case ErrorCode::PrefixAccessFailure: return "prefix_access_failure";
        case ErrorCode::ExtractionFailed: return "extraction_failed";
        case ErrorCode::LayoutConflict: return "layout_conflict";
        case ErrorCode::AlreadyNormalized: return "already_normalized";
        case ErrorCode::InvalidConfiguration: return "invalid_configuration";
        default: return "unknown";
    }
}

// Process exit status for an error code.
// 1 and 3 keep the values packaging scripts already test for.
inline int exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return 0;
        case ErrorCode::MissingInputArtifact: return 1;
        case ErrorCode::PrefixAccessFailure: return 3;
        case ErrorCode::InvalidConfiguration: return 4;
        case ErrorCode::ExtractionFailed:
        case ErrorCode::LayoutConflict:
        case ErrorCode::AlreadyNormalized:
        default:
            return 2;
    }
}

// ============================================================================
// Package Descriptor
// ============================================================================

struct PackageDescriptor {
    std::string name;
    std::string version;
    std::string target_platform;    // conda-style, e.g. linux-64, osx-arm64, win-64

    // Base name of the expected input artifact: {name}-{version}-{target_platform}
    std::string archive_stem() const {
        return name + "-" + version + "-" + target_platform;
    }
};

// ============================================================================
// Target Layout
// ============================================================================

constexpr const char* kExecutablesDir = "bin";
constexpr const char* kAuxiliaryDir = "extras";

// Structural top-level directories that are never relocated or merged.
constexpr std::array<const char*, 9> kReservedDirectories = {
    "conda-meta", "bin", "etc", "include", "lib", "man", "share", "ssl", "extras",
};

bool is_reserved_directory(const std::string& name);

// ============================================================================
// Input Artifact Formats
// ============================================================================

enum class ArchiveFormat {
    Zip,
    TarGzip,
    TarXz,
    TarZstd,
    Gzip,
    Xz,
    Zstd,
    Bare,
};

inline const char* archive_format_to_string(ArchiveFormat f) {
    switch (f) {
        case ArchiveFormat::Zip: return "zip";
        case ArchiveFormat::TarGzip: return "tar.gz";
        case ArchiveFormat::TarXz: return "tar.xz";
        case ArchiveFormat::TarZstd: return "tar.zst";
        case ArchiveFormat::Gzip: return "gz";
        case ArchiveFormat::Xz: return "xz";
        case ArchiveFormat::Zstd: return "zst";
        case ArchiveFormat::Bare: return "bare";
        default: return "unknown";
    }
}

// True for formats holding a directory tree, false for single-file payloads
inline bool is_multi_entry_format(ArchiveFormat f) {
    return f == ArchiveFormat::Zip || f == ArchiveFormat::TarGzip ||
           f == ArchiveFormat::TarXz || f == ArchiveFormat::TarZstd;
}

// File name suffix for a format ("" for Bare)
const char* archive_format_suffix(ArchiveFormat f);

// Lookup order used when locating the input artifact
const std::array<ArchiveFormat, 8>& archive_format_lookup_order();

} // namespace binpack

#pragma once

#include "binpack/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace binpack {

// ============================================================================
// Rename Policy
// ============================================================================
//
// Release binaries are often named "tool-1.2.3-linux64". The installed
// command must have a stable name, but a name that itself contains a
// separator ("my-tool-1.2.3") cannot be told apart from a version suffix
// without a decision. The mode therefore has no default: it must be set
// explicitly by configuration.

enum class RenameMode {
    Unset,
    FirstSeparator,     // cut at the first separator of the whole name
    BeforeVersion,      // cut at the separator directly preceding the version
};

inline const char* rename_mode_to_string(RenameMode m) {
    switch (m) {
        case RenameMode::FirstSeparator: return "first-separator";
        case RenameMode::BeforeVersion: return "before-version";
        case RenameMode::Unset:
        default:
            return "unset";
    }
}

std::optional<RenameMode> parse_rename_mode(const std::string& s);

struct RenamePolicy {
    RenameMode mode = RenameMode::Unset;
    std::string separators = "-";                   // characters that may introduce the version
    std::vector<std::string> preserved_suffixes;    // re-appended after truncation, e.g. ".exe"
    std::map<std::string, std::string> names;       // exact file name -> installed name
};

// Stable command name for one file name, or nullopt when it stays as is.
// Only names containing {separator}{version} are truncated; explicit
// `names` entries apply regardless.
std::optional<std::string> stable_executable_name(const std::string& file_name,
                                                  const std::string& version,
                                                  const RenamePolicy& policy);

// ============================================================================
// Executable Renaming
// ============================================================================

struct RenamedFile {
    std::string from;
    std::string to;
};

struct RenameResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    std::vector<RenamedFile> renamed;
};

// Rename every file in bin_dir to its stable name.
// The whole plan is checked before anything moves: two files mapping to one
// name, or a target already taken, fail with LayoutConflict. An unset mode
// fails with InvalidConfiguration.
RenameResult rename_executables(const std::string& bin_dir,
                                const std::string& version,
                                const RenamePolicy& policy);

} // namespace binpack

#pragma once

#include <string>

namespace binpack {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

inline const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::Empty: return "empty path";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "path escapes extraction root";
        default: return "invalid path";
    }
}

struct PathResult {
    bool ok = false;
    std::string path;       // root joined with the normalized relative path
    std::string relative;   // normalized relative path, forward slashes
    PathError error = PathError::None;
};

// Resolve an archive member name below an extraction root without touching
// the filesystem.
// - Rejects NUL bytes, absolute names and drive-letter names
// - Strips "./" and collapses "." and ".." segments
// - Fails if the result would leave root, or would be root itself
PathResult resolve_under_root(const std::string& root, const std::string& entry_path);

} // namespace binpack

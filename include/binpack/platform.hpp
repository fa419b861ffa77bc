#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace binpack {

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Existence and type checks; none of them throw.
bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);
bool is_symlink(const std::string& path);

// True if `path` equals `root` or lies below it (lexical check)
bool is_within(const std::string& root, const std::string& path);

// Like is_within, but follows symlinks in both paths as they exist on disk.
// A missing tail is normalized lexically. Unresolvable paths are outside.
bool resolves_within(const std::string& root, const std::string& path);

// ============================================================================
// Directory Operations
// ============================================================================

// Entry names of a directory, sorted, hidden entries included.
// Empty if the path is not a readable directory.
std::vector<std::string> list_directory(const std::string& path);

// Create a directory and its parents
bool create_directories(const std::string& path);

// Remove a single empty directory; fails if it still has content
bool remove_empty_directory(const std::string& path);

// True if path is a directory the current process may write into
bool is_writable_directory(const std::string& path);

// ============================================================================
// File Operations
// ============================================================================

// Copy a file, overwriting the destination
bool copy_file(const std::string& src, const std::string& dst);

// Rename src to dst. Fails if dst already exists.
struct MoveResult {
    bool ok = false;
    std::string error;
};

MoveResult move_path(const std::string& src, const std::string& dst);

// Add execute permission for owner, group and others (chmod a+x)
bool set_executable(const std::string& path);

// True if any execute permission bit is set
bool has_execute_permission(const std::string& path);

// Read up to max_bytes from the start of a file
std::vector<uint8_t> read_file_head(const std::string& path, size_t max_bytes);

// Read max_bytes at a given offset; shorter result at end of file
std::vector<uint8_t> read_file_range(const std::string& path, uint64_t offset, size_t max_bytes);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace binpack

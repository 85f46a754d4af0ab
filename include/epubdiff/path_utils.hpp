#pragma once

#include <string>

namespace epubdiff {

// ============================================================================
// Archive Path Utilities
// ============================================================================
//
// All paths inside an EPUB are handled in a portable, POSIX-style form:
// forward slashes, no "." segments, ".." collapsed where possible and no
// leading "./".

// Convert backslashes to forward slashes
std::string to_portable_path(const std::string& path);

// Normalize an archive path:
// - backslashes become forward slashes
// - surrounding whitespace is trimmed
// - empty and "." segments are dropped, ".." removes the previous segment
// - a leading "/" is preserved, leading ".." segments of relative paths are kept
// Returns an empty string for an empty (or "." only) input.
std::string normalize_path(const std::string& path);

// Get the directory containing a path ("" for top-level entries)
std::string get_parent_directory(const std::string& path);

// Get the last path component
std::string get_filename(const std::string& path);

// Join a relative reference onto a base directory (not normalized).
// Absolute references are returned unchanged.
std::string join_path(const std::string& base, const std::string& rel);

// Join and normalize in one step
std::string resolve_relative(const std::string& base_dir, const std::string& rel);

} // namespace epubdiff

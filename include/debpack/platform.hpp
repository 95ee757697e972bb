#pragma once

#include <optional>
#include <string>
#include <vector>

namespace debpack {

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components. An absolute `rel` is returned unchanged.
std::string join_path(const std::string& base, const std::string& rel);

// Make a path absolute against the current working directory
std::string absolute_path(const std::string& path);

bool path_exists(const std::string& path);
bool is_regular_file(const std::string& path);

// Create directories recursively
bool create_directories(const std::string& path);

// Remove a directory recursively. Succeeds if the path does not exist.
bool remove_directory(const std::string& path);

// Remove a file. Succeeds if the path does not exist.
bool remove_file(const std::string& path);

// Copy a file, overwriting the destination
bool copy_file(const std::string& src, const std::string& dst);

// Read an entire file, nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// Write (truncate) a file
bool write_file(const std::string& path, const std::string& content);
bool write_file(const std::string& path, const std::vector<unsigned char>& content);

// ============================================================================
// File Modes
// ============================================================================

// Permission bits (mode & 07777) of a path, without following symlinks
std::optional<unsigned> file_mode(const std::string& path);

// Render a mode as four-digit octal, e.g. "0755"
std::string format_mode(unsigned mode);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable (nullopt if unset or empty)
std::optional<std::string> get_env(const std::string& name);

// Machine name reported by uname(2), e.g. "x86_64"
std::string get_host_machine();

// Generate a UUID string
std::string generate_uuid();

} // namespace debpack

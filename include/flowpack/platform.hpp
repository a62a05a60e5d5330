#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace flowpack {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// Readers of `path` see either the previous file or the complete new one.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// Create a directory (and parents) with fsync on the parent
AtomicWriteResult atomic_create_directory(const std::string& path);

// ============================================================================
// File Reading
// ============================================================================

std::optional<std::string> read_text_file(const std::string& path);
std::optional<std::vector<uint8_t>> read_binary_file(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format).
// Archive entries and manifest paths always use forward slashes.
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Create parent directories recursively
bool create_directories(const std::string& path);

// Remove a directory recursively
bool remove_directory(const std::string& path);

// Remove a single file; true when it is gone afterwards
bool remove_file(const std::string& path);

// Create a fresh, uniquely named directory under the system temp directory
std::optional<std::string> create_temp_directory(const std::string& prefix);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Format seconds since the Unix epoch as an RFC3339 UTC string
std::string format_timestamp(std::time_t seconds);

// Generate a UUID string
std::string generate_uuid();

} // namespace flowpack

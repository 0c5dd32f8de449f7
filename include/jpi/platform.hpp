#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace jpi {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// On failure the temp file is removed and `path` is left untouched.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// ============================================================================
// File Reading
// ============================================================================

struct FileReadResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
};

FileReadResult read_file_bytes(const std::string& path);

// Returns nullopt if the file cannot be read
std::optional<std::string> read_file_text(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format). Archive entry
// names and recorded paths always use forward slashes.
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Create directories recursively
bool create_directories(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

} // namespace jpi

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace jpi {

// ============================================================================
// Deterministic ZIP Archives
// ============================================================================

enum class ZipEntryType {
    File,
    Directory
};

struct ZipEntry {
    std::string path;  // forward slashes, no leading slash, no trailing slash
    ZipEntryType type = ZipEntryType::File;
    std::vector<uint8_t> data;
};

struct ZipResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> archive_data;
};

// Create a ZIP archive whose bytes depend only on the entries:
//   - META-INF/ and META-INF/MANIFEST.MF first, then lexicographic by path,
//     so every directory precedes its contents
//   - missing parent directories are added
//   - DOS timestamp 1980-01-01 00:00, no extra fields, fixed attributes
//   - raw deflate, or stored when deflate does not shrink the entry
// Duplicate, empty, absolute or ".." paths are rejected.
ZipResult create_deterministic_zip(const std::vector<ZipEntry>& entries);

struct ZipReadResult {
    bool ok = false;
    std::string error;
    std::vector<ZipEntry> entries;  // in central directory order
};

// Read stored and deflated entries; CRCs are verified
ZipReadResult read_zip(const std::vector<uint8_t>& archive_data);
ZipReadResult read_zip_file(const std::string& path);

// Returns nullptr if absent
const ZipEntry* find_zip_entry(const std::vector<ZipEntry>& entries, const std::string& path);

} // namespace jpi

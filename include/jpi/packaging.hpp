#pragma once

#include "jpi/build_config.hpp"
#include "jpi/manifest.hpp"
#include "jpi/scopes.hpp"
#include "jpi/zip.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace jpi {

// ============================================================================
// Package Descriptor
// ============================================================================

inline constexpr const char* MANIFEST_ENTRY = "META-INF/MANIFEST.MF";
inline constexpr const char* WEB_INF_DIR = "WEB-INF";
inline constexpr const char* LIBRARY_DIR = "WEB-INF/lib";

struct PackageDescriptor {
    std::string short_name;
    std::string file_extension = DEFAULT_FILE_EXTENSION;
    // Modules that never go into the library directory: everything
    // provided by the host, and every host extension
    std::set<ModuleId> excluded_modules;

    // "<short_name>.<file_extension>"
    std::string archive_name() const { return short_name + "." + file_extension; }
};

struct DescriptorResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    PackageDescriptor descriptor;
};

DescriptorResult make_package_descriptor(const BuildConfiguration& config,
                                         const ResolvedScopes& scopes);

// ============================================================================
// Archive Writer
// ============================================================================

struct WriteResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

// Capability to materialise an archive. Implementations must never leave a
// partial archive at `path`.
class ArchiveWriter {
public:
    virtual ~ArchiveWriter() = default;
    virtual WriteResult write(const std::string& path, const std::vector<ZipEntry>& entries) = 0;
};

// Deterministic ZIP written to a temporary file, then renamed into place
class ZipArchiveWriter : public ArchiveWriter {
public:
    WriteResult write(const std::string& path, const std::vector<ZipEntry>& entries) override;
};

// ============================================================================
// Archive Contents
// ============================================================================

struct CollectResult {
    bool ok = false;
    std::string error;
    std::vector<ZipEntry> entries;
};

// Regular files below `dir_path`, placed under `prefix` (may be empty).
// A missing directory yields no entries. Symlinks are rejected.
CollectResult collect_directory_entries(const std::string& dir_path, const std::string& prefix);

ZipEntry manifest_entry(const ManifestAttributes& attributes);

struct JarResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::string file_name;  // "<project>-<version>.jar"
    std::vector<ZipEntry> entries;
};

// The plugin's own classes and resources with the merged manifest
JarResult build_project_jar(const BuildConfiguration& config, const ManifestAttributes& manifest);

// "<project>-<version>-sources.jar" from the source directories
JarResult build_sources_jar(const BuildConfiguration& config);

// "<project>-<version>-javadoc.jar" from the generated javadoc directory
JarResult build_javadoc_jar(const BuildConfiguration& config);

// ============================================================================
// Package Assembly
// ============================================================================

struct CompiledJar {
    std::string file_name;
    std::vector<uint8_t> data;
};

struct PackageInputs {
    PackageDescriptor descriptor;
    CompiledJar compiled_jar;
    ManifestAttributes manifest;
    std::vector<ResolvedArtifact> runtime_artifacts;
    std::string license_report_dir;  // copied into WEB-INF/ when present
    std::string output_dir;
};

struct PackageResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::string archive_path;
    std::vector<std::string> libraries;  // WEB-INF/lib entries, sorted
};

// Entries of the container archive:
//   META-INF/MANIFEST.MF
//   WEB-INF/lib/<compiled jar>
//   WEB-INF/lib/<file name> for every runtime artifact not excluded,
//     deduplicated by file name
//   WEB-INF/<license report files>
struct ContainerResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::vector<ZipEntry> entries;
    std::vector<std::string> libraries;
};

ContainerResult build_container_entries(const PackageInputs& inputs);

// Build the container and hand it to `writer` at
// <output_dir>/<short_name>.<ext>
PackageResult assemble_package(const PackageInputs& inputs, ArchiveWriter& writer);

} // namespace jpi

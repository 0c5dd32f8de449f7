#include "jpi/packaging.hpp"
#include "jpi/classifier.hpp"
#include "jpi/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace jpi {

namespace {

std::string entry_path(const std::string& prefix, const std::string& rel) {
    return prefix.empty() ? rel : prefix + "/" + rel;
}

// Append `extra` to `entries`, skipping paths that are already present
void merge_entries(std::vector<ZipEntry>& entries, std::vector<ZipEntry> extra,
                   const std::string& context) {
    for (auto& entry : extra) {
        bool taken = std::any_of(entries.begin(), entries.end(), [&](const ZipEntry& e) {
            return e.path == entry.path && e.type == entry.type;
        });
        if (taken) {
            if (entry.type == ZipEntryType::File) {
                spdlog::warn("{}: duplicate entry {} skipped", context, entry.path);
            }
            continue;
        }
        entries.push_back(std::move(entry));
    }
}

template <typename Result>
Result assembly_error(const std::string& message) {
    Result result;
    result.error_kind = ErrorKind::Assembly;
    result.error = message;
    return result;
}

} // namespace

// ============================================================================
// Package Descriptor
// ============================================================================

DescriptorResult make_package_descriptor(const BuildConfiguration& config,
                                         const ResolvedScopes& scopes) {
    DescriptorResult result;

    const auto& settings = config.settings();
    if (!is_accepted_file_extension(settings.file_extension)) {
        result.error_kind = ErrorKind::Configuration;
        result.error = "unsupported file extension '" + settings.file_extension + "'";
        return result;
    }

    result.descriptor.short_name = config.short_name();
    if (result.descriptor.short_name.empty()) {
        result.error_kind = ErrorKind::Configuration;
        result.error = "missing required plugin metadata: short name";
        return result;
    }
    result.descriptor.file_extension = settings.file_extension;

    for (const auto& artifact : scopes.provided) {
        result.descriptor.excluded_modules.insert(artifact.id.module());
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Archive Writer
// ============================================================================

WriteResult ZipArchiveWriter::write(const std::string& path, const std::vector<ZipEntry>& entries) {
    WriteResult result;

    auto zip = create_deterministic_zip(entries);
    if (!zip.ok) {
        result.error_kind = ErrorKind::Assembly;
        result.error = path + ": " + zip.error;
        return result;
    }

    std::string dir = get_parent_directory(path);
    if (!dir.empty() && !create_directories(dir)) {
        result.error_kind = ErrorKind::Assembly;
        result.error = "failed to create directory: " + dir;
        return result;
    }

    auto written = atomic_write_file(path, zip.archive_data);
    if (!written.ok) {
        result.error_kind = ErrorKind::Assembly;
        result.error = written.error;
        return result;
    }

    spdlog::info("wrote {} ({} entries, {} bytes)", path, entries.size(), zip.archive_data.size());
    result.ok = true;
    return result;
}

// ============================================================================
// Archive Contents
// ============================================================================

CollectResult collect_directory_entries(const std::string& dir_path, const std::string& prefix) {
    CollectResult result;

    if (!fs::exists(dir_path)) {
        spdlog::debug("skipping missing directory {}", dir_path);
        result.ok = true;
        return result;
    }
    if (!fs::is_directory(dir_path)) {
        result.error = "not a directory: " + dir_path;
        return result;
    }

    fs::path base_path = fs::path(dir_path);

    try {
        for (const auto& entry : fs::recursive_directory_iterator(dir_path)) {
            std::string rel = to_portable_path(fs::relative(entry.path(), base_path).string());

            if (fs::is_symlink(entry.symlink_status())) {
                result.error = "symlinks are not permitted: " + rel;
                return result;
            }
            if (fs::is_directory(entry.status())) {
                continue;  // parents are derived from file paths
            }
            if (!fs::is_regular_file(entry.status())) {
                result.error = "unsupported file type: " + rel;
                return result;
            }

            std::ifstream file(entry.path(), std::ios::binary);
            if (!file) {
                result.error = "failed to read file: " + rel;
                return result;
            }

            ZipEntry zip_entry;
            zip_entry.path = entry_path(prefix, rel);
            zip_entry.data.assign(std::istreambuf_iterator<char>(file),
                                  std::istreambuf_iterator<char>());
            result.entries.push_back(std::move(zip_entry));
        }
    } catch (const fs::filesystem_error& e) {
        result.error = std::string("filesystem error: ") + e.what();
        return result;
    }

    std::sort(result.entries.begin(), result.entries.end(),
              [](const ZipEntry& a, const ZipEntry& b) { return a.path < b.path; });
    result.ok = true;
    return result;
}

ZipEntry manifest_entry(const ManifestAttributes& attributes) {
    ZipEntry entry;
    entry.path = MANIFEST_ENTRY;
    std::string text = write_manifest(attributes);
    entry.data.assign(text.begin(), text.end());
    return entry;
}

JarResult build_project_jar(const BuildConfiguration& config, const ManifestAttributes& manifest) {
    JarResult result;
    const auto& project = config.project();
    const auto& layout = config.layout();
    result.file_name = project.name + "-" + project.version + ".jar";

    result.entries.push_back(manifest_entry(manifest));

    std::vector<std::string> dirs;
    for (const auto& d : layout.classes_dirs) dirs.push_back(layout.resolve(d));
    dirs.push_back(layout.resolve(layout.resources_dir));

    for (const auto& dir : dirs) {
        auto collected = collect_directory_entries(dir, "");
        if (!collected.ok) {
            return assembly_error<JarResult>(result.file_name + ": " + collected.error);
        }
        merge_entries(result.entries, std::move(collected.entries), result.file_name);
    }

    result.ok = true;
    return result;
}

namespace {

// A publishing jar: a bare manifest plus the files of `dirs`
JarResult build_classified_jar(const BuildConfiguration& config, const std::string& classifier,
                               const std::vector<std::string>& dirs) {
    JarResult result;
    const auto& project = config.project();
    const auto& layout = config.layout();
    result.file_name = project.name + "-" + project.version + "-" + classifier + ".jar";

    ManifestAttributes manifest;
    manifest.set("Manifest-Version", "1.0");
    result.entries.push_back(manifest_entry(manifest));

    for (const auto& dir : dirs) {
        auto collected = collect_directory_entries(layout.resolve(dir), "");
        if (!collected.ok) {
            return assembly_error<JarResult>(result.file_name + ": " + collected.error);
        }
        merge_entries(result.entries, std::move(collected.entries), result.file_name);
    }

    result.ok = true;
    return result;
}

} // namespace

JarResult build_sources_jar(const BuildConfiguration& config) {
    return build_classified_jar(config, "sources", config.layout().source_dirs);
}

JarResult build_javadoc_jar(const BuildConfiguration& config) {
    return build_classified_jar(config, "javadoc", {config.layout().javadoc_dir});
}

// ============================================================================
// Package Assembly
// ============================================================================

ContainerResult build_container_entries(const PackageInputs& inputs) {
    ContainerResult result;
    const auto& descriptor = inputs.descriptor;

    result.entries.push_back(manifest_entry(inputs.manifest));

    if (inputs.compiled_jar.file_name.empty()) {
        return assembly_error<ContainerResult>("compiled jar has no file name");
    }
    ZipEntry nested;
    nested.path = std::string(LIBRARY_DIR) + "/" + inputs.compiled_jar.file_name;
    nested.data = inputs.compiled_jar.data;
    result.entries.push_back(std::move(nested));
    result.libraries.push_back(inputs.compiled_jar.file_name);

    for (const auto& artifact : inputs.runtime_artifacts) {
        if (is_host_extension(artifact)) {
            spdlog::debug("{}: skipping host extension {}", descriptor.archive_name(),
                          artifact.id.to_string());
            continue;
        }
        if (descriptor.excluded_modules.count(artifact.id.module()) > 0) {
            spdlog::debug("{}: skipping provided {}", descriptor.archive_name(),
                          artifact.id.to_string());
            continue;
        }

        std::string file_name = artifact.file_name();
        if (std::find(result.libraries.begin(), result.libraries.end(), file_name) !=
            result.libraries.end()) {
            continue;
        }

        auto bytes = read_file_bytes(artifact.file);
        if (!bytes.ok) {
            return assembly_error<ContainerResult>(descriptor.archive_name() + ": " + bytes.error);
        }

        ZipEntry lib;
        lib.path = std::string(LIBRARY_DIR) + "/" + file_name;
        lib.data = std::move(bytes.data);
        result.entries.push_back(std::move(lib));
        result.libraries.push_back(file_name);
    }

    if (!inputs.license_report_dir.empty()) {
        auto licenses = collect_directory_entries(inputs.license_report_dir, WEB_INF_DIR);
        if (!licenses.ok) {
            return assembly_error<ContainerResult>(descriptor.archive_name() + ": " + licenses.error);
        }
        merge_entries(result.entries, std::move(licenses.entries), descriptor.archive_name());
    }

    std::sort(result.libraries.begin(), result.libraries.end());
    result.ok = true;
    return result;
}

PackageResult assemble_package(const PackageInputs& inputs, ArchiveWriter& writer) {
    PackageResult result;
    const auto& descriptor = inputs.descriptor;

    if (!is_accepted_file_extension(descriptor.file_extension)) {
        result.error_kind = ErrorKind::Configuration;
        result.error = "unsupported file extension '" + descriptor.file_extension + "'";
        return result;
    }
    if (descriptor.short_name.empty()) {
        result.error_kind = ErrorKind::Configuration;
        result.error = "missing required plugin metadata: short name";
        return result;
    }

    auto container = build_container_entries(inputs);
    if (!container.ok) {
        result.error_kind = container.error_kind;
        result.error = container.error;
        return result;
    }

    std::string path = join_path(inputs.output_dir, descriptor.archive_name());
    auto written = writer.write(path, container.entries);
    if (!written.ok) {
        result.error_kind = written.error_kind;
        result.error = written.error;
        return result;
    }

    result.archive_path = path;
    result.libraries = std::move(container.libraries);
    result.ok = true;
    return result;
}

} // namespace jpi

#include "jpi/plugin_package.hpp"
#include "jpi/platform.hpp"
#include "jpi/zip.hpp"

#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace jpi {

namespace {

template <typename From>
void copy_error(PluginPackageResult& result, const From& from) {
    result.error_kind = from.error_kind;
    result.error = from.error;
}

} // namespace

std::string task_inputs_path(const ProjectLayout& layout, const std::string& task) {
    return join_path(join_path(join_path(layout.resolve(layout.build_dir), "tmp"), task),
                     "inputs.json");
}

WriteResult record_task_inputs(const ProjectLayout& layout, const ArchiveTask& task) {
    WriteResult result;

    nlohmann::json j;
    j["task"] = task.name;
    j["inputs"] = nlohmann::json::object();
    for (const auto& [key, value] : task.inputs) {
        j["inputs"][key] = value;
    }

    std::string path = task_inputs_path(layout, task.name);
    if (!create_directories(get_parent_directory(path))) {
        result.error_kind = ErrorKind::Assembly;
        result.error = "failed to create directory for " + path;
        return result;
    }

    auto written = atomic_write_file(path, j.dump(2) + "\n");
    if (!written.ok) {
        result.error_kind = ErrorKind::Assembly;
        result.error = written.error;
        return result;
    }

    result.ok = true;
    return result;
}

PluginPackageResult package_plugin(BuildConfiguration& config, DependencyResolver& resolver,
                                   ArchiveWriter& writer) {
    PluginPackageResult result;

    auto resolved = freeze_and_resolve(config, resolver);
    if (!resolved.ok) {
        copy_error(result, resolved);
        result.resolution_errors = resolved.resolution_errors;
        return result;
    }
    result.scopes = resolved.scopes;

    auto manifest = assemble_manifest(config, result.scopes);
    if (!manifest.ok) {
        copy_error(result, manifest);
        return result;
    }
    result.manifest = manifest.attributes;

    auto descriptor = make_package_descriptor(config, result.scopes);
    if (!descriptor.ok) {
        copy_error(result, descriptor);
        return result;
    }

    ArchiveTask jar_task{JAR_TASK_NAME, {}, {}};
    ArchiveTask package_task{PACKAGE_TASK_NAME, {}, {}};
    for (ArchiveTask* task : {&jar_task, &package_task}) {
        auto applied = apply_manifest(manifest.attributes, *task);
        if (!applied.ok) {
            copy_error(result, applied);
            return result;
        }
    }

    const auto& layout = config.layout();
    std::string libs_dir = layout.libs_dir();

    // Project jar, also nested inside the container
    auto jar = build_project_jar(config, jar_task.manifest);
    if (!jar.ok) {
        copy_error(result, jar);
        return result;
    }
    auto jar_zip = create_deterministic_zip(jar.entries);
    if (!jar_zip.ok) {
        result.error_kind = ErrorKind::Assembly;
        result.error = jar.file_name + ": " + jar_zip.error;
        return result;
    }
    result.jar_path = join_path(libs_dir, jar.file_name);
    auto jar_written = writer.write(result.jar_path, jar.entries);
    if (!jar_written.ok) {
        copy_error(result, jar_written);
        return result;
    }

    PackageInputs inputs;
    inputs.descriptor = descriptor.descriptor;
    inputs.compiled_jar = CompiledJar{jar.file_name, std::move(jar_zip.archive_data)};
    inputs.manifest = package_task.manifest;
    inputs.runtime_artifacts = result.scopes.bundled_libraries;
    inputs.license_report_dir = layout.resolve(layout.license_report_dir);
    inputs.output_dir = libs_dir;

    auto package = assemble_package(inputs, writer);
    if (!package.ok) {
        copy_error(result, package);
        return result;
    }
    result.archive_path = package.archive_path;
    result.libraries = package.libraries;

    if (config.settings().configure_publishing) {
        std::pair<JarResult, std::string*> published[] = {
            {build_sources_jar(config), &result.sources_jar_path},
            {build_javadoc_jar(config), &result.javadoc_jar_path},
        };
        for (auto& [jar, path] : published) {
            if (!jar.ok) {
                copy_error(result, jar);
                return result;
            }
            std::string target = join_path(libs_dir, jar.file_name);
            auto written = writer.write(target, jar.entries);
            if (!written.ok) {
                copy_error(result, written);
                return result;
            }
            *path = target;
        }
    }

    for (const ArchiveTask* task : {&jar_task, &package_task}) {
        auto recorded = record_task_inputs(layout, *task);
        if (!recorded.ok) {
            copy_error(result, recorded);
            return result;
        }
    }

    spdlog::info("packaged {} ({} libraries)", result.archive_path, result.libraries.size());
    result.ok = true;
    return result;
}

} // namespace jpi

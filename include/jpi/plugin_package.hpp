#pragma once

#include "jpi/build_config.hpp"
#include "jpi/manifest.hpp"
#include "jpi/packaging.hpp"
#include "jpi/resolver.hpp"
#include "jpi/scopes.hpp"

#include <string>
#include <vector>

namespace jpi {

inline constexpr const char* JAR_TASK_NAME = "jar";
inline constexpr const char* PACKAGE_TASK_NAME = "jpi";

struct PluginPackageResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::vector<ResolutionError> resolution_errors;

    std::string archive_path;
    std::string jar_path;
    std::string sources_jar_path;  // empty unless publishing is configured
    std::string javadoc_jar_path;  // likewise
    std::vector<std::string> libraries;

    ResolvedScopes scopes;
    ManifestAttributes manifest;
};

// <build>/tmp/<task>/inputs.json
std::string task_inputs_path(const ProjectLayout& layout, const std::string& task);

// Record a task's inputs so a later build can tell whether it is stale
WriteResult record_task_inputs(const ProjectLayout& layout, const ArchiveTask& task);

// The full packaging step: freeze and resolve, assemble and apply the
// manifest, write the project jar, the container archive and (with
// publishing) the sources and javadoc jars into <build>/libs. Nothing is written when a
// Configuration or Resolution error occurs.
PluginPackageResult package_plugin(BuildConfiguration& config, DependencyResolver& resolver,
                                   ArchiveWriter& writer);

} // namespace jpi

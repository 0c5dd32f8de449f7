#pragma once

#include "jpi/build_config.hpp"

#include <string>
#include <vector>

namespace jpi {

inline constexpr const char* PROJECT_FILE_NAME = "jpi.json";
inline constexpr const char* PROJECT_FILE_SCHEMA = "jpi.project.v1";

struct ProjectFileResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::vector<std::string> warnings;  // unknown fields, ignored values
};

// Apply a jpi.json document to a configuration in its Declaring phase.
// Relative paths in the document are relative to `base_dir`.
//
// {
//   "$schema": "jpi.project.v1",
//   "project": { "group": "org.example", "name": "widget-plugin", "version": "1.0" },
//   "jenkinsPlugin": { "coreVersion": "2.190", "fileExtension": "hpi", ... },
//   "repositories": [ "repo" ],
//   "dependencies": { "plugins": [ "org.example:other:1.2" ] },
//   "excludes": { "implementation": [ "commons-logging:commons-logging" ] },
//   "layout": { "buildDir": "build", "classesDirs": [ "build/classes/java/main" ] }
// }
ProjectFileResult apply_project_file(const std::string& json_str, const std::string& base_dir,
                                     BuildConfiguration& config);

// Read the file and apply it with its directory as base
ProjectFileResult load_project_file(const std::string& path, BuildConfiguration& config);

} // namespace jpi

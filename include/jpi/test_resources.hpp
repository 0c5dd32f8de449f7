#pragma once

#include "jpi/build_config.hpp"
#include "jpi/manifest.hpp"
#include "jpi/resolver.hpp"
#include "jpi/scopes.hpp"

#include <string>
#include <vector>

namespace jpi {

// ============================================================================
// Test Dependencies
// ============================================================================

// The plugin-resources request: group:name:version of every dependency
// declared on plugins, optional-plugins, server-plugins and test-plugins,
// plus the role's own declarations
ResolveRequest plugin_resources_request(const BuildConfiguration& config);

// <build>/resources/test/test-dependencies
std::string test_dependencies_dir(const ProjectLayout& layout);

struct StagedPlugin {
    std::string name;  // artifact name, listed in the index
    std::string type;  // hpi or jpi
    std::string path;
};

struct TestResourcesResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::vector<ResolutionError> resolution_errors;
    std::vector<StagedPlugin> staged;  // sorted by name
    std::string index_path;
};

// Copy the resolved host extensions to <dir>/<name>.<type> and write
// <dir>/index with one name per line. Requires a frozen configuration.
TestResourcesResult stage_test_dependencies(const BuildConfiguration& config,
                                            DependencyResolver& resolver);

// ============================================================================
// Test hpl
// ============================================================================

// <build>/generated-resources/test/the.hpl
std::string test_hpl_path(const ProjectLayout& layout);

// The plugin manifest plus Resource-Path (webapp directory) and Libraries
// (classes directories, resources directory and bundled libraries)
ManifestAttributes test_hpl_attributes(const BuildConfiguration& config,
                                       const ManifestAttributes& manifest,
                                       const ResolvedScopes& scopes);

struct HplResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::string path;
};

HplResult generate_test_hpl(const BuildConfiguration& config, const ManifestAttributes& manifest,
                            const ResolvedScopes& scopes);

} // namespace jpi

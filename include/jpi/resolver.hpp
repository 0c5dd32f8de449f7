#pragma once

#include "jpi/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace jpi {

// ============================================================================
// Resolver Collaborator Interface
// ============================================================================

struct ResolutionError {
    std::string role;
    ModuleVersionId module;
    std::string reason;

    // "<role>: <group>:<name>:<version>: <reason>"
    std::string message() const;
};

struct ResolveRequest {
    std::string role;
    std::vector<Dependency> dependencies;
    std::vector<ModuleId> excludes;  // applied to the whole graph
};

struct ResolveResult {
    std::vector<ResolvedArtifact> artifacts;
    std::vector<ResolutionError> errors;

    bool ok() const { return errors.empty(); }
};

// Resolves one role's dependency set into artifacts. Implementations must be
// safe to call concurrently for different requests.
class DependencyResolver {
public:
    virtual ~DependencyResolver() = default;
    virtual ResolveResult resolve(const ResolveRequest& request) = 0;
};

// ============================================================================
// Module Descriptors
// ============================================================================

// `<name>-<version>.module`: a subset of Gradle module metadata.
//
// {
//   "formatVersion": "1.1",
//   "component": { "group": "org.example", "module": "widget", "version": "1.0" },
//   "variants": [
//     { "name": "runtime",
//       "dependencies": [
//         { "group": "junit", "module": "junit", "version": { "requires": "4.12" },
//           "excludes": [ { "group": "org.hamcrest", "module": "hamcrest-core" } ] } ],
//       "files": [ { "name": "widget-1.0.hpi", "url": "widget-1.0.hpi" } ] }
//   ]
// }
//
// Dependencies and files are the union over all variants. The first file is
// the primary artifact; its extension is the artifact's packaging type.
struct ModuleFile {
    std::string name;
    std::string url;  // relative to the module directory
};

struct ModuleDescriptor {
    ModuleVersionId id;
    std::vector<Dependency> dependencies;
    std::vector<ModuleFile> files;
};

struct DescriptorParseResult {
    bool ok = false;
    std::string error;
    ModuleDescriptor descriptor;
};

DescriptorParseResult parse_module_descriptor(const std::string& json_str);

// <repository>/<group with dots as slashes>/<name>/<version>
std::string module_directory(const std::string& repository, const ModuleVersionId& id);

// <name>-<version>.module
std::string descriptor_file_name(const ModuleVersionId& id);

// ============================================================================
// Local Repository Resolver
// ============================================================================

// Upper bound on re-resolution passes after version upgrades
inline constexpr int MAX_RESOLVE_PASSES = 32;

// Resolves against Maven-layout directories on the local filesystem.
// Transitive, breadth-first; on conflict the highest version of a module
// wins, and only among the edges of the final graph. A module is pruned by
// an exclude only when every path reaching it excludes it.
class LocalRepositoryResolver : public DependencyResolver {
public:
    explicit LocalRepositoryResolver(std::vector<std::string> repositories);

    ResolveResult resolve(const ResolveRequest& request) override;

    const std::vector<std::string>& repositories() const { return repositories_; }

private:
    struct Lookup {
        bool ok = false;
        std::string error;
        std::string directory;
        std::shared_ptr<const ModuleDescriptor> descriptor;
    };

    Lookup load_descriptor(const ModuleVersionId& id);

    std::vector<std::string> repositories_;
    std::mutex cache_mutex_;
    std::map<ModuleVersionId, Lookup> cache_;
};

} // namespace jpi

#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace jpi {

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind {
    None,
    Configuration,  // invalid or late role/metadata declarations
    Resolution,     // artifact not found, version conflict
    Assembly        // I/O failure while writing an archive
};

inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Resolution: return "resolution";
        case ErrorKind::Assembly: return "assembly";
        default: return "unknown";
    }
}

// ============================================================================
// Module Identity
// ============================================================================

// group:name, the identity used for deduplication and exclusion
struct ModuleId {
    std::string group;
    std::string name;

    std::string to_string() const { return group + ":" + name; }

    bool operator==(const ModuleId& o) const { return group == o.group && name == o.name; }
    bool operator!=(const ModuleId& o) const { return !(*this == o); }
    bool operator<(const ModuleId& o) const {
        return std::tie(group, name) < std::tie(o.group, o.name);
    }
};

// group:name:version
struct ModuleVersionId {
    std::string group;
    std::string name;
    std::string version;

    ModuleId module() const { return ModuleId{group, name}; }
    std::string to_string() const { return group + ":" + name + ":" + version; }

    bool operator==(const ModuleVersionId& o) const {
        return group == o.group && name == o.name && version == o.version;
    }
    bool operator!=(const ModuleVersionId& o) const { return !(*this == o); }
    bool operator<(const ModuleVersionId& o) const {
        return std::tie(group, name, version) < std::tie(o.group, o.name, o.version);
    }
};

// Parse "group:name" (used by exclusion rules)
std::optional<ModuleId> parse_module_id(const std::string& text);

// ============================================================================
// Dependency Declarations
// ============================================================================

struct Dependency {
    ModuleVersionId id;
    // Non-empty for artifact-only notation ("group:name:version@jar"):
    // selects exactly one file and does not pull in transitive dependencies.
    std::string artifact_extension;
    std::vector<ModuleId> excludes;
    std::string reason;  // provenance, free text

    bool is_artifact_only() const { return !artifact_extension.empty(); }

    // "group:name:version" or "group:name:version@ext"
    std::string to_notation() const;
};

struct NotationParseResult {
    bool ok = false;
    std::string error;
    Dependency dependency;
};

// Parse "group:name:version[@ext]"
NotationParseResult parse_dependency_notation(const std::string& notation);

// ============================================================================
// Resolved Artifacts
// ============================================================================

// Produced by a DependencyResolver; immutable once resolution completes.
struct ResolvedArtifact {
    ModuleVersionId id;
    std::string type;        // declared packaging type: "jar", "hpi", "jpi", ...
    std::string classifier;  // e.g. "sources", usually empty
    std::string file;        // location of the binary

    // Base file name of the binary (e.g. "junit-4.12.jar")
    std::string file_name() const;
};

enum class ArtifactKind {
    HostExtension,   // an extension archive supplied by the host at runtime
    OrdinaryLibrary
};

inline const char* artifact_kind_to_string(ArtifactKind k) {
    switch (k) {
        case ArtifactKind::HostExtension: return "host-extension";
        case ArtifactKind::OrdinaryLibrary: return "library";
        default: return "unknown";
    }
}

} // namespace jpi

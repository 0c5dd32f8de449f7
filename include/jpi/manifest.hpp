#pragma once

#include "jpi/build_config.hpp"
#include "jpi/scopes.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jpi {

// ============================================================================
// Manifest Attributes
// ============================================================================

// Ordered name -> value map. Values are plain single-line strings.
class ManifestAttributes {
public:
    // Replaces the value in place when the name exists, else appends
    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    bool contains(const std::string& name) const;

    const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // "name: value\n" per attribute, in order
    std::string canonical_text() const;

    bool operator==(const ManifestAttributes& o) const { return entries_ == o.entries_; }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

struct ManifestResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    ManifestAttributes attributes;
};

// Plugin-Dependencies value: "a:1.0,b:2.0;resolution:=optional"
std::string format_plugin_dependencies(const std::vector<PluginDependency>& dependencies);

// Derive the plugin attributes. Fails with a Configuration error when the
// short name or the version is missing, or a value spans several lines.
ManifestResult assemble_manifest(const ProjectInfo& project, const PluginSettings& settings,
                                 const std::vector<PluginDependency>& plugin_dependencies);

ManifestResult assemble_manifest(const BuildConfiguration& config, const ResolvedScopes& scopes);

// ============================================================================
// Archive Tasks
// ============================================================================

// An archive about to be written: its manifest plus the recorded build
// inputs used for up-to-date checks
struct ArchiveTask {
    std::string name;
    ManifestAttributes manifest;
    std::map<std::string, std::string> inputs;
};

struct ApplyResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

inline constexpr const char* MANIFEST_INPUT_KEY = "manifest";

// Merge `attributes` into the task's manifest (attributes set by others are
// kept) and record their SHA-256 fingerprint under the "manifest" input.
ApplyResult apply_manifest(const ManifestAttributes& attributes, ArchiveTask& task);

// ============================================================================
// MANIFEST.MF
// ============================================================================

inline constexpr std::size_t MANIFEST_LINE_LIMIT = 72;

// Main section only: Manifest-Version first, CRLF line ends, lines wrapped
// at 72 bytes with single-space continuation lines
std::string write_manifest(const ManifestAttributes& attributes);

ManifestResult parse_manifest(const std::string& text);

} // namespace jpi

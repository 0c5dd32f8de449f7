#include "jpi/manifest.hpp"
#include "jpi/digest.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace jpi {

namespace {

constexpr const char* MANIFEST_VERSION = "Manifest-Version";

bool is_single_line(const std::string& s) {
    return s.find('\n') == std::string::npos && s.find('\r') == std::string::npos;
}

ManifestResult manifest_error(ErrorKind kind, const std::string& message) {
    ManifestResult result;
    result.error_kind = kind;
    result.error = message;
    return result;
}

// Append one attribute as wrapped CRLF lines
void write_attribute(std::string& out, const std::string& name, const std::string& value) {
    std::string line = name + ": " + value;
    size_t limit = MANIFEST_LINE_LIMIT;
    size_t pos = 0;
    bool first = true;

    while (pos < line.size()) {
        size_t take = std::min(limit, line.size() - pos);
        // Never cut a UTF-8 sequence in half
        while (take > 1 && pos + take < line.size() &&
               (static_cast<unsigned char>(line[pos + take]) & 0xC0) == 0x80) {
            --take;
        }
        if (!first) out += ' ';
        out.append(line, pos, take);
        out += "\r\n";
        pos += take;
        first = false;
        limit = MANIFEST_LINE_LIMIT - 1;
    }
}

} // namespace

// ============================================================================
// ManifestAttributes
// ============================================================================

void ManifestAttributes::set(const std::string& name, const std::string& value) {
    for (auto& entry : entries_) {
        if (entry.first == name) {
            entry.second = value;
            return;
        }
    }
    entries_.emplace_back(name, value);
}

std::optional<std::string> ManifestAttributes::get(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) return entry.second;
    }
    return std::nullopt;
}

bool ManifestAttributes::contains(const std::string& name) const {
    return get(name).has_value();
}

std::string ManifestAttributes::canonical_text() const {
    std::string text;
    for (const auto& [name, value] : entries_) {
        text += name + ": " + value + "\n";
    }
    return text;
}

// ============================================================================
// Assembly
// ============================================================================

std::string format_plugin_dependencies(const std::vector<PluginDependency>& dependencies) {
    std::string value;
    for (const auto& dep : dependencies) {
        if (!value.empty()) value += ",";
        value += dep.name + ":" + dep.version;
        if (dep.optional) value += ";resolution:=optional";
    }
    return value;
}

ManifestResult assemble_manifest(const ProjectInfo& project, const PluginSettings& settings,
                                 const std::vector<PluginDependency>& plugin_dependencies) {
    std::string short_name = derive_short_name(project.name, settings.short_name);
    if (short_name.empty()) {
        return manifest_error(ErrorKind::Configuration,
                              "missing required plugin metadata: short name");
    }
    if (project.version.empty()) {
        return manifest_error(ErrorKind::Configuration,
                              "missing required plugin metadata: version of '" + short_name + "'");
    }

    ManifestResult result;
    auto& attrs = result.attributes;

    auto put_optional = [&attrs](const char* name, const std::string& value) {
        if (!value.empty()) attrs.set(name, value);
    };

    attrs.set(MANIFEST_VERSION, "1.0");
    put_optional("Group-Id", project.group);
    attrs.set("Short-Name", short_name);
    attrs.set("Long-Name", settings.display_name.empty() ? short_name : settings.display_name);
    put_optional("Url", settings.url);
    put_optional("Compatible-Since-Version", settings.compatible_since_version);
    if (settings.sandbox_status) attrs.set("Sandbox-Status", "true");
    attrs.set("Extension-Name", short_name);
    attrs.set("Implementation-Title", project.name.empty() ? short_name : project.name);
    attrs.set("Implementation-Version", project.version);
    put_optional("Specification-Title", project.description);
    attrs.set("Plugin-Version", project.version);
    put_optional("Hudson-Version", settings.core_version);
    put_optional("Jenkins-Version", settings.core_version);
    put_optional("Mask-Classes", settings.mask_classes);
    if (settings.plugin_first_class_loader) attrs.set("PluginFirstClassLoader", "true");
    put_optional("Plugin-Dependencies", format_plugin_dependencies(plugin_dependencies));

    for (const auto& [name, value] : attrs.entries()) {
        if (!is_single_line(value)) {
            return manifest_error(ErrorKind::Configuration,
                                  "manifest attribute " + name + " must be a single line");
        }
    }

    result.ok = true;
    return result;
}

ManifestResult assemble_manifest(const BuildConfiguration& config, const ResolvedScopes& scopes) {
    return assemble_manifest(config.project(), config.settings(), scopes.plugin_dependencies);
}

ApplyResult apply_manifest(const ManifestAttributes& attributes, ArchiveTask& task) {
    ApplyResult result;

    auto fingerprint = compute_text_sha256(attributes.canonical_text());
    if (!fingerprint.ok) {
        result.error_kind = ErrorKind::Assembly;
        result.error = task.name + ": manifest fingerprint: " + fingerprint.error;
        return result;
    }

    for (const auto& [name, value] : attributes.entries()) {
        task.manifest.set(name, value);
    }
    task.inputs[MANIFEST_INPUT_KEY] = fingerprint.hex_digest;

    spdlog::debug("{}: manifest applied ({} attributes, fingerprint {})", task.name,
                  attributes.size(), fingerprint.hex_digest.substr(0, 12));
    result.ok = true;
    return result;
}

// ============================================================================
// MANIFEST.MF
// ============================================================================

std::string write_manifest(const ManifestAttributes& attributes) {
    std::string out;
    write_attribute(out, MANIFEST_VERSION, attributes.get(MANIFEST_VERSION).value_or("1.0"));
    for (const auto& [name, value] : attributes.entries()) {
        if (name == MANIFEST_VERSION) continue;
        write_attribute(out, name, value);
    }
    out += "\r\n";
    return out;
}

ManifestResult parse_manifest(const std::string& text) {
    ManifestResult result;

    // Split into physical lines, accepting CRLF, LF and CR
    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            lines.push_back(current);
            current.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            current += c;
        }
    }
    if (!current.empty()) lines.push_back(current);

    // Join continuation lines, stop at the end of the main section
    std::vector<std::string> logical;
    for (const auto& line : lines) {
        if (line.empty()) break;
        if (line[0] == ' ') {
            if (logical.empty()) {
                return manifest_error(ErrorKind::Assembly,
                                      "manifest starts with a continuation line");
            }
            logical.back() += line.substr(1);
        } else {
            logical.push_back(line);
        }
    }

    for (const auto& line : logical) {
        auto sep = line.find(": ");
        if (sep == std::string::npos || sep == 0) {
            return manifest_error(ErrorKind::Assembly, "malformed manifest line: " + line);
        }
        result.attributes.set(line.substr(0, sep), line.substr(sep + 2));
    }

    result.ok = true;
    return result;
}

} // namespace jpi

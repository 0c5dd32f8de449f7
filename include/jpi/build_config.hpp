#pragma once

#include "jpi/role_graph.hpp"
#include "jpi/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jpi {

// ============================================================================
// Project Metadata
// ============================================================================

struct ProjectInfo {
    std::string group;
    std::string name;     // project identifier, e.g. "widget-plugin"
    std::string version;
    std::string description;
};

// ============================================================================
// Plugin Settings (host collaborator configuration surface)
// ============================================================================

inline constexpr const char* DEFAULT_FILE_EXTENSION = "hpi";
inline constexpr const char* ALTERNATE_FILE_EXTENSION = "jpi";
inline constexpr const char* PLUGIN_NAME_SUFFIX = "-plugin";

struct PluginSettings {
    std::optional<std::string> short_name;      // defaults to project name minus "-plugin"
    std::string file_extension = DEFAULT_FILE_EXTENSION;
    std::string display_name;                   // defaults to the short name
    std::string url;
    std::string core_version;
    std::string compatible_since_version;
    bool sandbox_status = false;
    bool plugin_first_class_loader = false;
    std::string mask_classes;

    bool configure_repositories = true;
    bool configure_publishing = true;
    bool disabled_test_injection = false;  // consumed, not acted upon
    std::string injected_test_name = "InjectedTest";
};

// True for the two accepted archive extensions
bool is_accepted_file_extension(const std::string& extension);

// Short name: the explicit override verbatim, otherwise the project name
// with a trailing "-plugin" removed
std::string derive_short_name(const std::string& project_name,
                              const std::optional<std::string>& explicit_short_name);

// ============================================================================
// Project Layout
// ============================================================================

// Paths are relative to base_dir unless absolute
struct ProjectLayout {
    std::string base_dir = ".";
    std::string build_dir = "build";
    std::vector<std::string> classes_dirs = {"build/classes/java/main"};
    std::string resources_dir = "build/resources/main";
    std::vector<std::string> source_dirs = {"src/main/java"};
    std::string javadoc_dir = "build/docs/javadoc";
    std::string license_report_dir = "build/licenses";
    std::string webapp_dir = "src/main/webapp";

    std::string resolve(const std::string& path) const;
    std::string libs_dir() const;  // <build>/libs
};

// ============================================================================
// Build Configuration
// ============================================================================

enum class ConfigPhase {
    Declaring,  // user configuration may still mutate the graph
    Frozen      // resolution has started; every mutation is an error
};

struct ConfigResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

// Intent to re-add the host extensions resolved from `source` to `target`
// as compile-visible, non-bundled jars. Executed by ScopeRewriter.
struct RewriteRule {
    RoleHandle source = 0;
    RoleHandle target = 0;
};

// The single explicit configuration object passed to resolution and
// assembly. Constructed once, mutated during the Declaring phase, frozen
// before the first resolution read.
class BuildConfiguration {
public:
    // Standard role graph and the three standard rewrite rules:
    // plugins and optional-plugins into provided-compile, test-plugins
    // into test-implementation
    BuildConfiguration();
    // Custom graph without rewrite rules
    explicit BuildConfiguration(RoleGraph graph);

    const RoleGraph& roles() const { return roles_; }
    ConfigPhase phase() const { return phase_; }
    bool frozen() const { return phase_ == ConfigPhase::Frozen; }

    // Role graph mutation (forwarded so the freeze check applies)
    RoleResult define_role(const std::string& name, RoleVisibility visibility,
                           const std::string& description = "");
    RoleResult declare_extends(const std::string& role, const std::string& target);
    ConfigResult add_exclude(const std::string& role, const ModuleId& module);

    ConfigResult declare_dependency(const std::string& role, const Dependency& dependency);
    ConfigResult declare_dependency(const std::string& role, const std::string& notation);

    // Rules run in declaration order; the first rule to add a module to a
    // target wins
    ConfigResult declare_rewrite(const std::string& source, const std::string& target);
    const std::vector<RewriteRule>& rewrite_rules() const { return rewrite_rules_; }

    ConfigResult add_repository(const std::string& path);
    ConfigResult set_project(const ProjectInfo& project);
    ConfigResult set_plugin_settings(const PluginSettings& settings);
    ConfigResult set_layout(const ProjectLayout& layout);

    // Validate the role graph and transition to Frozen. Idempotent.
    ConfigResult freeze();

    const ProjectInfo& project() const { return project_; }
    const PluginSettings& settings() const { return settings_; }
    const ProjectLayout& layout() const { return layout_; }

    // Dependencies declared directly on a role (not inherited)
    const std::vector<Dependency>& declared(RoleHandle role) const;
    const std::vector<Dependency>& declared(const std::string& role) const;

    // Explicit repositories followed by the default local repository when
    // settings().configure_repositories is set
    std::vector<std::string> repositories() const;

    std::string short_name() const {
        return derive_short_name(project_.name, settings_.short_name);
    }

private:
    ConfigResult check_mutable(const std::string& what) const;

    RoleGraph roles_;
    std::map<RoleHandle, std::vector<Dependency>> declared_;
    std::vector<RewriteRule> rewrite_rules_;
    std::vector<std::string> repositories_;
    ProjectInfo project_;
    PluginSettings settings_;
    ProjectLayout layout_;
    ConfigPhase phase_ = ConfigPhase::Declaring;
};

// Default local repository: $JPI_LOCAL_REPOSITORY, else ~/.m2/repository
std::string default_local_repository();

} // namespace jpi

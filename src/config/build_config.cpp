#include "jpi/build_config.hpp"
#include "jpi/platform.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace jpi {

namespace {

ConfigResult config_error(const std::string& message) {
    ConfigResult result;
    result.error_kind = ErrorKind::Configuration;
    result.error = message;
    return result;
}

ConfigResult from_role_result(const RoleResult& r) {
    ConfigResult result;
    result.ok = r.ok;
    result.error_kind = r.error_kind;
    result.error = r.error;
    return result;
}

ConfigResult ok_result() {
    ConfigResult result;
    result.ok = true;
    return result;
}

bool is_absolute(const std::string& path) {
    if (path.empty()) return false;
    if (path[0] == '/' || path[0] == '\\') return true;
    return path.size() > 1 && path[1] == ':';
}

const std::vector<Dependency> empty_dependencies;

} // namespace

bool is_accepted_file_extension(const std::string& extension) {
    return extension == DEFAULT_FILE_EXTENSION || extension == ALTERNATE_FILE_EXTENSION;
}

std::string derive_short_name(const std::string& project_name,
                              const std::optional<std::string>& explicit_short_name) {
    if (explicit_short_name && !explicit_short_name->empty()) {
        return *explicit_short_name;
    }

    const std::string suffix = PLUGIN_NAME_SUFFIX;
    if (project_name.size() > suffix.size() &&
        project_name.compare(project_name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return project_name.substr(0, project_name.size() - suffix.size());
    }
    return project_name;
}

std::string ProjectLayout::resolve(const std::string& path) const {
    if (is_absolute(path) || base_dir.empty() || base_dir == ".") {
        return to_portable_path(path);
    }
    return join_path(base_dir, path);
}

std::string ProjectLayout::libs_dir() const {
    return join_path(resolve(build_dir), "libs");
}

std::string default_local_repository() {
    if (auto env = get_env("JPI_LOCAL_REPOSITORY")) {
        if (!env->empty()) return *env;
    }
    if (auto home = get_env("HOME")) {
        if (!home->empty()) return join_path(*home, ".m2/repository");
    }
    if (auto profile = get_env("USERPROFILE")) {
        if (!profile->empty()) return join_path(*profile, ".m2/repository");
    }
    return ".m2/repository";
}

// ============================================================================
// BuildConfiguration
// ============================================================================

BuildConfiguration::BuildConfiguration() : roles_(make_standard_role_graph()) {
    const std::pair<const char*, const char*> standard_rewrites[] = {
        {roles::PLUGINS, roles::PROVIDED_COMPILE},
        {roles::OPTIONAL_PLUGINS, roles::PROVIDED_COMPILE},
        {roles::TEST_PLUGINS, roles::TEST_IMPLEMENTATION},
    };
    for (const auto& [source, target] : standard_rewrites) {
        auto r = declare_rewrite(source, target);
        if (!r.ok) {
            spdlog::error("standard rewrite rules: {}", r.error);
        }
    }
}

BuildConfiguration::BuildConfiguration(RoleGraph graph) : roles_(std::move(graph)) {}

ConfigResult BuildConfiguration::check_mutable(const std::string& what) const {
    if (frozen()) {
        return config_error("configuration is frozen: cannot " + what +
                            " after resolution has started");
    }
    return ok_result();
}

RoleResult BuildConfiguration::define_role(const std::string& name, RoleVisibility visibility,
                                           const std::string& description) {
    // The graph itself rejects mutation once frozen
    return roles_.define_role(name, visibility, description);
}

RoleResult BuildConfiguration::declare_extends(const std::string& role, const std::string& target) {
    return roles_.declare_extends(role, target);
}

ConfigResult BuildConfiguration::add_exclude(const std::string& role, const ModuleId& module) {
    auto check = check_mutable("add exclude " + module.to_string() + " to '" + role + "'");
    if (!check.ok) return check;

    auto found = roles_.find(role);
    if (!found.ok) return from_role_result(found);
    return from_role_result(roles_.add_exclude(found.handle, module));
}

ConfigResult BuildConfiguration::declare_dependency(const std::string& role,
                                                    const Dependency& dependency) {
    auto check = check_mutable("declare " + dependency.to_notation() + " on '" + role + "'");
    if (!check.ok) return check;

    auto found = roles_.find(role);
    if (!found.ok) return from_role_result(found);

    auto& deps = declared_[found.handle];
    bool duplicate = std::any_of(deps.begin(), deps.end(), [&](const Dependency& d) {
        return d.id == dependency.id && d.artifact_extension == dependency.artifact_extension;
    });
    if (!duplicate) {
        deps.push_back(dependency);
    }
    return ok_result();
}

ConfigResult BuildConfiguration::declare_dependency(const std::string& role,
                                                    const std::string& notation) {
    auto parsed = parse_dependency_notation(notation);
    if (!parsed.ok) {
        return config_error(role + ": " + parsed.error);
    }
    return declare_dependency(role, parsed.dependency);
}

ConfigResult BuildConfiguration::declare_rewrite(const std::string& source,
                                                 const std::string& target) {
    auto check = check_mutable("declare rewrite from '" + source + "' to '" + target + "'");
    if (!check.ok) return check;

    auto from = roles_.find(source);
    if (!from.ok) return from_role_result(from);
    auto to = roles_.find(target);
    if (!to.ok) return from_role_result(to);
    if (from.handle == to.handle) {
        return config_error("rewrite source and target must differ: '" + source + "'");
    }

    for (const auto& rule : rewrite_rules_) {
        if (rule.source == from.handle && rule.target == to.handle) return ok_result();
    }
    rewrite_rules_.push_back(RewriteRule{from.handle, to.handle});
    return ok_result();
}

ConfigResult BuildConfiguration::add_repository(const std::string& path) {
    auto check = check_mutable("add repository '" + path + "'");
    if (!check.ok) return check;

    if (path.empty()) {
        return config_error("repository path must not be empty");
    }
    if (std::find(repositories_.begin(), repositories_.end(), path) == repositories_.end()) {
        repositories_.push_back(path);
    }
    return ok_result();
}

ConfigResult BuildConfiguration::set_project(const ProjectInfo& project) {
    auto check = check_mutable("change project metadata");
    if (!check.ok) return check;
    project_ = project;
    return ok_result();
}

ConfigResult BuildConfiguration::set_plugin_settings(const PluginSettings& settings) {
    auto check = check_mutable("change plugin settings");
    if (!check.ok) return check;

    if (!is_accepted_file_extension(settings.file_extension)) {
        return config_error("unsupported file extension '" + settings.file_extension +
                            "' (expected " + DEFAULT_FILE_EXTENSION + " or " +
                            ALTERNATE_FILE_EXTENSION + ")");
    }
    settings_ = settings;
    return ok_result();
}

ConfigResult BuildConfiguration::set_layout(const ProjectLayout& layout) {
    auto check = check_mutable("change project layout");
    if (!check.ok) return check;
    layout_ = layout;
    return ok_result();
}

ConfigResult BuildConfiguration::freeze() {
    if (frozen()) return ok_result();

    auto valid = roles_.validate();
    if (!valid.ok) return from_role_result(valid);

    roles_.freeze();
    phase_ = ConfigPhase::Frozen;
    spdlog::info("configuration frozen ({} roles)", roles_.size());
    return ok_result();
}

const std::vector<Dependency>& BuildConfiguration::declared(RoleHandle role) const {
    auto it = declared_.find(role);
    if (it == declared_.end()) return empty_dependencies;
    return it->second;
}

const std::vector<Dependency>& BuildConfiguration::declared(const std::string& role) const {
    auto found = roles_.find(role);
    if (!found.ok) return empty_dependencies;
    return declared(found.handle);
}

std::vector<std::string> BuildConfiguration::repositories() const {
    std::vector<std::string> result;
    for (const auto& repo : repositories_) {
        result.push_back(layout_.resolve(repo));
    }
    if (settings_.configure_repositories) {
        auto local = default_local_repository();
        if (std::find(result.begin(), result.end(), local) == result.end()) {
            result.push_back(local);
        }
    }
    return result;
}

} // namespace jpi

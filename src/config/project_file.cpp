#include "jpi/project_file.hpp"
#include "jpi/platform.hpp"

#include <optional>
#include <set>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace jpi {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            }
        }
    }
    return result;
}

void warn_unknown(const nlohmann::json& section, const std::set<std::string>& known,
                  const std::string& prefix, std::vector<std::string>& warnings) {
    for (const auto& [key, _] : section.items()) {
        if (known.find(key) == known.end()) {
            warnings.push_back("unknown field '" + prefix + key + "' (ignored)");
        }
    }
}

ProjectFileResult from_config(const ConfigResult& r, std::vector<std::string> warnings) {
    ProjectFileResult result;
    result.ok = r.ok;
    result.error_kind = r.error_kind;
    result.error = r.error;
    result.warnings = std::move(warnings);
    return result;
}

} // namespace

ProjectFileResult apply_project_file(const std::string& json_str, const std::string& base_dir,
                                     BuildConfiguration& config) {
    ProjectFileResult result;
    result.error_kind = ErrorKind::Configuration;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "project file must be a JSON object";
            return result;
        }

        static const std::set<std::string> known_top_level = {
            "$schema", "project", "jenkinsPlugin", "repositories",
            "dependencies", "excludes", "layout"};
        warn_unknown(j, known_top_level, "", result.warnings);

        if (auto schema = get_string(j, "$schema")) {
            if (*schema != PROJECT_FILE_SCHEMA) {
                result.error = "$schema mismatch: expected " + std::string(PROJECT_FILE_SCHEMA);
                return result;
            }
        }

        // "project"
        ProjectInfo project = config.project();
        if (j.contains("project") && j["project"].is_object()) {
            const auto& p = j["project"];
            warn_unknown(p, {"group", "name", "version", "description"}, "project.",
                         result.warnings);
            project.group = get_string(p, "group").value_or(project.group);
            project.name = get_string(p, "name").value_or(project.name);
            project.version = get_string(p, "version").value_or(project.version);
            project.description = get_string(p, "description").value_or(project.description);
        }
        auto applied = config.set_project(project);
        if (!applied.ok) return from_config(applied, result.warnings);

        // "jenkinsPlugin"
        PluginSettings settings = config.settings();
        if (j.contains("jenkinsPlugin") && j["jenkinsPlugin"].is_object()) {
            const auto& s = j["jenkinsPlugin"];
            warn_unknown(s,
                         {"shortName", "fileExtension", "displayName", "url", "coreVersion",
                          "compatibleSinceVersion", "sandboxStatus", "pluginFirstClassLoader",
                          "maskClasses", "configureRepositories", "configurePublishing",
                          "disabledTestInjection", "injectedTestName"},
                         "jenkinsPlugin.", result.warnings);

            if (auto v = get_string(s, "shortName")) settings.short_name = *v;
            settings.file_extension = get_string(s, "fileExtension").value_or(settings.file_extension);
            settings.display_name = get_string(s, "displayName").value_or(settings.display_name);
            settings.url = get_string(s, "url").value_or(settings.url);
            settings.core_version = get_string(s, "coreVersion").value_or(settings.core_version);
            settings.compatible_since_version =
                get_string(s, "compatibleSinceVersion").value_or(settings.compatible_since_version);
            settings.sandbox_status = get_bool(s, "sandboxStatus").value_or(settings.sandbox_status);
            settings.plugin_first_class_loader =
                get_bool(s, "pluginFirstClassLoader").value_or(settings.plugin_first_class_loader);
            settings.mask_classes = get_string(s, "maskClasses").value_or(settings.mask_classes);
            settings.configure_repositories =
                get_bool(s, "configureRepositories").value_or(settings.configure_repositories);
            settings.configure_publishing =
                get_bool(s, "configurePublishing").value_or(settings.configure_publishing);
            settings.disabled_test_injection =
                get_bool(s, "disabledTestInjection").value_or(settings.disabled_test_injection);
            settings.injected_test_name =
                get_string(s, "injectedTestName").value_or(settings.injected_test_name);
        }
        applied = config.set_plugin_settings(settings);
        if (!applied.ok) return from_config(applied, result.warnings);

        // "layout"
        ProjectLayout layout = config.layout();
        layout.base_dir = base_dir.empty() ? "." : base_dir;
        if (j.contains("layout") && j["layout"].is_object()) {
            const auto& l = j["layout"];
            warn_unknown(l,
                         {"buildDir", "classesDirs", "resourcesDir", "sourceDirs",
                          "javadocDir", "licenseReportDir", "webappDir"},
                         "layout.", result.warnings);
            layout.build_dir = get_string(l, "buildDir").value_or(layout.build_dir);
            if (l.contains("classesDirs")) layout.classes_dirs = get_string_array(l, "classesDirs");
            layout.resources_dir = get_string(l, "resourcesDir").value_or(layout.resources_dir);
            if (l.contains("sourceDirs")) layout.source_dirs = get_string_array(l, "sourceDirs");
            layout.javadoc_dir = get_string(l, "javadocDir").value_or(layout.javadoc_dir);
            layout.license_report_dir =
                get_string(l, "licenseReportDir").value_or(layout.license_report_dir);
            layout.webapp_dir = get_string(l, "webappDir").value_or(layout.webapp_dir);
        }
        applied = config.set_layout(layout);
        if (!applied.ok) return from_config(applied, result.warnings);

        // "repositories"
        for (const auto& repo : get_string_array(j, "repositories")) {
            applied = config.add_repository(repo);
            if (!applied.ok) return from_config(applied, result.warnings);
        }

        // "dependencies": role -> notations
        if (j.contains("dependencies") && j["dependencies"].is_object()) {
            for (const auto& [role, notations] : j["dependencies"].items()) {
                if (!notations.is_array()) {
                    result.warnings.push_back("dependencies." + role + " is not an array (ignored)");
                    continue;
                }
                for (const auto& n : notations) {
                    if (!n.is_string()) {
                        result.warnings.push_back("non-string entry in dependencies." + role +
                                                  " (ignored)");
                        continue;
                    }
                    applied = config.declare_dependency(role, n.get<std::string>());
                    if (!applied.ok) return from_config(applied, result.warnings);
                }
            }
        }

        // "excludes": role -> group:name
        if (j.contains("excludes") && j["excludes"].is_object()) {
            for (const auto& [role, modules] : j["excludes"].items()) {
                if (!modules.is_array()) {
                    result.warnings.push_back("excludes." + role + " is not an array (ignored)");
                    continue;
                }
                for (const auto& item : modules) {
                    std::string text = item.is_string() ? item.get<std::string>() : "";
                    auto module = parse_module_id(text);
                    if (!module) {
                        result.error = "excludes." + role + ": expected group:name, got '" +
                                       text + "'";
                        return result;
                    }
                    applied = config.add_exclude(role, *module);
                    if (!applied.ok) return from_config(applied, result.warnings);
                }
            }
        }

        for (const auto& w : result.warnings) {
            spdlog::warn("{}", w);
        }

        result.ok = true;
        result.error_kind = ErrorKind::None;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ProjectFileResult load_project_file(const std::string& path, BuildConfiguration& config) {
    auto text = read_file_text(path);
    if (!text) {
        ProjectFileResult result;
        result.error_kind = ErrorKind::Configuration;
        result.error = "cannot read project file: " + path;
        return result;
    }
    std::string base = get_parent_directory(path);
    return apply_project_file(*text, base.empty() ? "." : base, config);
}

} // namespace jpi

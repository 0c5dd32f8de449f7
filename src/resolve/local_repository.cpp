#include "jpi/resolver.hpp"
#include "jpi/platform.hpp"
#include "jpi/version.hpp"

#include <algorithm>
#include <deque>
#include <iterator>
#include <map>
#include <set>
#include <utility>

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

std::string extension_of(const std::string& file_name) {
    auto dot = file_name.rfind('.');
    if (dot == std::string::npos) return "";
    return file_name.substr(dot + 1);
}

// "<name>-<version>-<classifier>.<ext>" -> "<classifier>"
std::string classifier_of(const std::string& file_name, const ModuleVersionId& id) {
    std::string prefix = id.name + "-" + id.version + "-";
    auto dot = file_name.rfind('.');
    if (dot == std::string::npos || file_name.compare(0, prefix.size(), prefix) != 0 ||
        dot <= prefix.size()) {
        return "";
    }
    return file_name.substr(prefix.size(), dot - prefix.size());
}

std::vector<ModuleId> parse_excludes(const nlohmann::json& j) {
    std::vector<ModuleId> excludes;
    if (!j.contains("excludes") || !j["excludes"].is_array()) return excludes;
    for (const auto& e : j["excludes"]) {
        if (!e.is_object()) continue;
        auto group = get_string(e, "group");
        auto module = get_string(e, "module");
        if (group && module) {
            excludes.push_back(ModuleId{*group, *module});
        }
    }
    return excludes;
}

} // namespace

std::string ResolutionError::message() const {
    return role + ": " + module.to_string() + ": " + reason;
}

std::string module_directory(const std::string& repository, const ModuleVersionId& id) {
    std::string group_path = id.group;
    std::replace(group_path.begin(), group_path.end(), '.', '/');
    return join_path(join_path(join_path(repository, group_path), id.name), id.version);
}

std::string descriptor_file_name(const ModuleVersionId& id) {
    return id.name + "-" + id.version + ".module";
}

DescriptorParseResult parse_module_descriptor(const std::string& json_str) {
    DescriptorParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "module descriptor must be a JSON object";
            return result;
        }

        if (!j.contains("component") || !j["component"].is_object()) {
            result.error = "component missing";
            return result;
        }
        const auto& component = j["component"];
        auto group = get_string(component, "group");
        auto module = get_string(component, "module");
        auto version = get_string(component, "version");
        if (!group || !module || !version) {
            result.error = "component requires group, module and version";
            return result;
        }
        result.descriptor.id = ModuleVersionId{*group, *module, *version};

        if (j.contains("variants") && j["variants"].is_array()) {
            for (const auto& variant : j["variants"]) {
                if (!variant.is_object()) continue;

                if (variant.contains("dependencies") && variant["dependencies"].is_array()) {
                    for (const auto& d : variant["dependencies"]) {
                        auto dep_group = get_string(d, "group");
                        auto dep_module = get_string(d, "module");
                        if (!dep_group || !dep_module) {
                            result.error = "dependency requires group and module";
                            return result;
                        }

                        std::optional<std::string> requires_version;
                        if (d.contains("version") && d["version"].is_object()) {
                            const auto& v = d["version"];
                            requires_version = get_string(v, "requires");
                            if (!requires_version) requires_version = get_string(v, "strictly");
                            if (!requires_version) requires_version = get_string(v, "prefers");
                        }
                        if (!requires_version) {
                            result.error = "dependency " + *dep_group + ":" + *dep_module +
                                           " has no version";
                            return result;
                        }

                        Dependency dep;
                        dep.id = ModuleVersionId{*dep_group, *dep_module, *requires_version};
                        dep.excludes = parse_excludes(d);

                        auto& deps = result.descriptor.dependencies;
                        bool seen = std::any_of(deps.begin(), deps.end(), [&](const Dependency& x) {
                            return x.id == dep.id;
                        });
                        if (!seen) deps.push_back(std::move(dep));
                    }
                }

                if (variant.contains("files") && variant["files"].is_array()) {
                    for (const auto& f : variant["files"]) {
                        auto name = get_string(f, "name");
                        if (!name) continue;
                        ModuleFile file;
                        file.name = *name;
                        file.url = get_string(f, "url").value_or(*name);

                        auto& files = result.descriptor.files;
                        bool seen = std::any_of(files.begin(), files.end(), [&](const ModuleFile& x) {
                            return x.name == file.name;
                        });
                        if (!seen) files.push_back(std::move(file));
                    }
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

// ============================================================================
// LocalRepositoryResolver
// ============================================================================

LocalRepositoryResolver::LocalRepositoryResolver(std::vector<std::string> repositories)
    : repositories_(std::move(repositories)) {}

LocalRepositoryResolver::Lookup LocalRepositoryResolver::load_descriptor(const ModuleVersionId& id) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(id);
        if (it != cache_.end()) return it->second;
    }

    Lookup lookup;
    for (const auto& repo : repositories_) {
        std::string dir = module_directory(repo, id);
        std::string path = join_path(dir, descriptor_file_name(id));
        auto text = read_file_text(path);
        if (!text) continue;

        auto parsed = parse_module_descriptor(*text);
        if (!parsed.ok) {
            lookup.error = "invalid module descriptor " + path + ": " + parsed.error;
        } else if (parsed.descriptor.id != id) {
            lookup.error = "module descriptor " + path + " declares " +
                           parsed.descriptor.id.to_string();
        } else {
            lookup.ok = true;
            lookup.directory = dir;
            lookup.descriptor = std::make_shared<const ModuleDescriptor>(std::move(parsed.descriptor));
        }
        break;
    }
    if (!lookup.ok && lookup.error.empty()) {
        lookup.error = "module not found in " + std::to_string(repositories_.size()) +
                       " repositories";
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.emplace(id, std::move(lookup)).first->second;
}

ResolveResult LocalRepositoryResolver::resolve(const ResolveRequest& request) {
    using ExcludeSet = std::set<ModuleId>;

    struct Node {
        Dependency dependency;
        ExcludeSet excludes;  // inherited along the path
    };

    // Versions that won a conflict. A pass starts from these so that the
    // winner is expanded on first sight; every other version is chosen again
    // from the edges that pass reaches.
    std::map<ModuleId, std::string> upgrades;
    ResolveResult result;

    const ExcludeSet request_excludes(request.excludes.begin(), request.excludes.end());

    for (int pass = 1;; ++pass) {
        if (pass > MAX_RESOLVE_PASSES) {
            result.errors.push_back(ResolutionError{
                request.role, ModuleVersionId{},
                "version selection did not settle after " +
                    std::to_string(MAX_RESOLVE_PASSES) + " passes"});
            break;
        }

        bool changed = false;
        result = ResolveResult{};

        std::map<ModuleId, std::string> selected = upgrades;
        std::set<std::pair<ModuleId, std::string>> requested;
        // Excludes a module was expanded with: the intersection over every
        // path reaching it, so a module is pruned only when all paths prune it
        std::map<ModuleId, ExcludeSet> expansions;
        std::set<std::pair<ModuleId, std::string>> artifact_only_seen;
        std::deque<Node> queue;
        for (const auto& dep : request.dependencies) {
            queue.push_back(Node{dep, request_excludes});
        }

        while (!queue.empty()) {
            Node node = std::move(queue.front());
            queue.pop_front();

            const Dependency& dep = node.dependency;
            ModuleId module = dep.id.module();
            if (node.excludes.count(module) > 0) {
                spdlog::debug("{}: excluded {}", request.role, dep.id.to_string());
                continue;
            }
            requested.insert({module, dep.id.version});

            auto it = selected.find(module);
            if (it == selected.end()) {
                it = selected.emplace(module, dep.id.version).first;
            } else if (it->second != dep.id.version) {
                auto cmp = compare_versions(dep.id.version, it->second);
                if (!cmp) {
                    result.errors.push_back(ResolutionError{
                        request.role, dep.id, "version conflict with " + it->second});
                    continue;
                }
                if (*cmp > 0) {
                    spdlog::debug("{}: {} upgraded from {} to {}", request.role,
                                  module.to_string(), it->second, dep.id.version);
                    it->second = dep.id.version;
                    upgrades[module] = dep.id.version;
                    changed = true;
                }
            }

            ModuleVersionId id{module.group, module.name, it->second};

            if (dep.is_artifact_only()) {
                if (!artifact_only_seen.insert({module, dep.artifact_extension}).second) continue;

                std::string file_name = id.name + "-" + id.version + "." + dep.artifact_extension;
                std::string file;
                for (const auto& repo : repositories_) {
                    std::string candidate = join_path(module_directory(repo, id), file_name);
                    if (is_regular_file(candidate)) {
                        file = candidate;
                        break;
                    }
                }
                if (file.empty()) {
                    result.errors.push_back(
                        ResolutionError{request.role, id, "artifact " + file_name + " not found"});
                    continue;
                }
                result.artifacts.push_back(ResolvedArtifact{id, dep.artifact_extension, "", file});
                continue;
            }

            ExcludeSet child_excludes = node.excludes;
            child_excludes.insert(dep.excludes.begin(), dep.excludes.end());

            bool again = false;
            auto expanded = expansions.find(module);
            if (expanded != expansions.end()) {
                ExcludeSet narrowed;
                std::set_intersection(expanded->second.begin(), expanded->second.end(),
                                      child_excludes.begin(), child_excludes.end(),
                                      std::inserter(narrowed, narrowed.begin()));
                if (narrowed.size() == expanded->second.size()) continue;
                spdlog::debug("{}: re-expanding {} with fewer excludes", request.role,
                              id.to_string());
                expanded->second = narrowed;
                child_excludes = std::move(narrowed);
                again = true;
            } else {
                expansions.emplace(module, child_excludes);
            }

            // Failures were reported on the first expansion
            auto lookup = load_descriptor(id);
            if (!lookup.ok) {
                if (!again) result.errors.push_back(ResolutionError{request.role, id, lookup.error});
                continue;
            }

            if (!lookup.descriptor->files.empty()) {
                const auto& primary = lookup.descriptor->files.front();
                std::string file = join_path(lookup.directory, primary.url);
                if (!is_regular_file(file)) {
                    if (!again) {
                        result.errors.push_back(ResolutionError{
                            request.role, id, "artifact " + primary.name + " not found"});
                    }
                    continue;
                }
                if (!again) {
                    result.artifacts.push_back(ResolvedArtifact{
                        id, extension_of(primary.name), classifier_of(primary.name, id), file});
                }
            }

            for (const auto& child : lookup.descriptor->dependencies) {
                queue.push_back(Node{child, child_excludes});
            }
        }

        // An upgrade is kept only while some edge still asks for it
        for (auto u = upgrades.begin(); u != upgrades.end();) {
            if (requested.count({u->first, u->second}) == 0) {
                spdlog::debug("{}: {}:{} is no longer requested", request.role,
                              u->first.to_string(), u->second);
                u = upgrades.erase(u);
                changed = true;
            } else {
                ++u;
            }
        }

        if (!changed) break;
    }

    spdlog::info("resolved {}: {} artifacts, {} errors", request.role, result.artifacts.size(),
                 result.errors.size());
    return result;
}

} // namespace jpi

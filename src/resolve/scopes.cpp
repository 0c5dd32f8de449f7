#include "jpi/scopes.hpp"
#include "jpi/classifier.hpp"

#include <algorithm>
#include <future>
#include <set>

#include <spdlog/spdlog.h>

namespace jpi {

namespace {

bool same_request_entry(const Dependency& a, const Dependency& b) {
    return a.id == b.id && a.artifact_extension == b.artifact_extension;
}

void append_unique(std::vector<Dependency>& deps, const Dependency& dep) {
    bool seen = std::any_of(deps.begin(), deps.end(),
                            [&](const Dependency& d) { return same_request_entry(d, dep); });
    if (!seen) deps.push_back(dep);
}

std::string request_key(const ResolveRequest& request) {
    std::string key = request.role;
    for (const auto& dep : request.dependencies) {
        key += "|" + dep.to_notation();
        for (const auto& ex : dep.excludes) {
            key += "!" + ex.to_string();
        }
    }
    for (const auto& ex : request.excludes) {
        key += "|-" + ex.to_string();
    }
    return key;
}

RoleResolveResult to_role_result(const ResolveResult& resolved) {
    RoleResolveResult result;
    result.artifacts = resolved.artifacts;
    result.errors = resolved.errors;
    if (!resolved.ok()) {
        result.error_kind = ErrorKind::Resolution;
        result.error = resolved.errors.front().message();
        return result;
    }
    result.ok = true;
    return result;
}

// Drop later artifacts whose module was already seen
std::vector<ResolvedArtifact> unique_modules(const std::vector<ResolvedArtifact>& artifacts) {
    std::vector<ResolvedArtifact> result;
    std::set<ModuleId> seen;
    for (const auto& a : artifacts) {
        if (seen.insert(a.id.module()).second) {
            result.push_back(a);
        }
    }
    return result;
}

} // namespace

std::vector<ResolvedArtifact> jar_files(const std::vector<ResolvedArtifact>& artifacts) {
    std::vector<ResolvedArtifact> result;
    for (const auto& a : artifacts) {
        if (a.type == "jar") result.push_back(a);
    }
    return result;
}

// ============================================================================
// RoleResolver
// ============================================================================

RoleResolver::RoleResolver(const BuildConfiguration& config, DependencyResolver& resolver,
                           const ScopeRewriter* rewriter)
    : config_(config), resolver_(resolver), rewriter_(rewriter) {}

ResolveRequest RoleResolver::request_for(RoleHandle role) const {
    ResolveRequest request;
    request.role = config_.roles().role(role).name;

    for (RoleHandle contributor : config_.roles().contributors(role)) {
        for (const auto& dep : config_.declared(contributor)) {
            append_unique(request.dependencies, dep);
        }
        if (rewriter_) {
            for (const auto& rewritten : rewriter_->rewritten(contributor)) {
                append_unique(request.dependencies, rewritten.dependency);
            }
        }
        for (const auto& ex : config_.roles().role(contributor).excludes) {
            if (std::find(request.excludes.begin(), request.excludes.end(), ex) ==
                request.excludes.end()) {
                request.excludes.push_back(ex);
            }
        }
    }
    return request;
}

RoleResolveResult RoleResolver::resolve(RoleHandle role) {
    if (role >= config_.roles().size()) {
        RoleResolveResult result;
        result.error_kind = ErrorKind::Configuration;
        result.error = "unknown role handle " + std::to_string(role);
        return result;
    }
    if (!config_.frozen()) {
        RoleResolveResult result;
        result.error_kind = ErrorKind::Configuration;
        result.error = config_.roles().role(role).name +
                       ": configuration must be frozen before resolution";
        return result;
    }

    ResolveRequest request = request_for(role);
    std::string key = request_key(request);

    {
        std::lock_guard<std::mutex> lock(memo_mutex_);
        auto it = memo_.find(role);
        if (it != memo_.end() && it->second.key == key) {
            return to_role_result(it->second.result);
        }
    }

    ++resolver_calls_;
    ResolveResult resolved = resolver_.resolve(request);

    std::lock_guard<std::mutex> lock(memo_mutex_);
    memo_[role] = Memo{key, resolved};
    return to_role_result(resolved);
}

RoleResolveResult RoleResolver::resolve(const std::string& role) {
    auto found = config_.roles().find(role);
    if (!found.ok) {
        RoleResolveResult result;
        result.error_kind = found.error_kind;
        result.error = found.error;
        return result;
    }
    return resolve(found.handle);
}

// ============================================================================
// freeze_and_resolve
// ============================================================================

ScopeResolveResult freeze_and_resolve(BuildConfiguration& config, DependencyResolver& resolver) {
    ScopeResolveResult result;

    auto frozen = config.freeze();
    if (!frozen.ok) {
        result.error_kind = frozen.error_kind;
        result.error = frozen.error;
        return result;
    }

    ScopeRewriter rewriter(config);
    RoleResolver role_resolver(config, resolver, &rewriter);

    auto rewrite = rewriter.run(role_resolver);
    if (!rewrite.ok) {
        result.error_kind = rewrite.error_kind;
        result.error = rewrite.error;
        result.resolution_errors = rewrite.resolution_errors;
        return result;
    }

    const char* views[] = {
        roles::COMPILE_CLASSPATH,
        roles::RUNTIME_CLASSPATH,
        roles::TEST_COMPILE_CLASSPATH,
        roles::TEST_RUNTIME_CLASSPATH,
        roles::PROVIDED_RUNTIME,
        roles::PLUGINS,
        roles::OPTIONAL_PLUGINS,
    };

    // Views are independent once the rewrites are in place
    std::vector<std::future<RoleResolveResult>> futures;
    for (const char* view : views) {
        futures.push_back(std::async(std::launch::async, [&role_resolver, view]() {
            return role_resolver.resolve(std::string(view));
        }));
    }

    std::vector<RoleResolveResult> resolved;
    for (auto& f : futures) {
        resolved.push_back(f.get());
    }

    for (const auto& r : resolved) {
        if (!r.ok) {
            result.resolution_errors.insert(result.resolution_errors.end(), r.errors.begin(),
                                            r.errors.end());
            if (result.error.empty()) {
                result.error_kind = r.error_kind;
                result.error = r.error;
            }
        }
    }
    if (!result.error.empty()) return result;

    auto& scopes = result.scopes;
    scopes.compile_classpath = jar_files(resolved[0].artifacts);
    scopes.runtime_classpath = jar_files(resolved[1].artifacts);
    scopes.test_compile_classpath = jar_files(resolved[2].artifacts);
    scopes.test_runtime_classpath = jar_files(resolved[3].artifacts);
    scopes.provided = resolved[4].artifacts;
    scopes.rewritten = rewriter.all();

    std::set<ModuleId> provided_modules;
    for (const auto& a : scopes.provided) {
        provided_modules.insert(a.id.module());
    }

    for (const auto& a : unique_modules(scopes.runtime_classpath)) {
        if (is_host_extension(a)) {
            spdlog::debug("not bundling {}: host extension", a.id.to_string());
            continue;
        }
        if (provided_modules.count(a.id.module()) > 0) {
            spdlog::debug("not bundling {}: provided by the host", a.id.to_string());
            continue;
        }
        scopes.bundled_libraries.push_back(a);
    }

    // Plugin-Dependencies: host extensions declared directly on the role
    auto collect = [&](const char* role, const RoleResolveResult& r, bool optional) {
        for (const auto& dep : config.declared(role)) {
            if (dep.is_artifact_only()) continue;
            ModuleId module = dep.id.module();
            bool listed = std::any_of(scopes.plugin_dependencies.begin(),
                                      scopes.plugin_dependencies.end(),
                                      [&](const PluginDependency& p) { return p.name == module.name; });
            if (listed) continue;
            for (const auto& a : r.artifacts) {
                if (a.id.module() == module && is_host_extension(a)) {
                    scopes.plugin_dependencies.push_back(
                        PluginDependency{a.id.name, a.id.version, optional});
                    break;
                }
            }
        }
    };
    collect(roles::PLUGINS, resolved[5], false);
    collect(roles::OPTIONAL_PLUGINS, resolved[6], true);

    spdlog::info("scopes resolved: {} compile, {} runtime, {} bundled",
                 scopes.compile_classpath.size(), scopes.runtime_classpath.size(),
                 scopes.bundled_libraries.size());
    result.ok = true;
    return result;
}

} // namespace jpi

#pragma once

#include "jpi/build_config.hpp"
#include "jpi/resolver.hpp"
#include "jpi/scope_rewriter.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace jpi {

// ============================================================================
// Role Resolution
// ============================================================================

struct RoleResolveResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;  // message of the first resolution error
    std::vector<ResolutionError> errors;
    std::vector<ResolvedArtifact> artifacts;
};

// Resolves roles of a frozen configuration through a DependencyResolver.
//
// The request for a role gathers the declared and rewritten dependencies of
// the role and of every role extending into it, plus their exclusions.
// Results are memoised per role against the request contents, so a role is
// only re-resolved when new rewritten dependencies reach it.
class RoleResolver {
public:
    RoleResolver(const BuildConfiguration& config, DependencyResolver& resolver,
                 const ScopeRewriter* rewriter = nullptr);

    ResolveRequest request_for(RoleHandle role) const;

    RoleResolveResult resolve(RoleHandle role);
    RoleResolveResult resolve(const std::string& role);

    // Number of requests forwarded to the underlying resolver
    std::size_t resolver_calls() const { return resolver_calls_.load(); }

    const BuildConfiguration& config() const { return config_; }

private:
    struct Memo {
        std::string key;
        ResolveResult result;
    };

    const BuildConfiguration& config_;
    DependencyResolver& resolver_;
    const ScopeRewriter* rewriter_;

    std::mutex memo_mutex_;
    std::map<RoleHandle, Memo> memo_;
    std::atomic<std::size_t> resolver_calls_{0};
};

// ============================================================================
// Resolved Scopes
// ============================================================================

// Entry of the Plugin-Dependencies manifest attribute
struct PluginDependency {
    std::string name;
    std::string version;
    bool optional = false;
};

struct ResolvedScopes {
    // Classpath views hold jar files only
    std::vector<ResolvedArtifact> compile_classpath;
    std::vector<ResolvedArtifact> runtime_classpath;
    std::vector<ResolvedArtifact> test_compile_classpath;
    std::vector<ResolvedArtifact> test_runtime_classpath;

    // Everything the host supplies at runtime (provided-runtime)
    std::vector<ResolvedArtifact> provided;

    // Content of the container's library directory: runtime classpath jars
    // that are neither host extensions nor provided, one per module
    std::vector<ResolvedArtifact> bundled_libraries;

    std::vector<RewrittenDependency> rewritten;
    std::vector<PluginDependency> plugin_dependencies;
};

struct ScopeResolveResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::vector<ResolutionError> resolution_errors;
    ResolvedScopes scopes;
};

// Freeze `config`, run all rewrite rules, then resolve the classpath views.
// Any Configuration error aborts before resolution; any ResolutionError
// aborts the whole step.
ScopeResolveResult freeze_and_resolve(BuildConfiguration& config, DependencyResolver& resolver);

// Keep only artifacts whose type is "jar"
std::vector<ResolvedArtifact> jar_files(const std::vector<ResolvedArtifact>& artifacts);

} // namespace jpi

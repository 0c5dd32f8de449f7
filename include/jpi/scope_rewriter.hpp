#pragma once

#include "jpi/build_config.hpp"
#include "jpi/resolver.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace jpi {

class RoleResolver;

// A host extension re-declared on a target role as a compile-visible jar:
// group:name:version@jar, never transitive, never bundled.
struct RewrittenDependency {
    Dependency dependency;
    std::string source_role;
    std::string target_role;
};

struct RewriteResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::vector<ResolutionError> resolution_errors;
    std::size_t added = 0;
};

// Executes the rewrite rules of a frozen BuildConfiguration.
//
// Rules run in waves: a rule waits for every rule whose target feeds its
// source. Within a wave the source roles are resolved concurrently and the
// results are applied in rule declaration order. Each target role has its
// own lock; apply() is the only writer.
class ScopeRewriter {
public:
    explicit ScopeRewriter(const BuildConfiguration& config);

    ScopeRewriter(const ScopeRewriter&) = delete;
    ScopeRewriter& operator=(const ScopeRewriter&) = delete;

    RewriteResult run(RoleResolver& resolver);

    // Add every host extension among `artifacts` to the rule's target.
    // Deduplicated by module; returns the number of new entries.
    std::size_t apply(const RewriteRule& rule, const std::vector<ResolvedArtifact>& artifacts);

    std::vector<RewrittenDependency> rewritten(RoleHandle target) const;

    // All entries, grouped by target role in role declaration order
    std::vector<RewrittenDependency> all() const;

private:
    struct TargetSlot {
        mutable std::mutex mutex;
        std::vector<RewrittenDependency> entries;
    };

    const BuildConfiguration& config_;
    std::vector<std::unique_ptr<TargetSlot>> slots_;  // indexed by RoleHandle
};

// "added jar for compilation support (plugin present on <role>)"
std::string rewrite_reason(const std::string& source_role);

} // namespace jpi

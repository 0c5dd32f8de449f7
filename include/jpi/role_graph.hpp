#pragma once

#include "jpi/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace jpi {

// ============================================================================
// Standard Role Names
// ============================================================================

namespace roles {

// Host-facing roles
inline constexpr const char* CORE = "core";
inline constexpr const char* PLUGINS = "plugins";
inline constexpr const char* OPTIONAL_PLUGINS = "optional-plugins";
inline constexpr const char* SERVER_PLUGINS = "server-plugins";
inline constexpr const char* TEST_PLUGINS = "test-plugins";
inline constexpr const char* WAR_DEPENDENCY = "war-dependency";
inline constexpr const char* PLUGIN_RESOURCES = "plugin-resources";

// Declaration roles of the compiled library
inline constexpr const char* API = "api";
inline constexpr const char* IMPLEMENTATION = "implementation";
inline constexpr const char* RUNTIME_ONLY = "runtime-only";
inline constexpr const char* PROVIDED_COMPILE = "provided-compile";
inline constexpr const char* PROVIDED_RUNTIME = "provided-runtime";
inline constexpr const char* TEST_IMPLEMENTATION = "test-implementation";

// Resolvable classpath views
inline constexpr const char* COMPILE_CLASSPATH = "compile-classpath";
inline constexpr const char* RUNTIME_CLASSPATH = "runtime-classpath";
inline constexpr const char* TEST_COMPILE_CLASSPATH = "test-compile-classpath";
inline constexpr const char* TEST_RUNTIME_CLASSPATH = "test-runtime-classpath";

} // namespace roles

// ============================================================================
// Role Declarations
// ============================================================================

enum class RoleVisibility {
    Hidden,   // not offered to consumers of the package
    Exposed
};

inline const char* visibility_to_string(RoleVisibility v) {
    return v == RoleVisibility::Hidden ? "hidden" : "exposed";
}

using RoleHandle = std::size_t;

struct RoleDecl {
    std::string name;
    RoleVisibility visibility = RoleVisibility::Hidden;
    std::string description;
    // Roles through which this role's dependencies are re-exposed
    std::vector<RoleHandle> extends_into;
    // Modules always dropped when this role is resolved
    std::vector<ModuleId> excludes;
};

struct RoleResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    RoleHandle handle = 0;
};

// ============================================================================
// Role Graph
// ============================================================================

// A small fixed directed graph over named roles. Edges are "extends"
// relationships: declare_extends(a, b) means the dependencies of `a` are
// visible wherever `b` is resolved. Cycles are rejected when the edge is
// declared. After freeze() the graph is read-only.
class RoleGraph {
public:
    RoleResult define_role(const std::string& name,
                           RoleVisibility visibility,
                           const std::string& description = "");

    RoleResult declare_extends(RoleHandle role, RoleHandle target);
    RoleResult declare_extends(const std::string& role, const std::string& target);

    RoleResult add_exclude(RoleHandle role, const ModuleId& module);

    // Look up a role by name; undeclared names are a Configuration error
    RoleResult find(const std::string& name) const;

    const RoleDecl& role(RoleHandle handle) const { return roles_.at(handle); }
    const std::vector<RoleDecl>& all() const { return roles_; }
    std::size_t size() const { return roles_.size(); }

    // `target` itself followed by every role whose dependencies flow into
    // it, in declaration order
    std::vector<RoleHandle> contributors(RoleHandle target) const;

    // Full-graph validation (cycle check over all edges)
    RoleResult validate() const;

    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

private:
    bool reaches(RoleHandle from, RoleHandle to) const;
    RoleResult frozen_error(const std::string& what) const;

    std::vector<RoleDecl> roles_;
    bool frozen_ = false;
};

// Build the fixed role graph used for plugin packaging:
//
//   core, plugins, optional-plugins -> provided-compile
//   test-plugins                    -> test-implementation
//   api                             -> implementation
//   implementation   -> compile-classpath, runtime-classpath, test-implementation
//   runtime-only     -> runtime-classpath
//   provided-compile -> provided-runtime, compile-classpath, test-compile-classpath
//   provided-runtime -> runtime-classpath, test-runtime-classpath
//   test-implementation -> test-compile-classpath, test-runtime-classpath
//
// server-plugins, war-dependency and plugin-resources have no edges.
RoleGraph make_standard_role_graph();

} // namespace jpi

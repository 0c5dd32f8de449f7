#include "jpi/role_graph.hpp"

#include <algorithm>
#include <functional>

#include <spdlog/spdlog.h>

namespace jpi {

namespace {

RoleResult config_error(const std::string& message) {
    RoleResult result;
    result.error_kind = ErrorKind::Configuration;
    result.error = message;
    return result;
}

RoleResult ok_result(RoleHandle handle) {
    RoleResult result;
    result.ok = true;
    result.handle = handle;
    return result;
}

} // namespace

RoleResult RoleGraph::frozen_error(const std::string& what) const {
    return config_error("role graph is frozen: cannot " + what);
}

RoleResult RoleGraph::define_role(const std::string& name,
                                  RoleVisibility visibility,
                                  const std::string& description) {
    if (frozen_) {
        return frozen_error("define role '" + name + "'");
    }
    if (name.empty()) {
        return config_error("role name must not be empty");
    }
    for (const auto& existing : roles_) {
        if (existing.name == name) {
            return config_error("role '" + name + "' is already defined");
        }
    }

    RoleDecl decl;
    decl.name = name;
    decl.visibility = visibility;
    decl.description = description;
    roles_.push_back(std::move(decl));

    return ok_result(roles_.size() - 1);
}

RoleResult RoleGraph::declare_extends(RoleHandle role, RoleHandle target) {
    if (role >= roles_.size() || target >= roles_.size()) {
        return config_error("unknown role handle in extends declaration");
    }
    if (frozen_) {
        return frozen_error("declare '" + roles_[role].name + "' extends '" +
                            roles_[target].name + "'");
    }

    auto& edges = roles_[role].extends_into;
    if (std::find(edges.begin(), edges.end(), target) != edges.end()) {
        return ok_result(role);
    }

    // The new edge closes a cycle iff target already reaches role
    if (role == target || reaches(target, role)) {
        return config_error("cyclic role graph: '" + roles_[role].name + "' extends '" +
                            roles_[target].name + "' which already extends '" +
                            roles_[role].name + "'");
    }

    edges.push_back(target);
    spdlog::debug("role '{}' extends into '{}'", roles_[role].name, roles_[target].name);
    return ok_result(role);
}

RoleResult RoleGraph::declare_extends(const std::string& role, const std::string& target) {
    auto from = find(role);
    if (!from.ok) return from;
    auto to = find(target);
    if (!to.ok) return to;
    return declare_extends(from.handle, to.handle);
}

RoleResult RoleGraph::add_exclude(RoleHandle role, const ModuleId& module) {
    if (role >= roles_.size()) {
        return config_error("unknown role handle in exclude declaration");
    }
    if (frozen_) {
        return frozen_error("add exclude " + module.to_string() + " to '" + roles_[role].name + "'");
    }

    auto& excludes = roles_[role].excludes;
    if (std::find(excludes.begin(), excludes.end(), module) == excludes.end()) {
        excludes.push_back(module);
    }
    return ok_result(role);
}

RoleResult RoleGraph::find(const std::string& name) const {
    for (RoleHandle h = 0; h < roles_.size(); ++h) {
        if (roles_[h].name == name) {
            return ok_result(h);
        }
    }
    return config_error("role '" + name + "' is not defined");
}

bool RoleGraph::reaches(RoleHandle from, RoleHandle to) const {
    std::vector<bool> seen(roles_.size(), false);
    std::vector<RoleHandle> stack{from};
    while (!stack.empty()) {
        RoleHandle current = stack.back();
        stack.pop_back();
        if (current == to) return true;
        if (seen[current]) continue;
        seen[current] = true;
        for (RoleHandle next : roles_[current].extends_into) {
            stack.push_back(next);
        }
    }
    return false;
}

std::vector<RoleHandle> RoleGraph::contributors(RoleHandle target) const {
    std::vector<RoleHandle> result;
    if (target >= roles_.size()) return result;

    result.push_back(target);
    for (RoleHandle h = 0; h < roles_.size(); ++h) {
        if (h != target && reaches(h, target)) {
            result.push_back(h);
        }
    }
    return result;
}

RoleResult RoleGraph::validate() const {
    enum class Mark { None, Active, Done };
    std::vector<Mark> marks(roles_.size(), Mark::None);
    std::string cycle_at;

    std::function<bool(RoleHandle)> visit = [&](RoleHandle h) {
        if (marks[h] == Mark::Done) return true;
        if (marks[h] == Mark::Active) {
            cycle_at = roles_[h].name;
            return false;
        }
        marks[h] = Mark::Active;
        for (RoleHandle next : roles_[h].extends_into) {
            if (!visit(next)) return false;
        }
        marks[h] = Mark::Done;
        return true;
    };

    for (RoleHandle h = 0; h < roles_.size(); ++h) {
        if (!visit(h)) {
            return config_error("cyclic role graph through '" + cycle_at + "'");
        }
    }
    return ok_result(0);
}

RoleGraph make_standard_role_graph() {
    RoleGraph graph;

    auto define = [&graph](const char* name, RoleVisibility visibility, const char* description) {
        graph.define_role(name, visibility, description);
    };

    define(roles::CORE, RoleVisibility::Hidden,
           "Host platform version the plugin is built against");
    define(roles::PLUGINS, RoleVisibility::Hidden,
           "Host plugins which the plugin is built against");
    define(roles::OPTIONAL_PLUGINS, RoleVisibility::Hidden,
           "Optional host plugin dependencies which the plugin is built against");
    define(roles::SERVER_PLUGINS, RoleVisibility::Hidden,
           "Host plugins which will be installed into the development instance");
    define(roles::TEST_PLUGINS, RoleVisibility::Hidden,
           "Host plugin test dependencies");
    define(roles::WAR_DEPENDENCY, RoleVisibility::Hidden,
           "Host platform runnable archive that corresponds to the core version");
    define(roles::PLUGIN_RESOURCES, RoleVisibility::Hidden,
           "Extension archives staged for the test harness");

    define(roles::API, RoleVisibility::Exposed, "API dependencies of the plugin library");
    define(roles::IMPLEMENTATION, RoleVisibility::Hidden, "Implementation dependencies");
    define(roles::RUNTIME_ONLY, RoleVisibility::Hidden, "Runtime-only dependencies");
    define(roles::PROVIDED_COMPILE, RoleVisibility::Hidden,
           "Compile-visible dependencies supplied by the host at runtime");
    define(roles::PROVIDED_RUNTIME, RoleVisibility::Hidden,
           "Runtime dependencies supplied by the host");
    define(roles::TEST_IMPLEMENTATION, RoleVisibility::Hidden, "Test dependencies");

    define(roles::COMPILE_CLASSPATH, RoleVisibility::Hidden, "Compile classpath");
    define(roles::RUNTIME_CLASSPATH, RoleVisibility::Hidden, "Runtime classpath");
    define(roles::TEST_COMPILE_CLASSPATH, RoleVisibility::Hidden, "Test compile classpath");
    define(roles::TEST_RUNTIME_CLASSPATH, RoleVisibility::Hidden, "Test runtime classpath");

    const std::pair<const char*, const char*> edges[] = {
        {roles::CORE, roles::PROVIDED_COMPILE},
        {roles::PLUGINS, roles::PROVIDED_COMPILE},
        {roles::OPTIONAL_PLUGINS, roles::PROVIDED_COMPILE},
        {roles::TEST_PLUGINS, roles::TEST_IMPLEMENTATION},
        {roles::API, roles::IMPLEMENTATION},
        {roles::IMPLEMENTATION, roles::COMPILE_CLASSPATH},
        {roles::IMPLEMENTATION, roles::RUNTIME_CLASSPATH},
        {roles::IMPLEMENTATION, roles::TEST_IMPLEMENTATION},
        {roles::RUNTIME_ONLY, roles::RUNTIME_CLASSPATH},
        {roles::PROVIDED_COMPILE, roles::PROVIDED_RUNTIME},
        {roles::PROVIDED_COMPILE, roles::COMPILE_CLASSPATH},
        {roles::PROVIDED_COMPILE, roles::TEST_COMPILE_CLASSPATH},
        {roles::PROVIDED_RUNTIME, roles::RUNTIME_CLASSPATH},
        {roles::PROVIDED_RUNTIME, roles::TEST_RUNTIME_CLASSPATH},
        {roles::TEST_IMPLEMENTATION, roles::TEST_COMPILE_CLASSPATH},
        {roles::TEST_IMPLEMENTATION, roles::TEST_RUNTIME_CLASSPATH},
    };
    for (const auto& [from, to] : edges) {
        auto r = graph.declare_extends(from, to);
        if (!r.ok) {
            spdlog::error("standard role graph: {}", r.error);
        }
    }

    auto test = graph.find(roles::TEST_PLUGINS);
    graph.add_exclude(test.handle, ModuleId{"org.jenkins-ci.modules", "ssh-cli-auth"});
    graph.add_exclude(test.handle, ModuleId{"org.jenkins-ci.modules", "sshd"});

    return graph;
}

} // namespace jpi

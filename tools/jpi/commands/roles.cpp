/**
 * jpi CLI - roles command
 *
 * Show the role graph with the dependencies declared on each role.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace jpi::cli::commands {

namespace {

int cmd_roles(const GlobalOptions& opts) {
    configure_logging(opts);

    BuildConfiguration config;
    if (!load_project(opts, config)) {
        return 1;
    }

    const auto& graph = config.roles();

    if (opts.json) {
        nlohmann::json j = nlohmann::json::array();
        for (RoleHandle h = 0; h < graph.size(); ++h) {
            const auto& role = graph.role(h);
            nlohmann::json r;
            r["name"] = role.name;
            r["visibility"] = visibility_to_string(role.visibility);
            r["extends_into"] = nlohmann::json::array();
            for (auto target : role.extends_into) {
                r["extends_into"].push_back(graph.role(target).name);
            }
            r["dependencies"] = nlohmann::json::array();
            for (const auto& dep : config.declared(h)) {
                r["dependencies"].push_back(dep.to_notation());
            }
            j.push_back(r);
        }
        nlohmann::json rules = nlohmann::json::array();
        for (const auto& rule : config.rewrite_rules()) {
            rules.push_back({{"source", graph.role(rule.source).name},
                             {"target", graph.role(rule.target).name}});
        }
        output_json({{"roles", j}, {"rewrites", rules}});
        return 0;
    }

    for (RoleHandle h = 0; h < graph.size(); ++h) {
        const auto& role = graph.role(h);
        std::cout << role.name << " (" << visibility_to_string(role.visibility) << ")";
        if (!role.extends_into.empty()) {
            std::cout << " ->";
            for (auto target : role.extends_into) {
                std::cout << " " << graph.role(target).name;
            }
        }
        std::cout << std::endl;
        for (const auto& dep : config.declared(h)) {
            std::cout << "    " << dep.to_notation() << std::endl;
        }
    }
    if (!config.rewrite_rules().empty()) {
        std::cout << std::endl << "Rewrites:" << std::endl;
        for (const auto& rule : config.rewrite_rules()) {
            std::cout << "  " << graph.role(rule.source).name << " => "
                      << graph.role(rule.target).name << std::endl;
        }
    }
    return 0;
}

} // namespace

void setup_roles(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_roles(opts));
    });
}

} // namespace jpi::cli::commands

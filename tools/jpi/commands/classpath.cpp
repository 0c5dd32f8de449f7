/**
 * jpi CLI - classpath command
 */

#include "../common.hpp"
#include "jpi/scopes.hpp"
#include <CLI/CLI.hpp>

namespace jpi::cli::commands {

namespace {

struct ClasspathOptions {
    std::string view = "compile";
};

const std::vector<ResolvedArtifact>* select_view(const ResolvedScopes& scopes,
                                                 const std::string& view) {
    if (view == "compile") return &scopes.compile_classpath;
    if (view == "runtime") return &scopes.runtime_classpath;
    if (view == "test-compile") return &scopes.test_compile_classpath;
    if (view == "test-runtime") return &scopes.test_runtime_classpath;
    if (view == "provided") return &scopes.provided;
    if (view == "bundled") return &scopes.bundled_libraries;
    return nullptr;
}

int cmd_classpath(const GlobalOptions& opts, const ClasspathOptions& cp_opts) {
    configure_logging(opts);

    BuildConfiguration config;
    if (!load_project(opts, config)) {
        return 1;
    }

    LocalRepositoryResolver resolver(config.repositories());
    auto resolved = freeze_and_resolve(config, resolver);
    if (!resolved.ok) {
        if (!resolved.resolution_errors.empty()) {
            print_resolution_errors(resolved.resolution_errors, opts.json);
        } else {
            print_error(resolved.error, opts.json, resolved.error_kind);
        }
        return 1;
    }

    const auto* artifacts = select_view(resolved.scopes, cp_opts.view);
    if (!artifacts) {
        print_error("unknown classpath view: " + cp_opts.view, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["view"] = cp_opts.view;
        j["artifacts"] = nlohmann::json::array();
        for (const auto& a : *artifacts) {
            j["artifacts"].push_back(artifact_to_json(a));
        }
        output_json(j);
    } else {
        for (const auto& a : *artifacts) {
            std::cout << a.file << std::endl;
        }
    }
    return 0;
}

} // namespace

void setup_classpath(CLI::App* app, GlobalOptions& opts) {
    static ClasspathOptions cp_opts;

    app->add_option("view", cp_opts.view,
                    "compile, runtime, test-compile, test-runtime, provided or bundled")
        ->check(CLI::IsMember({"compile", "runtime", "test-compile", "test-runtime",
                               "provided", "bundled"}));

    app->callback([&opts]() {
        std::exit(cmd_classpath(opts, cp_opts));
    });
}

} // namespace jpi::cli::commands

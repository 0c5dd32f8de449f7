/**
 * jpi CLI - manifest command
 *
 * Print the MANIFEST.MF the package would carry.
 */

#include "../common.hpp"
#include "jpi/manifest.hpp"
#include <CLI/CLI.hpp>

namespace jpi::cli::commands {

namespace {

int cmd_manifest(const GlobalOptions& opts) {
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

    auto manifest = assemble_manifest(config, resolved.scopes);
    if (!manifest.ok) {
        print_error(manifest.error, opts.json, manifest.error_kind);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& [name, value] : manifest.attributes.entries()) {
            j[name] = value;
        }
        output_json(j);
    } else {
        std::cout << write_manifest(manifest.attributes);
    }
    return 0;
}

} // namespace

void setup_manifest(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_manifest(opts));
    });
}

} // namespace jpi::cli::commands

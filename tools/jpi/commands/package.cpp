/**
 * jpi CLI - package command
 *
 * Resolve the project's roles and write <short-name>.<ext> with the
 * project jar into the build's libs directory.
 */

#include "../common.hpp"
#include "jpi/digest.hpp"
#include "jpi/plugin_package.hpp"
#include <CLI/CLI.hpp>

namespace jpi::cli::commands {

namespace {

int cmd_package(const GlobalOptions& opts) {
    configure_logging(opts);

    BuildConfiguration config;
    if (!load_project(opts, config)) {
        return 1;
    }

    LocalRepositoryResolver resolver(config.repositories());
    ZipArchiveWriter writer;

    auto result = package_plugin(config, resolver, writer);
    if (!result.ok) {
        if (!result.resolution_errors.empty()) {
            print_resolution_errors(result.resolution_errors, opts.json);
        } else {
            print_error(result.error, opts.json, result.error_kind);
        }
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["archive"] = result.archive_path;
        auto digest = compute_file_sha256(result.archive_path);
        if (digest.ok) {
            j["sha256"] = digest.hex_digest;
        }
        j["jar"] = result.jar_path;
        if (!result.sources_jar_path.empty()) {
            j["sources_jar"] = result.sources_jar_path;
        }
        if (!result.javadoc_jar_path.empty()) {
            j["javadoc_jar"] = result.javadoc_jar_path;
        }
        j["libraries"] = result.libraries;
        output_json(j);
    } else {
        print_success("Wrote " + result.archive_path, opts.json);
        if (opts.verbose) {
            for (const auto& lib : result.libraries) {
                std::cout << "  " << LIBRARY_DIR << "/" << lib << std::endl;
            }
        }
    }
    return 0;
}

} // namespace

void setup_package(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_package(opts));
    });
}

} // namespace jpi::cli::commands

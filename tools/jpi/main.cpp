/**
 * jpi CLI - Entry Point
 *
 * Plugin dependency scopes and archive assembly.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace jpi::cli::commands {
    void setup_package(CLI::App* app, GlobalOptions& opts);
    void setup_classpath(CLI::App* app, GlobalOptions& opts);
    void setup_manifest(CLI::App* app, GlobalOptions& opts);
    void setup_roles(CLI::App* app, GlobalOptions& opts);
    void setup_test_resources(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace jpi::cli;

    CLI::App app{"jpi - plugin dependency scopes and archive assembly"};
    app.set_version_flag("-V,--version", JPI_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("-p,--project", opts.project, "Project file (default: jpi.json)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    auto* package_cmd = app.add_subcommand("package", "Build the plugin archive");
    commands::setup_package(package_cmd, opts);

    auto* classpath_cmd = app.add_subcommand("classpath", "Print a resolved classpath view");
    commands::setup_classpath(classpath_cmd, opts);

    auto* manifest_cmd = app.add_subcommand("manifest", "Print the plugin manifest");
    commands::setup_manifest(manifest_cmd, opts);

    auto* roles_cmd = app.add_subcommand("roles", "Show the dependency role graph");
    commands::setup_roles(roles_cmd, opts);

    auto* test_cmd = app.add_subcommand("test-resources",
                                        "Stage test plugins and generate the test hpl");
    commands::setup_test_resources(test_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}

#include <doctest/doctest.h>
#include "jpi/project_file.hpp"
#include "support/test_helpers.hpp"

using namespace jpi;
using jpi::testing::TempDir;
using jpi::testing::write_text;

TEST_CASE("apply_project_file reads every section") {
    const char* json = R"({
        "$schema": "jpi.project.v1",
        "project": {
            "group": "org.example",
            "name": "widget-plugin",
            "version": "1.0",
            "description": "Widgets"
        },
        "jenkinsPlugin": {
            "shortName": "widget-x",
            "fileExtension": "jpi",
            "displayName": "Widget",
            "url": "https://example.org",
            "coreVersion": "2.190",
            "compatibleSinceVersion": "0.5",
            "sandboxStatus": true,
            "pluginFirstClassLoader": true,
            "maskClasses": "org.acme.",
            "configureRepositories": false,
            "configurePublishing": false,
            "disabledTestInjection": true
        },
        "repositories": ["repo"],
        "dependencies": {
            "plugins": ["org.example:other:1.2"],
            "implementation": ["junit:junit:4.12", "commons-io:commons-io:2.6"]
        },
        "excludes": {
            "implementation": ["commons-logging:commons-logging"]
        },
        "layout": {
            "buildDir": "out",
            "classesDirs": ["out/classes"],
            "resourcesDir": "out/resources",
            "sourceDirs": ["src"],
            "javadocDir": "out/javadoc",
            "licenseReportDir": "out/licenses",
            "webappDir": "webapp"
        }
    })";

    BuildConfiguration config;
    auto r = apply_project_file(json, "/work/widget", config);
    REQUIRE(r.ok);
    CHECK(r.warnings.empty());

    CHECK(config.project().group == "org.example");
    CHECK(config.project().description == "Widgets");
    CHECK(config.short_name() == "widget-x");

    const auto& s = config.settings();
    CHECK(s.file_extension == "jpi");
    CHECK(s.display_name == "Widget");
    CHECK(s.core_version == "2.190");
    CHECK(s.compatible_since_version == "0.5");
    CHECK(s.sandbox_status);
    CHECK(s.plugin_first_class_loader);
    CHECK(s.mask_classes == "org.acme.");
    CHECK_FALSE(s.configure_repositories);
    CHECK_FALSE(s.configure_publishing);
    CHECK(s.disabled_test_injection);

    CHECK(config.repositories() == std::vector<std::string>{"/work/widget/repo"});
    CHECK(config.declared(roles::PLUGINS).size() == 1);
    CHECK(config.declared(roles::IMPLEMENTATION).size() == 2);

    const auto& graph = config.roles();
    const auto& excludes = graph.role(graph.find(roles::IMPLEMENTATION).handle).excludes;
    REQUIRE(excludes.size() == 1);
    CHECK(excludes[0] == ModuleId{"commons-logging", "commons-logging"});

    const auto& layout = config.layout();
    CHECK(layout.base_dir == "/work/widget");
    CHECK(layout.libs_dir() == "/work/widget/out/libs");
    CHECK(layout.classes_dirs == std::vector<std::string>{"out/classes"});
    CHECK(layout.webapp_dir == "webapp");
    CHECK(layout.javadoc_dir == "out/javadoc");
}

TEST_CASE("apply_project_file keeps defaults for absent sections") {
    BuildConfiguration config;
    auto r = apply_project_file(R"({"project": {"name": "widget-plugin"}})", ".", config);
    REQUIRE(r.ok);
    CHECK(config.settings().file_extension == "hpi");
    CHECK(config.settings().configure_publishing);
    CHECK(config.layout().build_dir == "build");
    CHECK(config.layout().javadoc_dir == "build/docs/javadoc");
    CHECK(config.project().version.empty());
}

TEST_CASE("apply_project_file warns about unknown fields") {
    BuildConfiguration config;
    auto r = apply_project_file(R"({
        "project": {"name": "widget-plugin", "licence": "MIT"},
        "jenkinsPlugin": {"workDir": "work"},
        "plugins": [],
        "dependencies": {"implementation": "junit:junit:4.12"}
    })",
                                ".", config);
    REQUIRE(r.ok);
    REQUIRE(r.warnings.size() == 4);
    CHECK(r.warnings[0] == "unknown field 'plugins' (ignored)");
    CHECK(r.warnings[1] == "unknown field 'project.licence' (ignored)");
    CHECK(r.warnings[2] == "unknown field 'jenkinsPlugin.workDir' (ignored)");
    CHECK(r.warnings[3] == "dependencies.implementation is not an array (ignored)");
}

TEST_CASE("apply_project_file reports configuration errors") {
    BuildConfiguration config;

    SUBCASE("invalid JSON") {
        auto r = apply_project_file("{", ".", config);
        CHECK_FALSE(r.ok);
        CHECK(r.error_kind == ErrorKind::Configuration);
        CHECK(r.error.find("parse error") != std::string::npos);
    }
    SUBCASE("schema mismatch") {
        auto r = apply_project_file(R"({"$schema": "jpi.project.v2"})", ".", config);
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("$schema") != std::string::npos);
    }
    SUBCASE("unsupported extension") {
        auto r = apply_project_file(R"({"jenkinsPlugin": {"fileExtension": "zip"}})", ".", config);
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("zip") != std::string::npos);
    }
    SUBCASE("unknown role") {
        auto r = apply_project_file(R"({"dependencies": {"compile": ["junit:junit:4.12"]}})", ".",
                                    config);
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("'compile'") != std::string::npos);
    }
    SUBCASE("bad notation") {
        auto r = apply_project_file(R"({"dependencies": {"implementation": ["junit"]}})", ".",
                                    config);
        CHECK_FALSE(r.ok);
        CHECK(r.error_kind == ErrorKind::Configuration);
    }
    SUBCASE("bad exclude") {
        auto r = apply_project_file(R"({"excludes": {"implementation": ["junit"]}})", ".", config);
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("group:name") != std::string::npos);
    }
}

TEST_CASE("apply_project_file fails on a frozen configuration") {
    BuildConfiguration config;
    config.freeze();
    auto r = apply_project_file(R"({"project": {"name": "widget-plugin"}})", ".", config);
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("frozen") != std::string::npos);
}

TEST_CASE("load_project_file resolves paths against the file's directory") {
    TempDir tmp;
    std::string path = tmp.file("widget/jpi.json");
    write_text(path, R"({"project": {"name": "widget-plugin", "version": "1.0"}})");

    BuildConfiguration config;
    auto r = load_project_file(path, config);
    REQUIRE(r.ok);
    CHECK(config.layout().base_dir == get_parent_directory(path));
    CHECK(config.project().version == "1.0");
}

TEST_CASE("load_project_file reports a missing file") {
    TempDir tmp;
    BuildConfiguration config;
    auto r = load_project_file(tmp.file("jpi.json"), config);
    CHECK_FALSE(r.ok);
    CHECK(r.error_kind == ErrorKind::Configuration);
    CHECK(r.error.find("cannot read") != std::string::npos);
}

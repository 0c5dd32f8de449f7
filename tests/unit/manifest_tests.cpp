#include <doctest/doctest.h>
#include "jpi/manifest.hpp"

using namespace jpi;

namespace {

ProjectInfo widget_project() {
    ProjectInfo project;
    project.group = "org.example";
    project.name = "widget-plugin";
    project.version = "1.0";
    project.description = "Widgets for everyone";
    return project;
}

} // namespace

// ============================================================================
// ManifestAttributes
// ============================================================================

TEST_CASE("ManifestAttributes keeps insertion order and replaces in place") {
    ManifestAttributes attrs;
    attrs.set("A", "1");
    attrs.set("B", "2");
    attrs.set("A", "3");

    REQUIRE(attrs.size() == 2);
    CHECK(attrs.entries()[0].first == "A");
    CHECK(attrs.entries()[0].second == "3");
    CHECK(attrs.get("B") == std::optional<std::string>("2"));
    CHECK_FALSE(attrs.get("C"));
    CHECK(attrs.canonical_text() == "A: 3\nB: 2\n");
}

// ============================================================================
// Assembly
// ============================================================================

TEST_CASE("format_plugin_dependencies marks optional entries") {
    std::vector<PluginDependency> deps = {
        {"credentials", "2.1", false},
        {"git", "3.0", true},
    };
    CHECK(format_plugin_dependencies(deps) == "credentials:2.1,git:3.0;resolution:=optional");
    CHECK(format_plugin_dependencies({}).empty());
}

TEST_CASE("assemble_manifest derives the plugin attributes") {
    PluginSettings settings;
    settings.display_name = "Widget Plugin";
    settings.url = "https://example.org/widget";
    settings.core_version = "2.190";
    settings.compatible_since_version = "0.9";
    settings.sandbox_status = true;
    settings.plugin_first_class_loader = true;
    settings.mask_classes = "org.apache.commons.";

    auto r = assemble_manifest(widget_project(), settings, {{"credentials", "2.1", false}});
    REQUIRE(r.ok);
    const auto& a = r.attributes;

    CHECK(a.entries()[0].first == "Manifest-Version");
    CHECK(a.get("Manifest-Version") == std::optional<std::string>("1.0"));
    CHECK(a.get("Group-Id") == std::optional<std::string>("org.example"));
    CHECK(a.get("Short-Name") == std::optional<std::string>("widget"));
    CHECK(a.get("Extension-Name") == std::optional<std::string>("widget"));
    CHECK(a.get("Long-Name") == std::optional<std::string>("Widget Plugin"));
    CHECK(a.get("Url") == std::optional<std::string>("https://example.org/widget"));
    CHECK(a.get("Implementation-Title") == std::optional<std::string>("widget-plugin"));
    CHECK(a.get("Implementation-Version") == std::optional<std::string>("1.0"));
    CHECK(a.get("Specification-Title") == std::optional<std::string>("Widgets for everyone"));
    CHECK(a.get("Plugin-Version") == std::optional<std::string>("1.0"));
    CHECK(a.get("Hudson-Version") == std::optional<std::string>("2.190"));
    CHECK(a.get("Jenkins-Version") == std::optional<std::string>("2.190"));
    CHECK(a.get("Compatible-Since-Version") == std::optional<std::string>("0.9"));
    CHECK(a.get("Sandbox-Status") == std::optional<std::string>("true"));
    CHECK(a.get("PluginFirstClassLoader") == std::optional<std::string>("true"));
    CHECK(a.get("Mask-Classes") == std::optional<std::string>("org.apache.commons."));
    CHECK(a.get("Plugin-Dependencies") == std::optional<std::string>("credentials:2.1"));
}

TEST_CASE("assemble_manifest omits unset optional attributes") {
    auto r = assemble_manifest(widget_project(), PluginSettings{}, {});
    REQUIRE(r.ok);
    const auto& a = r.attributes;

    CHECK(a.get("Long-Name") == std::optional<std::string>("widget"));
    CHECK_FALSE(a.contains("Url"));
    CHECK_FALSE(a.contains("Jenkins-Version"));
    CHECK_FALSE(a.contains("Sandbox-Status"));
    CHECK_FALSE(a.contains("PluginFirstClassLoader"));
    CHECK_FALSE(a.contains("Plugin-Dependencies"));
    CHECK_FALSE(a.contains("Mask-Classes"));
}

TEST_CASE("assemble_manifest honours an explicit short name") {
    PluginSettings settings;
    settings.short_name = "widget-plugin";
    auto r = assemble_manifest(widget_project(), settings, {});
    REQUIRE(r.ok);
    CHECK(r.attributes.get("Short-Name") == std::optional<std::string>("widget-plugin"));
}

TEST_CASE("assemble_manifest requires a short name and a version") {
    SUBCASE("no name") {
        ProjectInfo project;
        project.version = "1.0";
        auto r = assemble_manifest(project, PluginSettings{}, {});
        CHECK_FALSE(r.ok);
        CHECK(r.error_kind == ErrorKind::Configuration);
        CHECK(r.error == "missing required plugin metadata: short name");
    }
    SUBCASE("no version") {
        auto project = widget_project();
        project.version.clear();
        auto r = assemble_manifest(project, PluginSettings{}, {});
        CHECK_FALSE(r.ok);
        CHECK(r.error_kind == ErrorKind::Configuration);
        CHECK(r.error.find("version of 'widget'") != std::string::npos);
    }
}

TEST_CASE("assemble_manifest rejects multi-line values") {
    auto project = widget_project();
    project.description = "line one\nline two";
    auto r = assemble_manifest(project, PluginSettings{}, {});
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("Specification-Title") != std::string::npos);
}

// ============================================================================
// Archive Tasks
// ============================================================================

TEST_CASE("apply_manifest merges attributes and records a fingerprint") {
    ManifestAttributes ours;
    ours.set("Short-Name", "widget");
    ours.set("Plugin-Version", "1.0");

    ArchiveTask task{"jar", {}, {}};
    task.manifest.set("Built-By", "ci");
    task.manifest.set("Short-Name", "stale");

    auto r = apply_manifest(ours, task);
    REQUIRE(r.ok);
    CHECK(task.manifest.get("Built-By") == std::optional<std::string>("ci"));
    CHECK(task.manifest.get("Short-Name") == std::optional<std::string>("widget"));
    CHECK(task.manifest.get("Plugin-Version") == std::optional<std::string>("1.0"));

    REQUIRE(task.inputs.count(MANIFEST_INPUT_KEY) == 1);
    CHECK(task.inputs[MANIFEST_INPUT_KEY].size() == 64);
}

TEST_CASE("apply_manifest fingerprint changes with the attributes") {
    ManifestAttributes a;
    a.set("Plugin-Version", "1.0");
    ManifestAttributes b;
    b.set("Plugin-Version", "1.1");

    ArchiveTask first{"jar", {}, {}};
    ArchiveTask second{"jar", {}, {}};
    ArchiveTask third{"jpi", {}, {}};
    apply_manifest(a, first);
    apply_manifest(b, second);
    apply_manifest(a, third);

    CHECK(first.inputs[MANIFEST_INPUT_KEY] != second.inputs[MANIFEST_INPUT_KEY]);
    CHECK(first.inputs[MANIFEST_INPUT_KEY] == third.inputs[MANIFEST_INPUT_KEY]);
}

// ============================================================================
// MANIFEST.MF
// ============================================================================

TEST_CASE("write_manifest puts Manifest-Version first and ends with a blank line") {
    ManifestAttributes attrs;
    attrs.set("Short-Name", "widget");
    attrs.set("Manifest-Version", "1.0");

    CHECK(write_manifest(attrs) == "Manifest-Version: 1.0\r\nShort-Name: widget\r\n\r\n");
}

TEST_CASE("write_manifest wraps lines at 72 bytes") {
    ManifestAttributes attrs;
    attrs.set("Manifest-Version", "1.0");
    attrs.set("Libraries", std::string(150, 'x'));

    std::string text = write_manifest(attrs);
    size_t start = 0;
    while (true) {
        size_t end = text.find("\r\n", start);
        if (end == std::string::npos) break;
        CHECK(end - start <= MANIFEST_LINE_LIMIT);
        start = end + 2;
    }

    auto parsed = parse_manifest(text);
    REQUIRE(parsed.ok);
    CHECK(parsed.attributes.get("Libraries") == std::optional<std::string>(std::string(150, 'x')));
}

TEST_CASE("write_manifest never splits a UTF-8 sequence") {
    ManifestAttributes attrs;
    // "Long-Name: " is 11 bytes; 30 two-byte characters cross the limit
    std::string value;
    for (int i = 0; i < 40; ++i) value += "\xc3\xa9";
    attrs.set("Long-Name", value);

    std::string text = write_manifest(attrs);
    size_t start = text.find("\r\n") + 2;  // skip Manifest-Version
    size_t end = text.find("\r\n", start);
    std::string first_line = text.substr(start, end - start);
    CHECK(first_line.size() <= MANIFEST_LINE_LIMIT);
    CHECK((static_cast<unsigned char>(text[end + 3]) & 0xC0) != 0x80);

    auto parsed = parse_manifest(text);
    REQUIRE(parsed.ok);
    CHECK(parsed.attributes.get("Long-Name") == std::optional<std::string>(value));
}

TEST_CASE("parse_manifest accepts LF line ends and stops at the main section") {
    auto r = parse_manifest("Manifest-Version: 1.0\nShort-Name: wid\n get\n\nName: other\nX: y\n");
    REQUIRE(r.ok);
    CHECK(r.attributes.size() == 2);
    CHECK(r.attributes.get("Short-Name") == std::optional<std::string>("widget"));
}

TEST_CASE("parse_manifest rejects malformed lines") {
    CHECK_FALSE(parse_manifest(" continuation first\n").ok);
    CHECK_FALSE(parse_manifest("no separator\n").ok);
}

#include <doctest/doctest.h>
#include "jpi/scope_rewriter.hpp"
#include "jpi/scopes.hpp"
#include "support/test_helpers.hpp"

#include <algorithm>

using namespace jpi;
using jpi::testing::FakeResolver;

namespace {

RoleHandle handle(const BuildConfiguration& config, const std::string& name) {
    return config.roles().find(name).handle;
}

bool has_dependency(const ResolveRequest& request, const std::string& notation) {
    return std::any_of(request.dependencies.begin(), request.dependencies.end(),
                       [&](const Dependency& d) { return d.to_notation() == notation; });
}

} // namespace

// ============================================================================
// apply
// ============================================================================

TEST_CASE("apply adds host extensions as artifact-only jars") {
    BuildConfiguration config;
    ScopeRewriter rewriter(config);
    RewriteRule rule = config.rewrite_rules()[0];  // plugins -> provided-compile

    std::vector<ResolvedArtifact> artifacts = {
        {{"org.example", "other", "1.2"}, "hpi", "", "/repo/other-1.2.hpi"},
        {{"junit", "junit", "4.12"}, "jar", "", "/repo/junit-4.12.jar"},
        {{"org.example", "third", "2.0"}, "jpi", "", "/repo/third-2.0.jpi"},
    };

    CHECK(rewriter.apply(rule, artifacts) == 2);

    auto entries = rewriter.rewritten(rule.target);
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].dependency.to_notation() == "org.example:other:1.2@jar");
    CHECK(entries[0].dependency.reason ==
          "added jar for compilation support (plugin present on plugins)");
    CHECK(entries[0].source_role == roles::PLUGINS);
    CHECK(entries[0].target_role == roles::PROVIDED_COMPILE);
    CHECK(entries[1].dependency.to_notation() == "org.example:third:2.0@jar");
    CHECK(entries[1].dependency.excludes.empty());
}

TEST_CASE("apply is idempotent") {
    BuildConfiguration config;
    ScopeRewriter rewriter(config);
    RewriteRule rule = config.rewrite_rules()[0];

    std::vector<ResolvedArtifact> artifacts = {
        {{"org.example", "other", "1.2"}, "hpi", "", "/repo/other-1.2.hpi"},
    };

    CHECK(rewriter.apply(rule, artifacts) == 1);
    CHECK(rewriter.apply(rule, artifacts) == 0);
    CHECK(rewriter.rewritten(rule.target).size() == 1);
}

TEST_CASE("apply keeps the first rule's entry for a module") {
    BuildConfiguration config;
    ScopeRewriter rewriter(config);
    const auto& rules = config.rewrite_rules();

    std::vector<ResolvedArtifact> artifacts = {
        {{"org.example", "other", "1.2"}, "hpi", "", "/repo/other-1.2.hpi"},
    };
    rewriter.apply(rules[0], artifacts);
    rewriter.apply(rules[1], artifacts);

    auto entries = rewriter.rewritten(handle(config, roles::PROVIDED_COMPILE));
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].source_role == roles::PLUGINS);
}

TEST_CASE("all groups entries by target role") {
    BuildConfiguration config;
    ScopeRewriter rewriter(config);
    const auto& rules = config.rewrite_rules();

    std::vector<ResolvedArtifact> harness = {
        {{"org.example", "harness", "1.0"}, "hpi", "", "/repo/harness-1.0.hpi"},
    };
    std::vector<ResolvedArtifact> other = {
        {{"org.example", "other", "1.2"}, "hpi", "", "/repo/other-1.2.hpi"},
    };
    rewriter.apply(rules[2], harness);
    rewriter.apply(rules[0], other);

    auto all = rewriter.all();
    REQUIRE(all.size() == 2);
    CHECK(all[0].target_role == roles::PROVIDED_COMPILE);
    CHECK(all[1].target_role == roles::TEST_IMPLEMENTATION);
}

// ============================================================================
// run
// ============================================================================

TEST_CASE("run requires a frozen configuration") {
    BuildConfiguration config;
    FakeResolver fake;
    ScopeRewriter rewriter(config);
    RoleResolver resolver(config, fake, &rewriter);

    auto r = rewriter.run(resolver);
    CHECK_FALSE(r.ok);
    CHECK(r.error_kind == ErrorKind::Configuration);
    CHECK(fake.requests().empty());
}

TEST_CASE("run rewrites plugins, optional plugins and test plugins") {
    BuildConfiguration config;
    config.declare_dependency(roles::PLUGINS, "org.example:other:1.2");
    config.declare_dependency(roles::OPTIONAL_PLUGINS, "org.example:maybe:3.0");
    config.declare_dependency(roles::TEST_PLUGINS, "org.example:harness:1.0");
    REQUIRE(config.freeze().ok);

    FakeResolver fake;
    fake.add("org.example:other:1.2", "hpi", {"commons-io:commons-io:2.6"});
    fake.add("commons-io:commons-io:2.6", "jar");
    fake.add("org.example:maybe:3.0", "jpi");
    fake.add("org.example:harness:1.0", "hpi");

    ScopeRewriter rewriter(config);
    RoleResolver resolver(config, fake, &rewriter);

    auto r = rewriter.run(resolver);
    REQUIRE(r.ok);
    CHECK(r.added == 3);

    auto provided = rewriter.rewritten(handle(config, roles::PROVIDED_COMPILE));
    REQUIRE(provided.size() == 2);
    CHECK(provided[0].dependency.to_notation() == "org.example:other:1.2@jar");
    CHECK(provided[1].dependency.to_notation() == "org.example:maybe:3.0@jar");
    CHECK(provided[1].dependency.reason ==
          "added jar for compilation support (plugin present on optional-plugins)");

    auto test = rewriter.rewritten(handle(config, roles::TEST_IMPLEMENTATION));
    REQUIRE(test.size() == 1);
    CHECK(test[0].dependency.to_notation() == "org.example:harness:1.0@jar");

    // One resolution per source role
    CHECK(resolver.resolver_calls() == 3);
}

TEST_CASE("run waits for rules that feed a source role") {
    RoleGraph graph;
    graph.define_role("first", RoleVisibility::Hidden);
    graph.define_role("middle", RoleVisibility::Hidden);
    graph.define_role("second", RoleVisibility::Hidden);
    graph.define_role("sink", RoleVisibility::Hidden);
    graph.declare_extends("middle", "second");

    BuildConfiguration config(std::move(graph));
    // Declared in reverse so ordering comes from the dependency, not the list
    REQUIRE(config.declare_rewrite("second", "sink").ok);
    REQUIRE(config.declare_rewrite("first", "middle").ok);
    config.declare_dependency("first", "org.example:alpha:1.0");
    config.declare_dependency("second", "org.example:beta:1.0");
    REQUIRE(config.freeze().ok);

    FakeResolver fake;
    fake.add("org.example:alpha:1.0", "hpi");
    fake.add("org.example:beta:1.0", "hpi");

    ScopeRewriter rewriter(config);
    RoleResolver resolver(config, fake, &rewriter);
    REQUIRE(rewriter.run(resolver).ok);

    auto requests = fake.requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].role == "first");
    CHECK(requests[1].role == "second");
    CHECK(has_dependency(requests[1], "org.example:alpha:1.0@jar"));

    auto sink = rewriter.rewritten(handle(config, "sink"));
    REQUIRE(sink.size() == 1);
    CHECK(sink[0].dependency.to_notation() == "org.example:beta:1.0@jar");
}

TEST_CASE("run reports rules that feed each other") {
    RoleGraph graph;
    graph.define_role("left", RoleVisibility::Hidden);
    graph.define_role("right", RoleVisibility::Hidden);

    BuildConfiguration config(std::move(graph));
    REQUIRE(config.declare_rewrite("left", "right").ok);
    REQUIRE(config.declare_rewrite("right", "left").ok);
    REQUIRE(config.freeze().ok);

    FakeResolver fake;
    ScopeRewriter rewriter(config);
    RoleResolver resolver(config, fake, &rewriter);

    auto r = rewriter.run(resolver);
    CHECK_FALSE(r.ok);
    CHECK(r.error_kind == ErrorKind::Configuration);
    CHECK(r.error.find("feed each other") != std::string::npos);
    CHECK(fake.requests().empty());
}

TEST_CASE("run propagates resolution errors") {
    BuildConfiguration config;
    config.declare_dependency(roles::PLUGINS, "org.example:missing:1.0");
    REQUIRE(config.freeze().ok);

    FakeResolver fake;
    ScopeRewriter rewriter(config);
    RoleResolver resolver(config, fake, &rewriter);

    auto r = rewriter.run(resolver);
    CHECK_FALSE(r.ok);
    CHECK(r.error_kind == ErrorKind::Resolution);
    REQUIRE(r.resolution_errors.size() == 1);
    CHECK(r.resolution_errors[0].role == roles::PLUGINS);
    CHECK(r.resolution_errors[0].module.name == "missing");
}

#include <doctest/doctest.h>
#include "jpi/types.hpp"

using namespace jpi;

// ============================================================================
// Module Identity
// ============================================================================

TEST_CASE("parse_module_id accepts group:name") {
    auto id = parse_module_id("org.jenkins-ci.modules:sshd");
    REQUIRE(id);
    CHECK(id->group == "org.jenkins-ci.modules");
    CHECK(id->name == "sshd");
    CHECK(id->to_string() == "org.jenkins-ci.modules:sshd");
}

TEST_CASE("parse_module_id rejects other shapes") {
    CHECK_FALSE(parse_module_id(""));
    CHECK_FALSE(parse_module_id("junit"));
    CHECK_FALSE(parse_module_id("junit:junit:4.12"));
    CHECK_FALSE(parse_module_id(":junit"));
    CHECK_FALSE(parse_module_id("junit:"));
}

TEST_CASE("ModuleId orders by group then name") {
    CHECK(ModuleId{"a", "z"} < ModuleId{"b", "a"});
    CHECK(ModuleId{"a", "a"} < ModuleId{"a", "b"});
    CHECK(ModuleId{"a", "b"} == ModuleId{"a", "b"});
    CHECK(ModuleVersionId{"a", "b", "1"}.module() == ModuleId{"a", "b"});
}

// ============================================================================
// Dependency Notation
// ============================================================================

TEST_CASE("parse_dependency_notation parses group:name:version") {
    auto r = parse_dependency_notation("junit:junit:4.12");
    REQUIRE(r.ok);
    CHECK(r.dependency.id == ModuleVersionId{"junit", "junit", "4.12"});
    CHECK_FALSE(r.dependency.is_artifact_only());
    CHECK(r.dependency.to_notation() == "junit:junit:4.12");
}

TEST_CASE("parse_dependency_notation parses artifact-only notation") {
    auto r = parse_dependency_notation("org.jenkins-ci.plugins:credentials:2.1@jar");
    REQUIRE(r.ok);
    CHECK(r.dependency.is_artifact_only());
    CHECK(r.dependency.artifact_extension == "jar");
    CHECK(r.dependency.id.version == "2.1");
    CHECK(r.dependency.to_notation() == "org.jenkins-ci.plugins:credentials:2.1@jar");
}

TEST_CASE("parse_dependency_notation trims surrounding whitespace") {
    auto r = parse_dependency_notation("  junit:junit:4.12\n");
    REQUIRE(r.ok);
    CHECK(r.dependency.id.version == "4.12");
}

TEST_CASE("parse_dependency_notation rejects malformed input") {
    SUBCASE("empty") {
        auto r = parse_dependency_notation("");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("empty") != std::string::npos);
    }
    SUBCASE("missing version") {
        auto r = parse_dependency_notation("junit:junit");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("group:name:version") != std::string::npos);
    }
    SUBCASE("empty component") {
        CHECK_FALSE(parse_dependency_notation("junit::4.12").ok);
    }
    SUBCASE("empty extension") {
        CHECK_FALSE(parse_dependency_notation("junit:junit:4.12@").ok);
    }
    SUBCASE("whitespace inside") {
        CHECK_FALSE(parse_dependency_notation("junit:ju nit:4.12").ok);
    }
}

// ============================================================================
// Resolved Artifacts
// ============================================================================

TEST_CASE("ResolvedArtifact::file_name strips directories") {
    ResolvedArtifact a;
    a.file = "/repo/junit/junit/4.12/junit-4.12.jar";
    CHECK(a.file_name() == "junit-4.12.jar");

    a.file = "C:\\repo\\junit-4.12.jar";
    CHECK(a.file_name() == "junit-4.12.jar");

    a.file = "junit-4.12.jar";
    CHECK(a.file_name() == "junit-4.12.jar");
}

TEST_CASE("error kinds have stable names") {
    CHECK(std::string(error_kind_to_string(ErrorKind::Configuration)) == "configuration");
    CHECK(std::string(error_kind_to_string(ErrorKind::Resolution)) == "resolution");
    CHECK(std::string(error_kind_to_string(ErrorKind::Assembly)) == "assembly");
}

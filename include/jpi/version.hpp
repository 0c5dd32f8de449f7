#pragma once

/**
 * @file version.hpp
 * @brief Ordering of module versions during conflict resolution
 *
 * Repository versions are Maven-style ("4.12", "2.190.2", "1.0-SNAPSHOT").
 * They are normalised to SemVer 2.0.0 before comparison:
 *
 *   "4.12"          -> "4.12.0"
 *   "1.0-SNAPSHOT"  -> "1.0.0-SNAPSHOT"
 *   "7"             -> "7.0.0"
 *
 * Versions SemVer rejects ("2.222.4.1", "1207.va_4e26ec0b_3f4") are ordered
 * token by token instead, the way Maven does: numbers numerically, letters
 * as qualifiers (alpha < beta < milestone < rc < snapshot < release < sp).
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>
#include <vector>

namespace jpi {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/**
 * @brief Rewrite a Maven-style version into SemVer form
 * @return Normalised string; unchanged if the input has no recognisable
 *         numeric release part
 */
std::string normalize_version(const std::string& str);

/**
 * @brief Parse a repository version string
 * @return Parsed version or nullopt if it cannot be ordered
 */
std::optional<Version> parse_version(const std::string& str);

struct VersionToken {
    bool numeric = false;
    std::string text;  // lowercase; numbers without leading zeros
};

/**
 * @brief Split a version on '.', '-', '_', '+' and digit/letter boundaries
 * @return nullopt for an empty version or one with other characters
 *         (ranges such as "[1.0,2.0)")
 */
std::optional<std::vector<VersionToken>> tokenize_version(const std::string& str);

/// Maven-style ordering of two versions; nullopt if either cannot be tokenized
std::optional<int> compare_maven_versions(const std::string& a, const std::string& b);

/**
 * @brief Order two version strings
 * @return <0, 0 or >0 like strcmp. SemVer decides when both versions parse,
 *         Maven-style token order otherwise; nullopt when the versions differ
 *         and one of them cannot be tokenized
 */
std::optional<int> compare_versions(const std::string& a, const std::string& b);

} // namespace jpi

#pragma once

/**
 * @file semver.hpp
 * @brief Semantic Versioning 2.0.0 support for component pins
 *
 * Component manifests declare exact SemVer versions; flow nodes and
 * `component.exec` payloads declare requirements. This header provides:
 * - Version parsing and comparison
 * - Requirement parsing (comparators, caret, tilde, wildcards, `||`)
 * - Requirement satisfaction checking
 *
 * @example
 * ```cpp
 * #include <flowpack/semver.hpp>
 *
 * auto version = flowpack::parse_version("1.4.0");
 * auto range = flowpack::parse_range("^1.2");
 *
 * if (version && range && flowpack::satisfies(*version, *range)) {
 *     // 1.4.0 is within >=1.2.0 <2.0.0
 * }
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flowpack {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/// Comparator operators for range expressions
enum class Comparator {
    Eq,   ///< =X.Y.Z
    Lt,   ///< <X.Y.Z
    Le,   ///< <=X.Y.Z
    Gt,   ///< >X.Y.Z
    Ge    ///< >=X.Y.Z
};

/// A single comparator constraint (e.g., ">=1.0.0" or "<2.0.0")
struct Constraint {
    Comparator op;
    Version version;
};

/// Constraints that must ALL be satisfied (AND). An empty set matches any version.
using ComparatorSet = std::vector<Constraint>;

/**
 * @brief A version requirement is a union of comparator sets (OR)
 *
 * Caret, tilde and wildcard forms are lowered to plain comparators at parse
 * time, so `^1.2` is stored as the set `>=1.2.0 <2.0.0`.
 */
struct VersionRange {
    std::vector<ComparatorSet> sets;
    std::string source;  ///< Requirement text as written

    /// True when the range accepts every version ("*" or empty)
    bool matches_any() const;
};

/**
 * @brief Parse a SemVer 2.0.0 version string
 * @param str Version string (e.g., "1.2.3", "1.0.0-alpha+build")
 * @return Parsed version or nullopt on failure
 */
std::optional<Version> parse_version(const std::string& str);

/**
 * @brief Parse a version requirement string
 * @param str Requirement (e.g., "^1.2", ">=1.0.0, <2.0.0", "1.0.0 || ~2.1")
 * @return Parsed range or nullopt on failure
 *
 * Supports =, <, <=, >, >=, ^, ~ and x/X/* wildcards. AND is written with
 * spaces or commas, OR with ||. A bare version is a caret requirement and
 * "*" or an empty string accepts every version.
 */
std::optional<VersionRange> parse_range(const std::string& str);

/// Check if a version satisfies a single constraint
bool satisfies(const Version& version, const Constraint& constraint);

/// Check if a version satisfies a comparator set (all constraints)
bool satisfies(const Version& version, const ComparatorSet& set);

/// Check if a version satisfies a version range (any set)
bool satisfies(const Version& version, const VersionRange& range);

} // namespace flowpack

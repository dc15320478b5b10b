#pragma once

/// @file version.hpp
/// @brief Semantic versions and dependency version compatibility
///
/// Versions are strict SemVer 2.0.0 triples:
/// - "1.2.3", "1.2.3-beta.1", "1.2.3+build.7", "1.2.3-rc.1+sha.a1b2c3"
///
/// Compatibility between an actual version and a declared constraint only
/// looks at major and minor components. Patch, prerelease and build metadata
/// never make two versions incompatible.

#include "fwd.hpp"
#include <keel/core/error.hpp>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace keel_catalog {

// =============================================================================
// SemanticVersion
// =============================================================================

/// Semantic version (major.minor.patch[-prerelease][+build])
struct SemanticVersion {
    std::uint32_t major = 0;
    std::uint32_t minor = 0;
    std::uint32_t patch = 0;
    std::string prerelease;      ///< e.g., "alpha", "beta.1", "rc.2"
    std::string build_metadata;  ///< e.g., "build123", "sha.a1b2c3d"

    SemanticVersion() = default;

    SemanticVersion(std::uint32_t maj, std::uint32_t min, std::uint32_t pat)
        : major(maj), minor(min), patch(pat) {}

    /// Parse a version string
    ///
    /// All three numeric components are mandatory. Numeric components may
    /// not carry leading zeros. Surrounding whitespace is ignored.
    [[nodiscard]] static keel_core::Result<SemanticVersion> parse(std::string_view str);

    /// Three-way comparison (build metadata ignored, prerelease sorts lower)
    [[nodiscard]] std::strong_ordering operator<=>(const SemanticVersion& other) const noexcept;

    [[nodiscard]] bool operator==(const SemanticVersion& other) const noexcept;

    [[nodiscard]] bool is_prerelease() const noexcept {
        return !prerelease.empty();
    }

    [[nodiscard]] std::string to_string() const;

private:
    [[nodiscard]] static std::strong_ordering compare_prerelease(
        std::string_view a, std::string_view b) noexcept;
};

// =============================================================================
// VersionCompatibility
// =============================================================================

/// Outcome of comparing an actual version against a declared constraint
enum class VersionCompatibility : std::uint8_t {
    Compatible,         ///< Same major and minor
    MinorIncompatible,  ///< Same major, different minor
    MajorIncompatible,  ///< Different major, or either side unparsable
};

[[nodiscard]] const char* version_compatibility_to_string(VersionCompatibility compat) noexcept;

/// Remove a leading comparison operator (">=", "<=", ">", "<", "^", "~", "=")
/// and surrounding whitespace from a constraint
[[nodiscard]] std::string_view strip_constraint_operator(std::string_view constraint) noexcept;

/// Classify an actual version against a constraint
[[nodiscard]] VersionCompatibility classify(std::string_view actual, std::string_view constraint);

} // namespace keel_catalog

#pragma once

/// @file version.hpp
/// @brief Semantic versioning for network_rag
///
/// Supports full SemVer 2.0.0:
/// - Parse "1.2.3", "1.2.3-beta", "1.2.3-beta.1+build123"
/// - Strict validation of the canonical MAJOR.MINOR.PATCH form
/// - Compare versions (==, <, >, <=, >=)
/// - Match constraints: ">=1.0.0", "^1.2", "~1.2.3", "1.x", ranges

#include "fwd.hpp"
#include "error.hpp"

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace network_rag {

// =============================================================================
// Version
// =============================================================================

/// Full semantic version (major.minor.patch[-prerelease][+build])
///
/// Follows SemVer 2.0.0 precedence:
/// - Prerelease has lower precedence than normal version
/// - Build metadata is ignored in comparisons
/// - Prerelease identifiers compared as numbers if numeric, else lexically
struct Version {
    std::uint32_t major = 0;
    std::uint32_t minor = 0;
    std::uint32_t patch = 0;
    std::string prerelease;      ///< e.g., "alpha", "beta.1", "rc.2"
    std::string build_metadata;  ///< e.g., "build123", "sha.a1b2c3d"

    /// Default constructor - creates 0.0.0
    Version() = default;

    /// Construct with major.minor.patch
    Version(std::uint32_t maj, std::uint32_t min, std::uint32_t pat) noexcept
        : major(maj), minor(min), patch(pat) {}

    /// Construct with all fields
    Version(std::uint32_t maj, std::uint32_t min, std::uint32_t pat,
            std::string pre, std::string build = "")
        : major(maj), minor(min), patch(pat)
        , prerelease(std::move(pre))
        , build_metadata(std::move(build)) {}

    // =========================================================================
    // Parsing
    // =========================================================================

    /// Parse a version string leniently
    ///
    /// Accepts surrounding whitespace, a leading 'v', and missing components:
    /// "1", "1.2", "v1.2.3", "1.2.3-alpha.1+build123"
    [[nodiscard]] static Result<Version> parse(std::string_view str);

    /// Parse a version string against the exact SemVer 2.0.0 grammar
    ///
    /// Requires all three core components, no leading zeros and no prefix.
    [[nodiscard]] static Result<Version> parse_strict(std::string_view str);

    // =========================================================================
    // Comparison
    // =========================================================================

    [[nodiscard]] std::strong_ordering operator<=>(const Version& other) const noexcept;

    /// Equality ignores build metadata
    [[nodiscard]] bool operator==(const Version& other) const noexcept;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool is_prerelease() const noexcept {
        return !prerelease.empty();
    }

    [[nodiscard]] bool has_build_metadata() const noexcept {
        return !build_metadata.empty();
    }

    /// Check if version is 0.x.x (unstable API)
    [[nodiscard]] bool is_unstable() const noexcept {
        return major == 0;
    }

    /// Check compatibility with another version
    /// Pre-1.0: minor must match exactly, self.patch >= other.patch
    /// Post-1.0: major must match, self >= other
    [[nodiscard]] bool is_compatible_with(const Version& other) const noexcept;

    /// Get core version (without prerelease/build)
    [[nodiscard]] Version core() const {
        return Version{major, minor, patch};
    }

    // =========================================================================
    // String Conversion
    // =========================================================================

    [[nodiscard]] std::string to_string() const;

    /// Convert to string (core version only, no prerelease/build)
    [[nodiscard]] std::string to_string_core() const;

    // =========================================================================
    // Version Incrementing
    // =========================================================================

    // The increments wrap at UINT32_MAX. Constraint bounds use
    // next_breaking_version(), which reports that case instead.

    /// Increment patch version (resets prerelease)
    [[nodiscard]] Version increment_patch() const {
        return Version{major, minor, patch + 1};
    }

    /// Increment minor version (resets patch and prerelease)
    [[nodiscard]] Version increment_minor() const {
        return Version{major, minor + 1, 0};
    }

    /// Increment major version (resets minor, patch, and prerelease)
    [[nodiscard]] Version increment_major() const {
        return Version{major + 1, 0, 0};
    }

private:
    [[nodiscard]] static std::strong_ordering compare_prerelease(
        std::string_view a, std::string_view b) noexcept;
};

/// Output stream operator
inline std::ostream& operator<<(std::ostream& os, const Version& v) {
    return os << v.to_string();
}

/// Check a string against the SemVer 2.0.0 grammar
[[nodiscard]] bool is_valid_semver(std::string_view str);

// =============================================================================
// VersionConstraint
// =============================================================================

/// A constraint that can match versions
///
/// - Exact: "1.2.3" or "=1.2.3"
/// - Greater/Less: ">1.0.0", ">=1.0.0", "<2.0.0", "<=2.0.0"
/// - Caret: "^1.2.3" (>=1.2.3, <2.0.0; >=0.2.3, <0.3.0; >=0.0.3, <0.0.4)
/// - Tilde: "~1.2.3" (>=1.2.3, <1.3.0)
/// - Wildcard: "1.x", "1.2.x", "1.*", "1.2.*"
/// - Range: ">=1.0.0,<2.0.0" (multiple constraints ANDed)
struct VersionConstraint {
    enum class Type : std::uint8_t {
        Any,           ///< Matches any version (*)
        Exact,         ///< Exact match (=1.2.3 or 1.2.3)
        Greater,       ///< Greater than (>1.2.3)
        GreaterEqual,  ///< Greater or equal (>=1.2.3)
        Less,          ///< Less than (<1.2.3)
        LessEqual,     ///< Less or equal (<=1.2.3)
        Caret,         ///< Compatible with (^1.2.3)
        Tilde,         ///< Approximately (~1.2.3)
        Wildcard,      ///< Any patch/minor under a prefix (1.2.x)
        Range          ///< Multiple constraints (>=1.0.0,<2.0.0)
    };

    Type type = Type::Any;
    Version version;                                 ///< Single-version constraints
    Version min_version;                             ///< Wildcard lower bound
    std::optional<Version> max_version;              ///< Wildcard upper bound (exclusive, none when open)
    std::vector<VersionConstraint> sub_constraints;  ///< Range members
    std::string source;                              ///< Text as written

    VersionConstraint() = default;

    /// Parse a version constraint string ("" and "*" match anything)
    [[nodiscard]] static Result<VersionConstraint> parse(std::string_view str);

    /// Check if a version satisfies this constraint
    [[nodiscard]] bool matches(const Version& v) const noexcept;

    /// Canonical string form
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] static VersionConstraint any() {
        return VersionConstraint{};
    }

    [[nodiscard]] static VersionConstraint exact(Version v) {
        VersionConstraint c;
        c.type = Type::Exact;
        c.version = std::move(v);
        return c;
    }

    [[nodiscard]] static VersionConstraint greater_equal(Version v) {
        VersionConstraint c;
        c.type = Type::GreaterEqual;
        c.version = std::move(v);
        return c;
    }

    [[nodiscard]] static VersionConstraint caret(Version v) {
        VersionConstraint c;
        c.type = Type::Caret;
        c.version = std::move(v);
        return c;
    }

    [[nodiscard]] static VersionConstraint tilde(Version v) {
        VersionConstraint c;
        c.type = Type::Tilde;
        c.version = std::move(v);
        return c;
    }
};

/// Get the next breaking version (caret upper bound)
/// 1.2.3 -> 2.0.0, 0.2.3 -> 0.3.0, 0.0.3 -> 0.0.4
/// A component at its maximum carries upward; empty when there is no
/// representable bound.
[[nodiscard]] std::optional<Version> next_breaking_version(const Version& v) noexcept;

// =============================================================================
// Version Comparison
// =============================================================================

/// Detailed version comparison result
struct VersionComparison {
    std::int64_t major_diff = 0;
    std::int64_t minor_diff = 0;
    std::int64_t patch_diff = 0;
    bool is_major_change = false;
    bool is_minor_change = false;
    bool is_patch_change = false;
    bool is_prerelease_change = false;
    bool is_upgrade = false;
    bool is_downgrade = false;
    bool is_equal = false;
};

/// Compare two versions in detail
VersionComparison compare_versions(const Version& from, const Version& to);

/// Format version comparison as human-readable string
std::string format_version_comparison(const Version& from, const Version& to);

} // namespace network_rag

/// Hash specialization (build metadata ignored, matching operator==)
template<>
struct std::hash<network_rag::Version> {
    std::size_t operator()(const network_rag::Version& v) const noexcept {
        std::size_t h = std::hash<std::uint64_t>{}(
            (static_cast<std::uint64_t>(v.major) << 40) ^
            (static_cast<std::uint64_t>(v.minor) << 20) ^
            static_cast<std::uint64_t>(v.patch));
        return h ^ (std::hash<std::string>{}(v.prerelease) << 1);
    }
};

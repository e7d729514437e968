#pragma once

/// @file package.hpp
/// @brief Package identity for network_rag
///
/// The package version is fixed at compile time and never changes while the
/// library is loaded. Everything here is constant data; reading it has no
/// side effects.

#include "fwd.hpp"
#include "error.hpp"
#include "version.hpp"

#include <cstdint>
#include <string>
#include <string_view>

// =============================================================================
// Version Macros
// =============================================================================

#define NETWORK_RAG_VERSION_MAJOR 0
#define NETWORK_RAG_VERSION_MINOR 0
#define NETWORK_RAG_VERSION_PATCH 1
#define NETWORK_RAG_VERSION_STRING "0.0.1"

namespace network_rag {

// =============================================================================
// Version Constants
// =============================================================================

inline constexpr std::uint32_t VERSION_MAJOR = NETWORK_RAG_VERSION_MAJOR;
inline constexpr std::uint32_t VERSION_MINOR = NETWORK_RAG_VERSION_MINOR;
inline constexpr std::uint32_t VERSION_PATCH = NETWORK_RAG_VERSION_PATCH;

/// Package version as text
inline constexpr const char* VERSION_STRING = NETWORK_RAG_VERSION_STRING;

/// Package version
[[nodiscard]] const Version& version();

/// Package version as text ("0.0.1")
[[nodiscard]] std::string version_string();

/// "network_rag 0.0.1"
[[nodiscard]] std::string version_banner();

// =============================================================================
// Package Description
// =============================================================================

/// Static description of the package
struct PackageInfo {
    std::string_view name;
    std::string_view title;
    std::string_view tagline;
    std::string_view summary;
};

/// Get the package description
[[nodiscard]] const PackageInfo& package_info() noexcept;

/// Format the package description for display
[[nodiscard]] std::string format_package_info();

// =============================================================================
// Requirements
// =============================================================================

/// Check the package version against a constraint string (e.g. ">=0.0.1")
[[nodiscard]] Result<void> check_version_requirement(std::string_view constraint);

} // namespace network_rag

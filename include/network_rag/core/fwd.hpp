#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for network_rag core

#include <cstdint>

namespace network_rag {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct VersionError;
struct ExportError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Version
// =============================================================================

struct Version;
struct VersionConstraint;
struct VersionComparison;

// =============================================================================
// Package Root
// =============================================================================

struct PackageInfo;
enum class ExportKind : std::uint8_t;
struct ExportEntry;

// =============================================================================
// Configuration
// =============================================================================

struct LogConfig;
struct LibraryConfig;

} // namespace network_rag

#pragma once

/// @file exports.hpp
/// @brief Public export list of the network_rag package root
///
/// The export table names every item the package root makes public. It is a
/// constant table; looking names up performs no allocation beyond the
/// returned strings and never touches global state.

#include "fwd.hpp"
#include "error.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace network_rag {

// =============================================================================
// ExportKind
// =============================================================================

/// What kind of item an export names
enum class ExportKind : std::uint8_t {
    Constant,
    Function,
    Type,
};

/// Get export kind name
[[nodiscard]] const char* export_kind_name(ExportKind kind) noexcept;

// =============================================================================
// ExportEntry
// =============================================================================

/// One public name of the package root
struct ExportEntry {
    using ValueFn = std::string (*)();

    std::string_view name;
    ExportKind kind = ExportKind::Constant;
    std::string_view summary;
    ValueFn value = nullptr;  ///< Renders the exported item; null means undefined

    /// Check that the entry resolves to a non-empty value
    [[nodiscard]] bool is_defined() const;
};

// =============================================================================
// Export Table
// =============================================================================

/// The package root's export table, in declaration order
[[nodiscard]] std::span<const ExportEntry> exports() noexcept;

/// Exported names, in declaration order
[[nodiscard]] std::vector<std::string> export_names();

/// Look up an export by name
[[nodiscard]] const ExportEntry* find_export(std::string_view name) noexcept;

/// Check whether a name is exported
[[nodiscard]] bool is_exported(std::string_view name) noexcept;

/// Render the value of an exported item
[[nodiscard]] Result<std::string> export_value(std::string_view name);

/// Validate the package's export table
[[nodiscard]] Result<void> validate_exports();

/// Validate an arbitrary export table (names non-empty and unique, all defined)
[[nodiscard]] Result<void> validate_exports(std::span<const ExportEntry> table);

} // namespace network_rag

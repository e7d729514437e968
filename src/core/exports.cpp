/// @file exports.cpp
/// @brief Export table of the network_rag package root

#include <network_rag/core/exports.hpp>
#include <network_rag/core/package.hpp>

#include <array>
#include <set>

namespace network_rag {

namespace {

std::string render_version() {
    return version_string();
}

// Core exports grow here as modules land
constexpr std::array<ExportEntry, 1> EXPORT_TABLE{{
    {"version", ExportKind::Constant, "Package version (semantic version string)", &render_version},
}};

} // anonymous namespace

const char* export_kind_name(ExportKind kind) noexcept {
    switch (kind) {
        case ExportKind::Constant: return "constant";
        case ExportKind::Function: return "function";
        case ExportKind::Type: return "type";
    }
    return "unknown";
}

bool ExportEntry::is_defined() const {
    return value != nullptr && !value().empty();
}

std::span<const ExportEntry> exports() noexcept {
    return EXPORT_TABLE;
}

std::vector<std::string> export_names() {
    std::vector<std::string> names;
    names.reserve(EXPORT_TABLE.size());
    for (const auto& entry : EXPORT_TABLE) {
        names.emplace_back(entry.name);
    }
    return names;
}

const ExportEntry* find_export(std::string_view name) noexcept {
    for (const auto& entry : EXPORT_TABLE) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

bool is_exported(std::string_view name) noexcept {
    return find_export(name) != nullptr;
}

Result<std::string> export_value(std::string_view name) {
    const auto* entry = find_export(name);
    if (entry == nullptr) {
        return Err<std::string>(ExportError::unknown(std::string(name)));
    }
    if (!entry->is_defined()) {
        return Err<std::string>(ExportError::undefined(std::string(name)));
    }
    return Ok(entry->value());
}

Result<void> validate_exports() {
    return validate_exports(exports());
}

Result<void> validate_exports(std::span<const ExportEntry> table) {
    std::set<std::string_view> seen;

    for (std::size_t i = 0; i < table.size(); ++i) {
        const auto& entry = table[i];

        if (entry.name.empty()) {
            return Err(Error(ExportError::undefined("<unnamed>"))
                .with_context("index", std::to_string(i)));
        }
        if (!seen.insert(entry.name).second) {
            return Err(ExportError::duplicate(std::string(entry.name)));
        }
        if (!entry.is_defined()) {
            return Err(ExportError::undefined(std::string(entry.name)));
        }
    }

    return Ok();
}

} // namespace network_rag

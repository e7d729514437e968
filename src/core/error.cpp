/// @file error.cpp
/// @brief Error formatting for network_rag
///
/// Result<T> and Error are header-only. This file holds the out-of-line
/// formatting used by diagnostics and the command-line tool.

#include <network_rag/core/error.hpp>
#include <sstream>
#include <vector>

namespace network_rag {

namespace detail {

std::string format_version_error(const VersionError& err) {
    std::ostringstream oss;
    oss << "[VersionError] " << err.message;

    if (!err.constraint.empty() && !err.found.empty()) {
        oss << " (required: " << err.constraint << ", found: " << err.found << ")";
    }

    return oss.str();
}

std::string format_export_error(const ExportError& err) {
    std::ostringstream oss;
    oss << "[ExportError] " << err.message;
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.source.empty()) {
        oss << " (source: " << err.source << ")";
    }
    if (!err.field.empty()) {
        oss << " (field: " << err.field << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, VersionError>) {
            oss << detail::format_version_error(err);
        } else if constexpr (std::is_same_v<T, ExportError>) {
            oss << detail::format_export_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace network_rag

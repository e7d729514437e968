#pragma once

/// @file network_rag.hpp
/// @brief Main include file for network_rag
///
/// This header includes all network_rag components in dependency order.

#include "core/fwd.hpp"

#include "core/error.hpp"
#include "core/version.hpp"
#include "core/package.hpp"
#include "core/exports.hpp"

#include "core/log.hpp"
#include "core/config.hpp"
#include "core/build_info.hpp"

/// @namespace network_rag
/// @brief Network RAG - Network-based Retrieval-Augmented Generation
///
/// Precise retrieval with broad context. The package combines vector search
/// with explicit network relationships, queried through NXQL. This release
/// ships the package root:
///
/// - **Package**: version constant and package description
/// - **Exports**: the public export list, currently just the version
/// - **Versioning**: SemVer 2.0.0 parsing, ordering and constraints
/// - **Error Handling**: Result<T> monadic error handling
/// - **Logging**: spdlog named loggers
/// - **Configuration**: JSON configuration with environment overrides
///
/// Example usage:
/// @code
/// #include <network_rag/network_rag.hpp>
///
/// using namespace network_rag;
///
/// if (auto ok = check_version_requirement("^0.0.1"); !ok) {
///     std::cerr << build_error_chain(ok.error()) << "\n";
/// }
///
/// for (const auto& name : export_names()) {
///     std::cout << name << " = " << export_value(name).value_or("?") << "\n";
/// }
/// @endcode

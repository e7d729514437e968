#pragma once

/// @file config.hpp
/// @brief Library configuration for network_rag
///
/// Configuration is JSON:
/// @code
/// {
///   "log": { "level": "info", "console": true, "file": false,
///            "directory": "logs", "max_file_size": 10485760, "max_files": 5 },
///   "required_version": ">=0.0.1"
/// }
/// @endcode
/// Every field is optional. Environment variables override file values:
/// - NETWORK_RAG_LOG_LEVEL: log level name
/// - NETWORK_RAG_LOG_DIR: log directory (enables file logging)

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace network_rag {

/// Environment variable names
inline constexpr const char* ENV_LOG_LEVEL = "NETWORK_RAG_LOG_LEVEL";
inline constexpr const char* ENV_LOG_DIR = "NETWORK_RAG_LOG_DIR";

/// Top-level library configuration
struct LibraryConfig {
    LogConfig log;

    /// Constraint the loaded package version must satisfy
    std::optional<std::string> required_version;

    /// Path the config was loaded from (empty for strings/defaults)
    std::filesystem::path source_path;

    /// Load configuration from a JSON file
    [[nodiscard]] static Result<LibraryConfig> load(const std::filesystem::path& path);

    /// Parse configuration from a JSON string
    [[nodiscard]] static Result<LibraryConfig> from_json_string(
        const std::string& json_str,
        const std::filesystem::path& source_path = {});

    /// Parse configuration from parsed JSON
    [[nodiscard]] static Result<LibraryConfig> from_json(const nlohmann::json& j);

    /// Serialize to JSON
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Override config fields from NETWORK_RAG_* environment variables
[[nodiscard]] Result<void> apply_env_overrides(LibraryConfig& config);

/// Configure logging and check required_version
[[nodiscard]] Result<void> apply_config(const LibraryConfig& config);

} // namespace network_rag

/// @file config.cpp
/// @brief Library configuration loading for network_rag

#include <network_rag/core/config.hpp>
#include <network_rag/core/package.hpp>
#include <network_rag/core/version.hpp>

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace network_rag {

namespace {

Result<void> parse_log_section(const nlohmann::json& j, LogConfig& log) {
    if (!j.is_object()) {
        return Err(ConfigError::invalid_value("log", "must be an object"));
    }

    if (j.contains("level")) {
        if (!j["level"].is_string()) {
            return Err(ConfigError::invalid_value("log.level", "must be a string"));
        }
        auto name = j["level"].get<std::string>();
        auto level = parse_log_level(name);
        if (!level) {
            return Err(ConfigError::invalid_value("log.level", "unknown level '" + name + "'"));
        }
        log.level = *level;
    }

    if (j.contains("console")) {
        if (!j["console"].is_boolean()) {
            return Err(ConfigError::invalid_value("log.console", "must be a boolean"));
        }
        log.console_enabled = j["console"].get<bool>();
    }

    if (j.contains("file")) {
        if (!j["file"].is_boolean()) {
            return Err(ConfigError::invalid_value("log.file", "must be a boolean"));
        }
        log.file_enabled = j["file"].get<bool>();
    }

    if (j.contains("directory")) {
        if (!j["directory"].is_string()) {
            return Err(ConfigError::invalid_value("log.directory", "must be a string"));
        }
        log.log_directory = j["directory"].get<std::string>();
    }

    if (j.contains("max_file_size")) {
        if (!j["max_file_size"].is_number_unsigned() || j["max_file_size"].get<std::size_t>() == 0) {
            return Err(ConfigError::invalid_value("log.max_file_size", "must be a positive integer"));
        }
        log.max_file_size = j["max_file_size"].get<std::size_t>();
    }

    if (j.contains("max_files")) {
        if (!j["max_files"].is_number_unsigned() || j["max_files"].get<std::size_t>() == 0) {
            return Err(ConfigError::invalid_value("log.max_files", "must be a positive integer"));
        }
        log.max_files = j["max_files"].get<std::size_t>();
    }

    if (log.file_enabled && log.log_directory.empty()) {
        return Err(ConfigError::invalid_value("log.directory", "required when file logging is enabled"));
    }

    return Ok();
}

} // anonymous namespace

// =============================================================================
// LibraryConfig
// =============================================================================

Result<LibraryConfig> LibraryConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<LibraryConfig>(ConfigError::read_failed(path.string()));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    return from_json_string(content, path);
}

Result<LibraryConfig> LibraryConfig::from_json_string(
    const std::string& json_str,
    const std::filesystem::path& source_path)
{
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::exception& e) {
        return Err<LibraryConfig>(ConfigError::parse_failed(source_path.string(), e.what()));
    }

    auto result = from_json(j);
    if (!result) {
        if (!source_path.empty()) {
            result.error().with_context("source", source_path.string());
        }
        return result;
    }

    result->source_path = source_path;
    return result;
}

Result<LibraryConfig> LibraryConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<LibraryConfig>(ConfigError::invalid_value("<root>", "must be an object"));
    }

    LibraryConfig config;

    if (j.contains("log")) {
        auto log_result = parse_log_section(j["log"], config.log);
        if (!log_result) {
            return Err<LibraryConfig>(log_result.error());
        }
    }

    if (j.contains("required_version")) {
        if (!j["required_version"].is_string()) {
            return Err<LibraryConfig>(ConfigError::invalid_value("required_version", "must be a string"));
        }
        auto text = j["required_version"].get<std::string>();
        auto constraint = VersionConstraint::parse(text);
        if (!constraint) {
            return Err<LibraryConfig>(ConfigError::invalid_value("required_version", constraint.error().message()));
        }
        config.required_version = text;
    }

    return Ok(std::move(config));
}

nlohmann::json LibraryConfig::to_json() const {
    nlohmann::json j;

    nlohmann::json log_json;
    log_json["level"] = log_level_name(log.level);
    log_json["console"] = log.console_enabled;
    log_json["file"] = log.file_enabled;
    if (!log.log_directory.empty()) {
        log_json["directory"] = log.log_directory;
    }
    log_json["max_file_size"] = log.max_file_size;
    log_json["max_files"] = log.max_files;
    j["log"] = log_json;

    if (required_version) {
        j["required_version"] = *required_version;
    }

    return j;
}

// =============================================================================
// Environment and Application
// =============================================================================

Result<void> apply_env_overrides(LibraryConfig& config) {
    if (const char* level_env = std::getenv(ENV_LOG_LEVEL); level_env != nullptr && *level_env != '\0') {
        auto level = parse_log_level(level_env);
        if (!level) {
            return Err(ConfigError::invalid_value(ENV_LOG_LEVEL, "unknown level '" + std::string(level_env) + "'"));
        }
        config.log.level = *level;
    }

    if (const char* dir_env = std::getenv(ENV_LOG_DIR); dir_env != nullptr && *dir_env != '\0') {
        config.log.log_directory = dir_env;
        config.log.file_enabled = true;
    }

    return Ok();
}

Result<void> apply_config(const LibraryConfig& config) {
    if (config.required_version) {
        auto check = check_version_requirement(*config.required_version);
        if (!check) {
            return check;
        }
    }

    configure_logging(config.log);

    library_logger()->debug("Configuration applied (level={}, file={})",
        log_level_name(config.log.level), config.log.file_enabled);

    return Ok();
}

} // namespace network_rag

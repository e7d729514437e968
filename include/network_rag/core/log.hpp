#pragma once

/// @file log.hpp
/// @brief Logging utilities for network_rag
///
/// Loggers are created on first use. Including this header or loading the
/// library registers nothing with spdlog.

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define NETWORK_RAG_LOG_TRACE(...) ::network_rag::library_logger()->trace(__VA_ARGS__)
#define NETWORK_RAG_LOG_DEBUG(...) ::network_rag::library_logger()->debug(__VA_ARGS__)
#define NETWORK_RAG_LOG_INFO(...) ::network_rag::library_logger()->info(__VA_ARGS__)
#define NETWORK_RAG_LOG_WARN(...) ::network_rag::library_logger()->warn(__VA_ARGS__)
#define NETWORK_RAG_LOG_ERROR(...) ::network_rag::library_logger()->error(__VA_ARGS__)
#define NETWORK_RAG_LOG_CRITICAL(...) ::network_rag::library_logger()->critical(__VA_ARGS__)

namespace network_rag {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
///
/// Loggers created before the call are replaced by new logger objects with
/// the new sinks and level. A logger handle held across the call keeps
/// writing to the old sinks; fetch loggers through get_logger() when needed.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Library logger ("network_rag")
std::shared_ptr<spdlog::logger> library_logger();

/// Command-line tool logger ("network_rag.cli")
std::shared_ptr<spdlog::logger> cli_logger();

/// Check whether a logger with this name has been created
[[nodiscard]] bool has_logger(const std::string& name);

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Format a message followed by key="value" fields
std::string format_structured(
    const std::string& message,
    const std::map<std::string, std::string>& fields);

/// Log entry with structured data
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "network_rag");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define NETWORK_RAG_LOG_SCOPE(name) ::network_rag::LogScope _log_scope_##__LINE__(name)
#define NETWORK_RAG_LOG_FUNC() ::network_rag::LogScope _log_scope_func(__FUNCTION__)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Drop all loggers created through this module
void shutdown_logging();

} // namespace network_rag

#pragma once

/// @file log.hpp
/// @brief Logging utilities for crowd_engine

#include <spdlog/spdlog.h>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace crowd_core {

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
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for graph validation and evaluation
std::shared_ptr<spdlog::logger> template_logger();

/// Logger for spatial index construction
std::shared_ptr<spdlog::logger> spatial_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for timing a block at debug level
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "crowd_template");
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

#define CROWD_LOG_SCOPE(name) ::crowd_core::LogScope _log_scope_##__LINE__(name)

} // namespace crowd_core

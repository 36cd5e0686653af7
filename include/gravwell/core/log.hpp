#pragma once

/// @file log.hpp
/// @brief Logging utilities for gravwell

#include "fwd.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define GRAVWELL_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define GRAVWELL_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define GRAVWELL_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define GRAVWELL_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define GRAVWELL_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define GRAVWELL_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace gravwell_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the default logger pattern and level
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

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
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
};

/// Configure logging system with full options. Applies to loggers created afterwards;
/// existing loggers only pick up the new level.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for gravwell_core
std::shared_ptr<spdlog::logger> core_logger();

/// Logger for the simulation (registries, integrator, world)
std::shared_ptr<spdlog::logger> physics_logger();

/// Logger for scene and config loading
std::shared_ptr<spdlog::logger> config_logger();

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

void set_logger_level(const std::string& name, spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Parse log level from string ("trace", "debug", "info", "warn", "error", "critical", "off")
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Drop all named loggers and shut spdlog down
void shutdown_logging();

} // namespace gravwell_core

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_INIT_HPP
#define FERRY_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "ferry_console_sink.hpp"
#include "ferry_file_sink.hpp"
#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

/**
 * Console and file sink settings for the ferry CLI and libraries.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal", ignoring case.
 *
 * @return The level, or std::nullopt for anything else
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Override fields of config from the environment.
 *
 *   FERRY_LOG_LEVEL           - console and file level
 *   FERRY_LOG_CONSOLE_LEVEL   - console level
 *   FERRY_LOG_FILE_LEVEL      - file level
 *   FERRY_LOG_FILE_DIR        - log file directory
 *   FERRY_LOG_FORMAT          - "json" or "text"
 *   FERRY_LOG_FILE_ENABLED    - true/false
 *   FERRY_LOG_CONSOLE_ENABLED - true/false
 *
 * Empty or unparsable values leave the field untouched.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks. A second call without shutdown_logging()
 * in between is ignored.
 */
void init_logging(const LoggingConfig& config);

/**
 * Console at INFO with colors, no file sink.
 */
void init_logging_default();

/**
 * Drain the async queues and detach every sink.
 */
void shutdown_logging();

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

/**
 * Shut down and re-initialize with config plus environment overrides.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_INIT_HPP

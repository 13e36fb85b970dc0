// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_INIT_HPP
#define FERRY_LOG_INIT_HPP

#include <optional>
#include <string>

#include "ferry_console_sink.hpp"
#include "ferry_file_sink.hpp"
#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

/**
 * Logging configuration shared by the ferry executables.
 */
struct LoggingConfig {
  // Attached to every record so files from several runs can be told apart
  std::string tool_name = "ferry";
  std::string run_id;  // Empty generates one at init

  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  // File sink
  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse a string to severity_level.
 * Accepts: "debug", "info", "warn", "warning", "error", "fatal" (case-insensitive)
 *
 * @return The parsed severity_level, or std::nullopt if invalid
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 * Supported environment variables:
 *   FERRY_LOG_LEVEL          - Global level (console and file)
 *   FERRY_LOG_CONSOLE_LEVEL  - Console sink level
 *   FERRY_LOG_FILE_LEVEL     - File sink level
 *   FERRY_LOG_FILE_DIR       - Log file directory
 *   FERRY_LOG_FORMAT         - File format ("json" or "text")
 *   FERRY_LOG_FILE_ENABLED   - Enable file logging ("true" or "false")
 *   FERRY_LOG_COLORS         - Console colors ("true" or "false")
 *   FERRY_LOG_RUN_ID         - Run identifier, e.g. set by a scheduler
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * "<tool>-<UTC yyyymmddThhmmss>-<pid>"
 */
std::string make_run_id(const std::string& tool_name);

/**
 * Initialize console and file sinks and register the Tool and RunId
 * attributes. Later calls are ignored until shutdown_logging() runs.
 */
void init_logging(const LoggingConfig& config);

/**
 * Initialize with console-only INFO logging.
 */
void init_logging_default();

/**
 * Stop async sink threads, flush pending records and detach all sinks.
 */
void shutdown_logging();

/**
 * Flush all sinks.
 */
void flush_logging();

bool is_logging_initialized();

/**
 * Run identifier of the active logging session, empty when not initialized.
 */
std::string current_run_id();

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_INIT_HPP

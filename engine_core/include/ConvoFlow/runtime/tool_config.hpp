#pragma once

/**
 * @file tool_config.hpp
 * @brief Tool Configuration - Settings for the convoflow command-line tool
 *
 * Sections:
 * - Logging (level, console output, log file)
 * - Serializer (rendering backend for canonical export)
 * - Output (JSON report formatting)
 */

#include "ConvoFlow/core/logger.hpp"
#include "ConvoFlow/core/types.hpp"
#include "ConvoFlow/flow/serializer_backend.hpp"
#include <string>

namespace ConvoFlow::runtime {

/**
 * @brief Logging configuration section
 */
struct LoggingSettings {
  core::LogLevel level = core::LogLevel::Warning;
  bool logToConsole = true;
  std::string logFile; // Empty = no file output
};

/**
 * @brief Canonical serializer configuration section
 */
struct SerializerSettings {
  flow::SerializerKind backend = flow::SerializerKind::Plain;
};

/**
 * @brief Report output configuration section
 */
struct OutputSettings {
  i32 jsonIndent = 2; // -1 = compact single-line JSON
};

/**
 * @brief Complete tool configuration
 */
struct ToolConfig {
  LoggingSettings logging;
  SerializerSettings serializer;
  OutputSettings output;
};

} // namespace ConvoFlow::runtime

#pragma once

/**
 * @file config_manager.hpp
 * @brief Configuration Manager - Load layered tool configuration
 *
 * Layers, lowest precedence first:
 * 1. Defaults (built-in)
 * 2. A JSON config file (--config <path>, else convoflow.json in the
 *    working directory when present)
 * 3. Command-line overrides, applied by the caller on getConfigMutable()
 *
 * Config file layout:
 * @code
 * {
 *   "logging": {"level": "info", "logToConsole": true, "logFile": ""},
 *   "serializer": {"backend": "plain"},
 *   "output": {"jsonIndent": 2}
 * }
 * @endcode
 * Unknown sections and keys are ignored. A known key holding the wrong type
 * or an unrecognized value rejects the whole file.
 */

#include "ConvoFlow/core/result.hpp"
#include "ConvoFlow/runtime/tool_config.hpp"
#include <string>

namespace ConvoFlow::runtime {

class ConfigManager {
public:
  static constexpr const char* kDefaultConfigFile = "convoflow.json";

  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  /**
   * @brief Apply a config file on top of the current configuration
   * @return Success or error message; the configuration is unchanged on error
   */
  Result<void> loadFromFile(const std::string& path);

  /**
   * @brief Apply JSON text on top of the current configuration
   * @param sourceName Name used in error messages
   */
  Result<void> loadFromString(const std::string& json, const std::string& sourceName = "config");

  /**
   * @brief Load kDefaultConfigFile from a directory when it exists
   *
   * A missing file is not an error.
   */
  Result<void> loadDefaultFile(const std::string& directory);

  /**
   * @brief Get the current merged configuration
   */
  [[nodiscard]] const ToolConfig& getConfig() const { return m_config; }

  /**
   * @brief Get mutable configuration for command-line overrides
   */
  ToolConfig& getConfigMutable() { return m_config; }

  /**
   * @brief Path of the last config file applied, empty if none
   */
  [[nodiscard]] const std::string& getLoadedPath() const { return m_loadedPath; }

  void resetToDefaults();

private:
  ToolConfig m_config;
  std::string m_loadedPath;
};

} // namespace ConvoFlow::runtime

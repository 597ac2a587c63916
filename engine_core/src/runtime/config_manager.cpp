/**
 * @file config_manager.cpp
 * @brief Configuration Manager implementation
 */

#include "ConvoFlow/runtime/config_manager.hpp"
#include "ConvoFlow/core/logger.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace fs = std::filesystem;

namespace ConvoFlow::runtime {

namespace {

using Json = nlohmann::json;

// Key lookup helpers; each returns an error for a present key of the wrong type

Result<void> readString(const Json& section, const std::string& path, const char* key,
                        std::string& out) {
  auto it = section.find(key);
  if (it == section.end()) {
    return Result<void>::ok();
  }
  if (!it->is_string()) {
    return Result<void>::error(path + "." + key + " must be a string");
  }
  out = it->get<std::string>();
  return Result<void>::ok();
}

Result<void> readBool(const Json& section, const std::string& path, const char* key, bool& out) {
  auto it = section.find(key);
  if (it == section.end()) {
    return Result<void>::ok();
  }
  if (!it->is_boolean()) {
    return Result<void>::error(path + "." + key + " must be a boolean");
  }
  out = it->get<bool>();
  return Result<void>::ok();
}

Result<void> readInt(const Json& section, const std::string& path, const char* key, i32& out) {
  auto it = section.find(key);
  if (it == section.end()) {
    return Result<void>::ok();
  }
  if (!it->is_number_integer()) {
    return Result<void>::error(path + "." + key + " must be an integer");
  }

  const bool fits =
      it->is_number_unsigned()
          ? it->get<u64>() <= static_cast<u64>(std::numeric_limits<i32>::max())
          : it->get<i64>() >= std::numeric_limits<i32>::min() &&
                it->get<i64>() <= std::numeric_limits<i32>::max();
  if (!fits) {
    return Result<void>::error(path + "." + key + " is out of range");
  }
  out = static_cast<i32>(it->get<i64>());
  return Result<void>::ok();
}

const Json* findSection(const Json& root, const char* name, std::string& error) {
  auto it = root.find(name);
  if (it == root.end()) {
    return nullptr;
  }
  if (!it->is_object()) {
    error = std::string(name) + " must be an object";
    return nullptr;
  }
  return &*it;
}

Result<void> parseLogging(const Json& root, LoggingSettings& logging) {
  std::string error;
  const Json* section = findSection(root, "logging", error);
  if (!error.empty()) {
    return Result<void>::error(error);
  }
  if (section == nullptr) {
    return Result<void>::ok();
  }

  std::string level;
  auto result = readString(*section, "logging", "level", level);
  if (result.isError()) {
    return result;
  }
  if (!level.empty() && !core::parseLogLevel(level, logging.level)) {
    return Result<void>::error("logging.level has unknown value '" + level + "'");
  }

  result = readBool(*section, "logging", "logToConsole", logging.logToConsole);
  if (result.isError()) {
    return result;
  }
  return readString(*section, "logging", "logFile", logging.logFile);
}

Result<void> parseSerializer(const Json& root, SerializerSettings& serializer) {
  std::string error;
  const Json* section = findSection(root, "serializer", error);
  if (!error.empty()) {
    return Result<void>::error(error);
  }
  if (section == nullptr) {
    return Result<void>::ok();
  }

  std::string backend;
  auto result = readString(*section, "serializer", "backend", backend);
  if (result.isError()) {
    return result;
  }
  if (!backend.empty() && !flow::parseSerializerKind(backend, serializer.backend)) {
    return Result<void>::error("serializer.backend has unknown value '" + backend + "'");
  }
  return Result<void>::ok();
}

Result<void> parseOutput(const Json& root, OutputSettings& output) {
  std::string error;
  const Json* section = findSection(root, "output", error);
  if (!error.empty()) {
    return Result<void>::error(error);
  }
  if (section == nullptr) {
    return Result<void>::ok();
  }

  auto result = readInt(*section, "output", "jsonIndent", output.jsonIndent);
  if (result.isError()) {
    return result;
  }
  if (output.jsonIndent < -1) {
    return Result<void>::error("output.jsonIndent must be -1 or greater");
  }
  return Result<void>::ok();
}

} // namespace

ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<void>::error("Cannot open config file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  auto result = loadFromString(buffer.str(), path);
  if (result.isOk()) {
    m_loadedPath = path;
    CONVOFLOW_LOG_INFO("Loaded configuration from " + path);
  }
  return result;
}

Result<void> ConfigManager::loadFromString(const std::string& json,
                                           const std::string& sourceName) {
  Json root;
  try {
    root = Json::parse(json);
  } catch (const Json::parse_error& e) {
    return Result<void>::error(sourceName + ": invalid JSON: " + e.what());
  }

  if (!root.is_object()) {
    return Result<void>::error(sourceName + ": top level must be an object");
  }

  // Parse into a copy so a bad file leaves the current settings untouched
  ToolConfig config = m_config;

  auto result = parseLogging(root, config.logging);
  if (result.isOk()) {
    result = parseSerializer(root, config.serializer);
  }
  if (result.isOk()) {
    result = parseOutput(root, config.output);
  }
  if (result.isError()) {
    return Result<void>::error(sourceName + ": " + result.error());
  }

  m_config = config;
  return Result<void>::ok();
}

Result<void> ConfigManager::loadDefaultFile(const std::string& directory) {
  const fs::path path = fs::path(directory) / kDefaultConfigFile;

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    CONVOFLOW_LOG_DEBUG("No " + std::string(kDefaultConfigFile) + " in " + directory +
                        ", using defaults");
    return Result<void>::ok();
  }
  return loadFromFile(path.string());
}

void ConfigManager::resetToDefaults() {
  m_config = ToolConfig();
  m_loadedPath.clear();
}

} // namespace ConvoFlow::runtime

#pragma once

#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ConvoFlow::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning"/"warn",
 *        "error", "fatal", "off"), case-insensitive
 * @return true if the name was recognised
 */
bool parseLogLevel(std::string_view name, LogLevel& outLevel);

class Logger {
public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;

  void setConsoleOutput(bool enabled);
  [[nodiscard]] bool isConsoleOutputEnabled() const;

  bool setOutputFile(const std::string& path);
  void closeOutputFile();

  using LogCallback = std::function<void(LogLevel, const std::string&)>;
  void addLogCallback(LogCallback callback);
  void clearLogCallbacks();

  void log(LogLevel level, std::string_view message);

  void trace(std::string_view message);
  void debug(std::string_view message);
  void info(std::string_view message);
  void warning(std::string_view message);
  void error(std::string_view message);
  void fatal(std::string_view message);

private:
  Logger();
  ~Logger();

  [[nodiscard]] const char* levelToString(LogLevel level) const;
  [[nodiscard]] const char* levelToColor(LogLevel level) const;
  [[nodiscard]] std::string getCurrentTimestamp() const;

  LogLevel m_level;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  bool m_useColors;
  bool m_consoleOutput;
  std::vector<LogCallback> m_callbacks;
};

} // namespace ConvoFlow::core

#define CONVOFLOW_LOG_TRACE(...) ::ConvoFlow::core::Logger::instance().trace(__VA_ARGS__)
#define CONVOFLOW_LOG_DEBUG(...) ::ConvoFlow::core::Logger::instance().debug(__VA_ARGS__)
#define CONVOFLOW_LOG_INFO(...) ::ConvoFlow::core::Logger::instance().info(__VA_ARGS__)
#define CONVOFLOW_LOG_WARN(...) ::ConvoFlow::core::Logger::instance().warning(__VA_ARGS__)
#define CONVOFLOW_LOG_ERROR(...) ::ConvoFlow::core::Logger::instance().error(__VA_ARGS__)
#define CONVOFLOW_LOG_FATAL(...) ::ConvoFlow::core::Logger::instance().fatal(__VA_ARGS__)

/**
 * @file logger.cpp
 * @brief Process-wide logger implementation
 */

#include "ConvoFlow/core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define CONVOFLOW_ISATTY _isatty
#define CONVOFLOW_FILENO _fileno
#else
#include <unistd.h>
#define CONVOFLOW_ISATTY isatty
#define CONVOFLOW_FILENO fileno
#endif

namespace ConvoFlow::core {

bool parseLogLevel(std::string_view name, LogLevel& outLevel) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace") {
    outLevel = LogLevel::Trace;
  } else if (lowered == "debug") {
    outLevel = LogLevel::Debug;
  } else if (lowered == "info") {
    outLevel = LogLevel::Info;
  } else if (lowered == "warning" || lowered == "warn") {
    outLevel = LogLevel::Warning;
  } else if (lowered == "error") {
    outLevel = LogLevel::Error;
  } else if (lowered == "fatal") {
    outLevel = LogLevel::Fatal;
  } else if (lowered == "off") {
    outLevel = LogLevel::Off;
  } else {
    return false;
  }
  return true;
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger()
    : m_level(LogLevel::Warning),
      m_useColors(CONVOFLOW_ISATTY(CONVOFLOW_FILENO(stderr)) != 0),
      m_consoleOutput(true) {}

Logger::~Logger() {
  closeOutputFile();
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_level = level;
}

LogLevel Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

void Logger::setConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_consoleOutput = enabled;
}

bool Logger::isConsoleOutputEnabled() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_consoleOutput;
}

bool Logger::setOutputFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
  m_fileStream.open(path, std::ios::out | std::ios::app);
  return m_fileStream.is_open();
}

void Logger::closeOutputFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.flush();
    m_fileStream.close();
  }
}

void Logger::addLogCallback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.push_back(std::move(callback));
}

void Logger::clearLogCallbacks() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.clear();
}

void Logger::log(LogLevel level, std::string_view message) {
  if (level == LogLevel::Off) {
    return;
  }

  std::vector<LogCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_level == LogLevel::Off || level < m_level) {
      return;
    }

    const std::string line =
        "[" + getCurrentTimestamp() + "] [" + levelToString(level) + "] " + std::string(message);

    if (m_consoleOutput) {
      if (m_useColors) {
        std::cerr << levelToColor(level) << line << "\033[0m\n";
      } else {
        std::cerr << line << '\n';
      }
    }

    if (m_fileStream.is_open()) {
      m_fileStream << line << '\n';
      m_fileStream.flush();
    }

    callbacks = m_callbacks;
  }

  // Callbacks run unlocked so they may log themselves
  const std::string text(message);
  for (const auto& callback : callbacks) {
    callback(level, text);
  }
}

void Logger::trace(std::string_view message) {
  log(LogLevel::Trace, message);
}

void Logger::debug(std::string_view message) {
  log(LogLevel::Debug, message);
}

void Logger::info(std::string_view message) {
  log(LogLevel::Info, message);
}

void Logger::warning(std::string_view message) {
  log(LogLevel::Warning, message);
}

void Logger::error(std::string_view message) {
  log(LogLevel::Error, message);
}

void Logger::fatal(std::string_view message) {
  log(LogLevel::Fatal, message);
}

const char* Logger::levelToString(LogLevel level) const {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Fatal:
    return "FATAL";
  case LogLevel::Off:
    return "OFF";
  }
  return "UNKNOWN";
}

const char* Logger::levelToColor(LogLevel level) const {
  switch (level) {
  case LogLevel::Trace:
    return "\033[90m";
  case LogLevel::Debug:
    return "\033[36m";
  case LogLevel::Info:
    return "\033[32m";
  case LogLevel::Warning:
    return "\033[33m";
  case LogLevel::Error:
    return "\033[31m";
  case LogLevel::Fatal:
    return "\033[1;31m";
  case LogLevel::Off:
    break;
  }
  return "";
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif

  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);

  char msBuffer[8];
  std::snprintf(msBuffer, sizeof(msBuffer), ".%03d", static_cast<int>(ms));
  return std::string(buffer) + msBuffer;
}

} // namespace ConvoFlow::core

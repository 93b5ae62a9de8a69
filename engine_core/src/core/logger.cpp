#include "TalkGraph/core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define TALKGRAPH_ISATTY _isatty
#define TALKGRAPH_FILENO _fileno
#else
#include <unistd.h>
#define TALKGRAPH_ISATTY isatty
#define TALKGRAPH_FILENO fileno
#endif

namespace TalkGraph::core {

std::optional<LogLevel> parseLogLevel(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace")
    return LogLevel::Trace;
  if (lowered == "debug")
    return LogLevel::Debug;
  if (lowered == "info")
    return LogLevel::Info;
  if (lowered == "warning" || lowered == "warn")
    return LogLevel::Warning;
  if (lowered == "error")
    return LogLevel::Error;
  if (lowered == "fatal")
    return LogLevel::Fatal;
  if (lowered == "off")
    return LogLevel::Off;
  return std::nullopt;
}

const char* logLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "trace";
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warning:
    return "warning";
  case LogLevel::Error:
    return "error";
  case LogLevel::Fatal:
    return "fatal";
  case LogLevel::Off:
    return "off";
  }
  return "unknown";
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger()
    : m_level(LogLevel::Info), m_consoleEnabled(true),
      m_useColors(TALKGRAPH_ISATTY(TALKGRAPH_FILENO(stderr)) != 0) {}

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

bool Logger::isEnabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return level != LogLevel::Off && level >= m_level;
}

bool Logger::setOutputFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
  if (path.empty()) {
    return true;
  }
  m_fileStream.open(path, std::ios::out | std::ios::app);
  return m_fileStream.is_open();
}

void Logger::closeOutputFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
}

void Logger::setConsoleEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_consoleEnabled = enabled;
}

void Logger::setUseColors(bool useColors) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_useColors = useColors;
}

bool Logger::getUseColors() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_useColors;
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
  std::vector<LogCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level == LogLevel::Off || level < m_level) {
      return;
    }

    const std::string line =
        std::format("[{}] [{}] {}", getCurrentTimestamp(), logLevelName(level), message);

    if (m_consoleEnabled) {
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

  // Callbacks run unlocked so they may log themselves.
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
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif

  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm);
  return std::format("{}.{:03}", buffer, static_cast<int>(ms.count()));
}

} // namespace TalkGraph::core

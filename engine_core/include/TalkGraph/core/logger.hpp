#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide logger used by the compiler, host and player
 *
 * Messages go to stderr (optionally colored), to an optional log file and
 * to any registered callbacks. Level names accepted by parseLogLevel() are
 * the ones used in the "logging.level" config key.
 */

#include <cstdio>
#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TalkGraph::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

/**
 * @brief Parse "trace", "debug", "info", "warning"/"warn", "error",
 * "fatal" or "off" (case-insensitive)
 */
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

[[nodiscard]] const char* logLevelName(LogLevel level);

class Logger {
public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;
  [[nodiscard]] bool isEnabled(LogLevel level) const;

  /**
   * @brief Open (append) a log file; an empty path closes the current one
   * @return false if the file could not be opened
   */
  bool setOutputFile(const std::string& path);
  void closeOutputFile();

  void setConsoleEnabled(bool enabled);
  void setUseColors(bool useColors);
  [[nodiscard]] bool getUseColors() const;

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

  template <typename... Args> void trace(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Trace))
      trace(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args> void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Debug))
      debug(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args> void info(std::format_string<Args...> fmt, Args&&... args) {
    info(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args> void warning(std::format_string<Args...> fmt, Args&&... args) {
    warning(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args> void error(std::format_string<Args...> fmt, Args&&... args) {
    error(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args> void fatal(std::format_string<Args...> fmt, Args&&... args) {
    fatal(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
  }

private:
  Logger();
  ~Logger();

  [[nodiscard]] const char* levelToColor(LogLevel level) const;
  [[nodiscard]] std::string getCurrentTimestamp() const;

  LogLevel m_level;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  bool m_consoleEnabled;
  bool m_useColors;
  std::vector<LogCallback> m_callbacks;
};

} // namespace TalkGraph::core

#define TALKGRAPH_LOG_TRACE(...) ::TalkGraph::core::Logger::instance().trace(__VA_ARGS__)
#define TALKGRAPH_LOG_DEBUG(...) ::TalkGraph::core::Logger::instance().debug(__VA_ARGS__)
#define TALKGRAPH_LOG_INFO(...) ::TalkGraph::core::Logger::instance().info(__VA_ARGS__)
#define TALKGRAPH_LOG_WARN(...) ::TalkGraph::core::Logger::instance().warning(__VA_ARGS__)
#define TALKGRAPH_LOG_ERROR(...) ::TalkGraph::core::Logger::instance().error(__VA_ARGS__)
#define TALKGRAPH_LOG_FATAL(...) ::TalkGraph::core::Logger::instance().fatal(__VA_ARGS__)

#pragma once

/**
 * @file runtime_config.hpp
 * @brief Settings for compiling and playing conversations
 *
 * Sections:
 * - Logging (level, file output, colors)
 * - Compile (end-flag handling, validator switches)
 * - Player (terminal presentation)
 */

#include "TalkGraph/core/types.hpp"
#include <optional>
#include <string>

namespace TalkGraph::runtime {

/**
 * @brief Logging configuration section
 */
struct LoggingSettings {
  std::string level = "info"; // trace, debug, info, warning, error, fatal, off
  bool logToFile = false;
  std::string logFile = "talkgraph.log";
  std::optional<bool> useColors; // Unset: colour only when stderr is a terminal
};

/**
 * @brief Compilation and validation configuration section
 */
struct CompileSettings {
  bool honourEndFlag = true;     // `end: true` lines get no outgoing edges
  bool runValidator = true;      // Lint scripts before compiling
  bool warningsAsErrors = false; // Refuse scripts with validator warnings
  bool reportUnused = true;
  bool reportUnreachable = true;
};

/**
 * @brief Terminal player configuration section
 */
struct PlayerSettings {
  std::string narratorName = "Narrator"; // Speaker shown for lines without talkers
  bool showChoiceNumbers = true;
  bool markSeenLines = false; // Prefix revisited lines with "(seen)"
};

/**
 * @brief Complete configuration, loaded from a talkgraph.json file
 */
struct TalkConfig {
  std::string version = "1.0";

  LoggingSettings logging;
  CompileSettings compile;
  PlayerSettings player;
};

} // namespace TalkGraph::runtime

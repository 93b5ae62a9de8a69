#pragma once

/**
 * @file talk_player.hpp
 * @brief Terminal player - plays a conversation script on a text stream
 *
 * The player provides:
 * - Command-line parsing (script path, config override, start line)
 * - Config loading and Logger setup
 * - Script loading, validation and compilation with readable diagnostics
 * - An interactive loop over any istream/ostream pair
 *
 * Commands read in the loop:
 *   <empty>   advance to the next line
 *   <n>       pick the n-th choice of the current line
 *   j <id>    jump to any line id
 *   q         quit
 */

#include "TalkGraph/core/result.hpp"
#include "TalkGraph/runtime/config_manager.hpp"
#include "TalkGraph/runtime/talk_host.hpp"
#include "TalkGraph/scripting/talk_validator.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace TalkGraph::runtime {

/**
 * @brief Command-line options
 */
struct PlayerOptions {
  std::string scriptPath;                  // Script to play (positional)
  std::string configPath;                  // --config <path>
  std::optional<LineId> startOverride;     // --start <id>
  bool validateOnly = false;               // --validate
  bool verbose = false;                    // --verbose / -v
  bool quiet = false;                      // --quiet / -q
  bool help = false;                       // --help / -h
  bool version = false;                    // --version
  std::vector<std::string> errors;         // Malformed arguments
};

class TalkPlayer {
public:
  TalkPlayer();
  ~TalkPlayer() = default;

  TalkPlayer(const TalkPlayer&) = delete;
  TalkPlayer& operator=(const TalkPlayer&) = delete;

  /**
   * @brief Full command-line flow; what main() calls
   * @return Process exit code (0 ok, 1 failure, 2 validation failure)
   */
  int exec(int argc, const char* const argv[], std::istream& in, std::ostream& out,
           std::ostream& err);

  [[nodiscard]] static PlayerOptions parseArgs(int argc, const char* const argv[]);

  /**
   * @brief Load config and script, validate and compile
   *
   * Validator diagnostics and compile errors are written to @p diag.
   */
  Result<void> initialize(const PlayerOptions& options, std::ostream& diag);

  /**
   * @brief Play the conversation until it ends, input runs out or 'q'
   * @return 0, or 1 if initialize() did not succeed
   */
  int run(std::istream& in, std::ostream& out);

  [[nodiscard]] const ConfigManager& config() const { return m_config; }
  [[nodiscard]] const scripting::ValidationResult& validation() const { return m_validation; }
  [[nodiscard]] const Conversation* conversation() const;

  static void printHelp(std::ostream& out, const char* programName);
  static void printVersion(std::ostream& out);

private:
  Result<void> initializeLogging(const PlayerOptions& options);

  void printCurrent(std::ostream& out);
  bool handleInput(const std::string& input, std::ostream& out);

  ConfigManager m_config;
  TalkHost m_host;
  std::optional<TalkHandle> m_talk;
  scripting::ValidationResult m_validation;

  // Nodes already shown, keyed by node index.
  std::unordered_set<scripting::NodeIndex> m_seenNodes;
  std::ostream* m_out = nullptr;
};

} // namespace TalkGraph::runtime

#pragma once

/**
 * @file script_loader.hpp
 * @brief Reads conversation scripts (*.talk.json) into a TalkScript
 *
 * Document layout:
 * @code
 * {
 *   "talkers": [ { "name": "Bob", "asset": "bob.png" } ],
 *   "lines": [
 *     { "id": 1, "text": "Hi!", "talker": "Bob", "start": true, "next": 2 },
 *     { "id": 2, "text": "Well?", "choices": [ { "text": "Bye", "next": 3 } ] },
 *     { "id": 3, "text": "", "action": "exit", "talkers": ["Bob"], "end": true }
 *   ]
 * }
 * @endcode
 *
 * Only the document shape is checked here; graph rules (unique ids, a
 * single start line, resolvable links) are the TalkCompiler's job.
 */

#include "TalkGraph/core/result.hpp"
#include "TalkGraph/scripting/talk_script.hpp"
#include <string>

namespace TalkGraph::scripting {

class ScriptLoader {
public:
  /**
   * @brief Parse a script document from JSON text
   * @return The script, or an error naming the offending line and field
   */
  [[nodiscard]] static Result<TalkScript> parse(const std::string& json);

  /**
   * @brief Read and parse a script file
   */
  [[nodiscard]] static Result<TalkScript> loadFromFile(const std::string& path);

  /**
   * @brief Serialize a script back to JSON (2-space indented)
   *
   * Optional fields that are unset are omitted.
   */
  [[nodiscard]] static std::string toJson(const TalkScript& script);
};

} // namespace TalkGraph::scripting

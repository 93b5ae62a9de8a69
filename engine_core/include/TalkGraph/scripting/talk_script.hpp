#pragma once

/**
 * @file talk_script.hpp
 * @brief Authored (pre-compilation) shape of a conversation script
 *
 * These are plain data records filled by the ScriptLoader or built by hand.
 * They are consumed once by the TalkCompiler and never exposed by a
 * compiled Conversation.
 */

#include "TalkGraph/core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace TalkGraph::scripting {

/// Author-assigned identifier of a dialogue line.
using LineId = i32;

/**
 * @brief A named speaker referenced by dialogue lines
 */
struct Talker {
  std::string name;
  std::string asset; ///< Portrait/sprite reference, not interpreted here

  bool operator==(const Talker&) const = default;
};

/**
 * @brief A player-facing branch from a line to another line
 */
struct Choice {
  std::string text;
  LineId next = 0;

  bool operator==(const Choice&) const = default;
};

/**
 * @brief What a line does on stage
 */
enum class LineAction : u8 {
  Talk,  ///< Talkers say the text
  Enter, ///< Talkers join the scene
  Exit   ///< Talkers leave the scene
};

/**
 * @brief One authored unit of dialogue
 */
struct DialogueLine {
  LineId id = 0;
  std::string text;
  std::optional<std::string> talker;
  std::vector<std::string> talkers; ///< Extra talkers, listed after `talker`
  LineAction action = LineAction::Talk;
  std::optional<std::vector<Choice>> choices;
  std::optional<LineId> next;
  std::optional<bool> start;
  std::optional<bool> end;

  [[nodiscard]] bool isStart() const { return start.value_or(false); }
  [[nodiscard]] bool isEnd() const { return end.value_or(false); }

  /// Non-empty choice list; an empty list counts as no choices.
  [[nodiscard]] bool hasChoices() const { return choices.has_value() && !choices->empty(); }

  /// `talker` followed by `talkers`, in authored order.
  [[nodiscard]] std::vector<std::string> talkerNames() const {
    std::vector<std::string> names;
    if (talker.has_value()) {
      names.push_back(*talker);
    }
    names.insert(names.end(), talkers.begin(), talkers.end());
    return names;
  }
};

/**
 * @brief A complete conversation script: talkers plus ordered lines
 */
struct TalkScript {
  std::vector<Talker> talkers;
  std::vector<DialogueLine> lines;
};

[[nodiscard]] inline const char* lineActionToString(LineAction action) {
  switch (action) {
  case LineAction::Talk:
    return "talk";
  case LineAction::Enter:
    return "enter";
  case LineAction::Exit:
    return "exit";
  }
  return "unknown";
}

[[nodiscard]] inline std::optional<LineAction> lineActionFromString(const std::string& str) {
  if (str == "talk")
    return LineAction::Talk;
  if (str == "enter" || str == "join")
    return LineAction::Enter;
  if (str == "exit" || str == "leave")
    return LineAction::Exit;
  return std::nullopt;
}

} // namespace TalkGraph::scripting

#pragma once

/**
 * @file dialogue_node.hpp
 * @brief Compiled form of a dialogue line
 *
 * A node's action is one explicit tagged union, so only a Choice node can
 * carry choices.
 */

#include "TalkGraph/scripting/talk_script.hpp"
#include <string>
#include <variant>
#include <vector>

namespace TalkGraph::scripting {

enum class NodeKind : u8 { Talk, Choice, Join, Leave };

[[nodiscard]] inline const char* nodeKindToString(NodeKind kind) {
  switch (kind) {
  case NodeKind::Talk:
    return "talk";
  case NodeKind::Choice:
    return "choice";
  case NodeKind::Join:
    return "join";
  case NodeKind::Leave:
    return "leave";
  }
  return "unknown";
}

struct TalkAction {
  std::vector<Talker> talkers;
};

struct ChoiceAction {
  std::vector<Talker> talkers;
  std::vector<Choice> choices; ///< Never empty
};

struct JoinAction {
  std::vector<Talker> talkers;
};

struct LeaveAction {
  std::vector<Talker> talkers;
};

// Alternatives are declared in NodeKind order.
using NodeAction = std::variant<TalkAction, ChoiceAction, JoinAction, LeaveAction>;

/**
 * @brief One compiled line, stored in the conversation's node arena
 */
struct DialogueNode {
  LineId id = 0;
  std::string text;
  NodeAction action;

  [[nodiscard]] NodeKind kind() const { return static_cast<NodeKind>(action.index()); }

  [[nodiscard]] bool isChoice() const { return std::holds_alternative<ChoiceAction>(action); }

  [[nodiscard]] const std::vector<Talker>& talkers() const {
    return std::visit([](const auto& a) -> const std::vector<Talker>& { return a.talkers; },
                      action);
  }

  /// nullptr unless this is a choice node.
  [[nodiscard]] const std::vector<Choice>* choices() const {
    const auto* choice = std::get_if<ChoiceAction>(&action);
    return choice != nullptr ? &choice->choices : nullptr;
  }
};

} // namespace TalkGraph::scripting

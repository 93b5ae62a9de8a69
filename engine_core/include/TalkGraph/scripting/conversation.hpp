#pragma once

/**
 * @file conversation.hpp
 * @brief Compiled conversation graph and its traversal cursor
 *
 * A Conversation is produced by TalkCompiler::compile() and is the only
 * runtime object of the dialogue core. Nodes live in an index-stable arena;
 * edges carry no payload and only record that one node may follow another.
 * The `current` cursor is the single piece of mutable state and always
 * refers to a valid node.
 *
 * Example usage:
 * @code
 * TalkCompiler compiler;
 * auto result = compiler.compile(script);
 * if (result.isOk()) {
 *     Conversation convo = std::move(result).value();
 *     std::cout << convo.currentText() << "\n";
 *     if (auto choices = convo.currentChoices()) {
 *         convo.jumpTo((*choices)[0].next);
 *     } else {
 *         convo.advance();
 *     }
 * }
 * @endcode
 */

#include "TalkGraph/core/result.hpp"
#include "TalkGraph/core/types.hpp"
#include "TalkGraph/scripting/dialogue_node.hpp"
#include "TalkGraph/scripting/talk_error.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace TalkGraph::scripting {

/// Index of a node inside a conversation's arena.
using NodeIndex = usize;

/**
 * @brief Directed edge between two nodes (no payload)
 */
struct DialogueEdge {
  NodeIndex from = 0;
  NodeIndex to = 0;

  bool operator==(const DialogueEdge&) const = default;
};

class Conversation {
public:
  Conversation(Conversation&&) noexcept = default;
  Conversation& operator=(Conversation&&) noexcept = default;
  Conversation(const Conversation&) = default;
  Conversation& operator=(const Conversation&) = default;
  ~Conversation() = default;

  // =========================================================================
  // Current node queries
  // =========================================================================

  [[nodiscard]] const std::string& currentText() const;

  /**
   * @brief Talkers of the current node (speakers, or actors entering/leaving)
   */
  [[nodiscard]] std::vector<Talker> currentTalkers() const;

  [[nodiscard]] NodeKind currentKind() const;

  /**
   * @brief The current node's choices; nullopt unless it is a choice node
   */
  [[nodiscard]] std::optional<std::vector<Choice>> currentChoices() const;

  /**
   * @brief Author id of the current line
   */
  [[nodiscard]] LineId currentId() const;

  [[nodiscard]] NodeIndex currentIndex() const { return m_current; }
  [[nodiscard]] const DialogueNode& currentNode() const { return m_nodes[m_current]; }

  /**
   * @brief Whether advance() would succeed from the current node
   */
  [[nodiscard]] bool hasNext() const;

  // =========================================================================
  // Traversal
  // =========================================================================

  /**
   * @brief Move to the node linked by the current node's outgoing edge
   *
   * Fails with ChoicesNotHandled on a choice node (choices are resolved
   * with jumpTo) and with NoNextAction when there is no outgoing edge.
   */
  Result<void, TraversalError> advance();

  /**
   * @brief Move directly to the line with author id @p id
   *
   * Any line of the script is a valid target, not only the current
   * choices. Fails with WrongJump(id) if no such line exists.
   */
  Result<void, TraversalError> jumpTo(LineId id);

  // =========================================================================
  // Graph inspection
  // =========================================================================

  [[nodiscard]] usize nodeCount() const { return m_nodes.size(); }
  [[nodiscard]] usize edgeCount() const { return m_edges.size(); }
  [[nodiscard]] NodeIndex startIndex() const { return m_start; }

  [[nodiscard]] const DialogueNode& node(NodeIndex index) const { return m_nodes.at(index); }
  [[nodiscard]] const std::vector<DialogueNode>& nodes() const { return m_nodes; }
  [[nodiscard]] const std::vector<DialogueEdge>& edges() const { return m_edges; }

  /**
   * @brief Targets of the outgoing edges of @p index, in insertion order
   */
  [[nodiscard]] const std::vector<NodeIndex>& successors(NodeIndex index) const {
    return m_outgoing.at(index);
  }

  [[nodiscard]] bool containsId(LineId id) const { return m_indexById.count(id) > 0; }
  [[nodiscard]] std::optional<NodeIndex> indexOf(LineId id) const;

private:
  friend class TalkCompiler;

  Conversation() = default;

  NodeIndex addNode(DialogueNode node);
  void addEdge(NodeIndex from, NodeIndex to);

  std::vector<DialogueNode> m_nodes;
  std::vector<DialogueEdge> m_edges;
  std::vector<std::vector<NodeIndex>> m_outgoing;

  // Author id -> arena index, kept for jumpTo().
  std::unordered_map<LineId, NodeIndex> m_indexById;

  NodeIndex m_start = 0;
  NodeIndex m_current = 0;
};

} // namespace TalkGraph::scripting

#include "TalkGraph/scripting/conversation.hpp"
#include "TalkGraph/core/logger.hpp"

namespace TalkGraph::scripting {

const std::string& Conversation::currentText() const {
  return m_nodes[m_current].text;
}

std::vector<Talker> Conversation::currentTalkers() const {
  return m_nodes[m_current].talkers();
}

NodeKind Conversation::currentKind() const {
  return m_nodes[m_current].kind();
}

std::optional<std::vector<Choice>> Conversation::currentChoices() const {
  const auto* choices = m_nodes[m_current].choices();
  if (choices == nullptr) {
    return std::nullopt;
  }
  return *choices;
}

LineId Conversation::currentId() const {
  return m_nodes[m_current].id;
}

bool Conversation::hasNext() const {
  return !m_nodes[m_current].isChoice() && !m_outgoing[m_current].empty();
}

Result<void, TraversalError> Conversation::advance() {
  if (m_nodes[m_current].isChoice()) {
    return Result<void, TraversalError>::error(TraversalError::choicesNotHandled());
  }

  const auto& next = m_outgoing[m_current];
  if (next.empty()) {
    return Result<void, TraversalError>::error(TraversalError::noNextAction());
  }

  TALKGRAPH_LOG_TRACE("Conversation advanced from line {} to line {}", m_nodes[m_current].id,
                      m_nodes[next.front()].id);
  m_current = next.front();
  return Result<void, TraversalError>::ok();
}

Result<void, TraversalError> Conversation::jumpTo(LineId id) {
  auto it = m_indexById.find(id);
  if (it == m_indexById.end()) {
    return Result<void, TraversalError>::error(TraversalError::wrongJump(id));
  }

  TALKGRAPH_LOG_TRACE("Conversation jumped from line {} to line {}", m_nodes[m_current].id, id);
  m_current = it->second;
  return Result<void, TraversalError>::ok();
}

std::optional<NodeIndex> Conversation::indexOf(LineId id) const {
  auto it = m_indexById.find(id);
  if (it == m_indexById.end()) {
    return std::nullopt;
  }
  return it->second;
}

NodeIndex Conversation::addNode(DialogueNode node) {
  NodeIndex index = m_nodes.size();
  m_nodes.push_back(std::move(node));
  m_outgoing.emplace_back();
  return index;
}

void Conversation::addEdge(NodeIndex from, NodeIndex to) {
  m_edges.push_back(DialogueEdge{from, to});
  m_outgoing[from].push_back(to);
}

} // namespace TalkGraph::scripting

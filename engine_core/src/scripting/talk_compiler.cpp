#include "TalkGraph/scripting/talk_compiler.hpp"
#include "TalkGraph/core/logger.hpp"
#include <unordered_map>

namespace TalkGraph::scripting {

namespace {

using CompileResult = Result<Conversation, CompileError>;

CompileResult fail(CompileError err) {
  TALKGRAPH_LOG_WARN("Conversation compilation failed: " + err.format());
  return CompileResult::error(std::move(err));
}

NodeAction buildAction(const DialogueLine& line, std::vector<Talker> talkers) {
  // next has priority over choices
  if (line.hasChoices() && !line.next.has_value()) {
    return ChoiceAction{std::move(talkers), *line.choices};
  }

  switch (line.action) {
  case LineAction::Enter:
    return JoinAction{std::move(talkers)};
  case LineAction::Exit:
    return LeaveAction{std::move(talkers)};
  case LineAction::Talk:
    break;
  }
  return TalkAction{std::move(talkers)};
}

} // namespace

Result<Conversation, CompileError> TalkCompiler::compile(const TalkScript& script) const {
  if (script.lines.empty()) {
    return fail(CompileError::noLines());
  }

  // Later talkers with the same name replace earlier ones.
  std::unordered_map<std::string, const Talker*> talkerMap;
  std::vector<std::string> talkerNames;
  for (const auto& talker : script.talkers) {
    if (talkerMap.count(talker.name) == 0) {
      talkerNames.push_back(talker.name);
    }
    talkerMap[talker.name] = &talker;
  }

  Conversation convo;
  std::optional<NodeIndex> startIndex;

  for (const auto& line : script.lines) {
    std::vector<Talker> talkers;
    for (const auto& name : line.talkerNames()) {
      auto it = talkerMap.find(name);
      if (it == talkerMap.end()) {
        CompileError err = CompileError::talkerNotFound(line.id, name);
        for (auto& suggestion : suggestNames(name, talkerNames)) {
          err.withSuggestion(std::move(suggestion));
        }
        return fail(std::move(err));
      }
      talkers.push_back(*it->second);
    }

    if (line.hasChoices() && line.next.has_value()) {
      TALKGRAPH_LOG_WARN("Dialogue line {} has both 'next' and 'choices'; choices are ignored",
                         line.id);
    }

    NodeIndex index = convo.addNode(DialogueNode{line.id, line.text, buildAction(line, talkers)});

    if (line.isStart()) {
      if (startIndex.has_value()) {
        return fail(CompileError::multipleStartingDialogues());
      }
      startIndex = index;
    }

    if (!convo.m_indexById.emplace(line.id, index).second) {
      return fail(CompileError::repeatedId(line.id));
    }
  }

  if (!startIndex.has_value()) {
    return fail(CompileError::noStartingDialogue());
  }

  // Lines were added in input order, so line i is node i.
  for (NodeIndex from = 0; from < script.lines.size(); ++from) {
    const auto& line = script.lines[from];
    const bool addEdges = !(m_options.honourEndFlag && line.isEnd());

    if (line.next.has_value()) {
      auto it = convo.m_indexById.find(*line.next);
      if (it == convo.m_indexById.end()) {
        return fail(CompileError::nextLineNotFound(line.id, *line.next));
      }
      if (addEdges) {
        convo.addEdge(from, it->second);
      }
    } else if (line.hasChoices()) {
      for (const auto& choice : *line.choices) {
        auto it = convo.m_indexById.find(choice.next);
        if (it == convo.m_indexById.end()) {
          return fail(CompileError::nextLineNotFound(line.id, choice.next));
        }
        if (addEdges) {
          convo.addEdge(from, it->second);
        }
      }
    }
  }

  convo.m_start = *startIndex;
  convo.m_current = *startIndex;

  TALKGRAPH_LOG_DEBUG("Compiled conversation with {} nodes and {} edges, starting at line {}",
                      convo.nodeCount(), convo.edgeCount(), convo.currentId());
  return CompileResult::ok(std::move(convo));
}

} // namespace TalkGraph::scripting

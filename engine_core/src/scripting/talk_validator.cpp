#include "TalkGraph/scripting/talk_validator.hpp"
#include "TalkGraph/core/logger.hpp"
#include <queue>

namespace TalkGraph::scripting {

ValidationResult TalkValidator::validate(const TalkScript& script) const {
  ValidationResult result;

  checkTalkers(script, result.diagnostics);
  checkLines(script, result.diagnostics);
  if (m_reportUnreachable) {
    checkReachability(script, result.diagnostics);
  }

  if (m_warningsAsErrors) {
    result.diagnostics.promoteWarnings();
  }
  result.isValid = !result.diagnostics.hasErrors();

  TALKGRAPH_LOG_DEBUG("Validated script: {} diagnostic(s)", result.diagnostics.size());
  return result;
}

void TalkValidator::checkTalkers(const TalkScript& script, DiagnosticList& out) const {
  std::unordered_set<std::string> declared;
  for (const auto& talker : script.talkers) {
    if (!declared.insert(talker.name).second) {
      out.addWarning(DiagnosticCode::DuplicateTalkerName,
                     "talker '" + talker.name +
                         "' is declared more than once; the last declaration wins");
    }
  }

  if (!m_reportUnused) {
    return;
  }

  std::unordered_set<std::string> used;
  for (const auto& line : script.lines) {
    for (const auto& name : line.talkerNames()) {
      used.insert(name);
    }
  }

  std::unordered_set<std::string> reported;
  for (const auto& talker : script.talkers) {
    if (used.count(talker.name) == 0 && reported.insert(talker.name).second) {
      out.addWarning(DiagnosticCode::UnusedTalker,
                     "talker '" + talker.name + "' is never used by any line");
    }
  }
}

void TalkValidator::checkLines(const TalkScript& script, DiagnosticList& out) const {
  for (const auto& line : script.lines) {
    const std::string lineName = "line " + std::to_string(line.id);

    if (line.choices.has_value() && line.choices->empty()) {
      out.addWarning(DiagnosticCode::EmptyChoiceList,
                     lineName + " has an empty choice list; it is treated as having no choices",
                     line.id);
    }

    if (line.hasChoices() && line.next.has_value()) {
      out.addWarning(DiagnosticCode::NextOverridesChoices,
                     lineName + " has both 'next' and 'choices'; the choices are ignored",
                     line.id);
    }

    if (line.isEnd() && (line.next.has_value() || line.hasChoices())) {
      out.addWarning(DiagnosticCode::EndLineHasLinks,
                     m_honourEndFlag
                         ? lineName + " is flagged 'end' but has links; they are not followed"
                         : lineName + " is flagged 'end' but its links are still followed",
                     line.id);
    }

    if (line.hasChoices()) {
      std::unordered_set<std::string> texts;
      for (const auto& choice : *line.choices) {
        if (!texts.insert(choice.text).second) {
          out.addWarning(DiagnosticCode::DuplicateChoiceText,
                         lineName + " offers the choice '" + choice.text + "' more than once",
                         line.id);
        }
      }
    }

    if (!line.next.has_value() && !line.hasChoices() && !line.isEnd()) {
      out.addHint(DiagnosticCode::DeadEndWithoutEndFlag,
                  lineName + " has no 'next' or 'choices'; add 'end': true if it ends the talk",
                  line.id);
    }
  }
}

void TalkValidator::checkReachability(const TalkScript& script, DiagnosticList& out) const {
  const DialogueLine* start = nullptr;
  for (const auto& line : script.lines) {
    if (line.isStart()) {
      if (start != nullptr) {
        return; // ambiguous entry point, reported by the compiler
      }
      start = &line;
    }
  }
  if (start == nullptr) {
    return;
  }

  std::unordered_map<LineId, const DialogueLine*> byId;
  for (const auto& line : script.lines) {
    byId.emplace(line.id, &line);
  }

  std::unordered_set<LineId> visited;
  std::queue<LineId> pending;
  visited.insert(start->id);
  pending.push(start->id);

  auto visit = [&](LineId target) {
    if (byId.count(target) != 0 && visited.insert(target).second) {
      pending.push(target);
    }
  };

  while (!pending.empty()) {
    const DialogueLine& line = *byId.at(pending.front());
    pending.pop();

    if (m_honourEndFlag && line.isEnd()) {
      continue;
    }
    if (line.next.has_value()) {
      visit(*line.next);
    } else if (line.hasChoices()) {
      for (const auto& choice : *line.choices) {
        visit(choice.next);
      }
    }
  }

  for (const auto& line : script.lines) {
    if (visited.count(line.id) == 0) {
      out.addWarning(DiagnosticCode::UnreachableLine,
                     "line " + std::to_string(line.id) +
                         " is not reachable from the start line " + std::to_string(start->id),
                     line.id);
    }
  }
}

} // namespace TalkGraph::scripting

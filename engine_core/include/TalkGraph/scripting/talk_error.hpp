#pragma once

/**
 * @file talk_error.hpp
 * @brief Error and diagnostic types for the talk compiler, traversal and
 * validator
 *
 * Three families live here:
 * - CompileError: fatal, returned once by TalkCompiler::compile()
 * - TraversalError: recoverable, returned per advance/jump request
 * - Diagnostic: non-fatal findings reported by the TalkValidator
 *
 * Error codes are grouped as:
 * - E1xx: compile errors
 * - E2xx: traversal errors
 * - W3xx: validator diagnostics
 */

#include "TalkGraph/core/types.hpp"
#include "TalkGraph/scripting/talk_script.hpp"
#include <algorithm>
#include <numeric>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TalkGraph::scripting {

// =============================================================================
// Name Suggestions
// =============================================================================

/**
 * @brief Number of single-character inserts, deletes and substitutions
 *        needed to turn @p from into @p to
 */
[[nodiscard]] inline usize editDistance(std::string_view from, std::string_view to) {
  if (from.size() < to.size()) {
    std::swap(from, to);
  }

  // row[j] holds the distance between the current prefix of `from` and to[0, j).
  std::vector<usize> row(to.size() + 1);
  std::iota(row.begin(), row.end(), usize{0});

  for (usize i = 0; i < from.size(); ++i) {
    usize diagonal = row[0];
    row[0] = i + 1;
    for (usize j = 0; j < to.size(); ++j) {
      const usize above = row[j + 1];
      const usize substitute = diagonal + (from[i] == to[j] ? 0 : 1);
      row[j + 1] = std::min(substitute, std::min(above, row[j]) + 1);
      diagonal = above;
    }
  }
  return row.back();
}

/**
 * @brief Names from @p known that look like a misspelling of @p name
 *
 * At most @p limit names within @p maxEdits edits are returned, closest
 * first; equally close names keep their order in @p known. An exact match
 * is not a suggestion.
 */
[[nodiscard]] inline std::vector<std::string>
suggestNames(const std::string& name, const std::vector<std::string>& known, usize maxEdits = 2,
             usize limit = 3) {
  std::vector<std::pair<usize, usize>> ranked; // (distance, index into known)

  for (usize index = 0; index < known.size(); ++index) {
    const std::string& candidate = known[index];
    const usize sizeGap = name.size() > candidate.size() ? name.size() - candidate.size()
                                                         : candidate.size() - name.size();
    if (sizeGap > maxEdits) {
      continue; // the distance is at least the length difference
    }
    const usize distance = editDistance(name, candidate);
    if (distance != 0 && distance <= maxEdits) {
      ranked.emplace_back(distance, index);
    }
  }

  std::sort(ranked.begin(), ranked.end());
  if (ranked.size() > limit) {
    ranked.resize(limit);
  }

  std::vector<std::string> names;
  names.reserve(ranked.size());
  for (const auto& entry : ranked) {
    names.push_back(known[entry.second]);
  }
  return names;
}

// =============================================================================
// Compile Errors
// =============================================================================

enum class CompileErrorCode : u32 {
  NoLines = 101,
  TalkerNotFound = 102,
  NextLineNotFound = 103,
  RepeatedId = 104,
  NoStartingDialogue = 105,
  MultipleStartingDialogues = 106
};

[[nodiscard]] inline const char* compileErrorCodeToString(CompileErrorCode code) {
  switch (code) {
  case CompileErrorCode::NoLines:
    return "NoLines";
  case CompileErrorCode::TalkerNotFound:
    return "TalkerNotFound";
  case CompileErrorCode::NextLineNotFound:
    return "NextLineNotFound";
  case CompileErrorCode::RepeatedId:
    return "RepeatedId";
  case CompileErrorCode::NoStartingDialogue:
    return "NoStartingDialogue";
  case CompileErrorCode::MultipleStartingDialogues:
    return "MultipleStartingDialogues";
  }
  return "Unknown";
}

/**
 * @brief Reason a script could not be compiled into a Conversation
 *
 * Only the fields relevant to the code are meaningful:
 * - TalkerNotFound: lineId, talkerName
 * - NextLineNotFound: lineId, targetId
 * - RepeatedId: lineId
 *
 * Suggestions are advisory and do not take part in equality.
 */
struct CompileError {
  CompileErrorCode code = CompileErrorCode::NoLines;
  LineId lineId = 0;
  LineId targetId = 0;
  std::string talkerName;
  std::vector<std::string> suggestions;

  [[nodiscard]] static CompileError noLines() { return CompileError{CompileErrorCode::NoLines}; }

  [[nodiscard]] static CompileError talkerNotFound(LineId line, std::string name) {
    CompileError err{CompileErrorCode::TalkerNotFound};
    err.lineId = line;
    err.talkerName = std::move(name);
    return err;
  }

  [[nodiscard]] static CompileError nextLineNotFound(LineId line, LineId target) {
    CompileError err{CompileErrorCode::NextLineNotFound};
    err.lineId = line;
    err.targetId = target;
    return err;
  }

  [[nodiscard]] static CompileError repeatedId(LineId line) {
    CompileError err{CompileErrorCode::RepeatedId};
    err.lineId = line;
    return err;
  }

  [[nodiscard]] static CompileError noStartingDialogue() {
    return CompileError{CompileErrorCode::NoStartingDialogue};
  }

  [[nodiscard]] static CompileError multipleStartingDialogues() {
    return CompileError{CompileErrorCode::MultipleStartingDialogues};
  }

  CompileError& withSuggestion(std::string suggestion) {
    suggestions.push_back(std::move(suggestion));
    return *this;
  }

  bool operator==(const CompileError& other) const {
    return code == other.code && lineId == other.lineId && targetId == other.targetId &&
           talkerName == other.talkerName;
  }

  /**
   * @brief Get the error code as a string (e.g., "E102")
   */
  [[nodiscard]] std::string errorCodeString() const {
    return "E" + std::to_string(static_cast<u32>(code));
  }

  [[nodiscard]] std::string message() const {
    switch (code) {
    case CompileErrorCode::NoLines:
      return "an empty lines list was used to build the conversation";
    case CompileErrorCode::TalkerNotFound:
      return "the dialogue line " + std::to_string(lineId) +
             " has specified a non existent talker " + talkerName;
    case CompileErrorCode::NextLineNotFound:
      return "the dialogue line " + std::to_string(lineId) + " is pointing to id " +
             std::to_string(targetId) + " which was not found";
    case CompileErrorCode::RepeatedId:
      return "the dialogue line " + std::to_string(lineId) +
             " has the same id as another dialogue";
    case CompileErrorCode::NoStartingDialogue:
      return "no initial dialogue was found, add a 'start': true to one of the dialogue lines";
    case CompileErrorCode::MultipleStartingDialogues:
      return "too many dialogues with 'start' flag set to true. Only one allowed.";
    }
    return "unknown compile error";
  }

  /**
   * @brief Single-line form, e.g. "error[E103]: the dialogue line 1 is ..."
   */
  [[nodiscard]] std::string format() const {
    return "error[" + errorCodeString() + "]: " + message();
  }

  /**
   * @brief format() followed by the "did you mean" suggestions, if any
   */
  [[nodiscard]] std::string formatRich() const {
    std::ostringstream ss;
    ss << format() << "\n";
    if (suggestions.size() == 1) {
      ss << "  suggestion: did you mean '" << suggestions[0] << "'?\n";
    } else if (!suggestions.empty()) {
      ss << "  suggestions:\n";
      for (usize i = 0; i < suggestions.size(); ++i) {
        ss << "    " << (i + 1) << ". " << suggestions[i] << "\n";
      }
    }
    return ss.str();
  }
};

// =============================================================================
// Traversal Errors
// =============================================================================

enum class TraversalErrorCode : u32 {
  NoNextAction = 201,
  ChoicesNotHandled = 202,
  WrongJump = 203,
  NoTalk = 204
};

/**
 * @brief Reason an advance/jump request was refused
 *
 * The conversation is left unchanged when one of these is returned.
 */
struct TraversalError {
  TraversalErrorCode code = TraversalErrorCode::NoNextAction;
  LineId targetId = 0; ///< WrongJump only

  [[nodiscard]] static TraversalError noNextAction() {
    return TraversalError{TraversalErrorCode::NoNextAction};
  }
  [[nodiscard]] static TraversalError choicesNotHandled() {
    return TraversalError{TraversalErrorCode::ChoicesNotHandled};
  }
  [[nodiscard]] static TraversalError wrongJump(LineId target) {
    return TraversalError{TraversalErrorCode::WrongJump, target};
  }
  [[nodiscard]] static TraversalError noTalk() { return TraversalError{TraversalErrorCode::NoTalk}; }

  bool operator==(const TraversalError&) const = default;

  [[nodiscard]] std::string message() const {
    switch (code) {
    case TraversalErrorCode::NoNextAction:
      return "No next action found.";
    case TraversalErrorCode::ChoicesNotHandled:
      return "Cannot advance a choice action.";
    case TraversalErrorCode::WrongJump:
      return "jumped to action " + std::to_string(targetId) + ", but it does not exist";
    case TraversalErrorCode::NoTalk:
      return "No talk was found";
    }
    return "unknown traversal error";
  }
};

// =============================================================================
// Validator Diagnostics
// =============================================================================

enum class Severity : u8 {
  Hint,
  Warning,
  Error
};

[[nodiscard]] inline const char* severityToString(Severity sev) {
  switch (sev) {
  case Severity::Hint:
    return "hint";
  case Severity::Warning:
    return "warning";
  case Severity::Error:
    return "error";
  }
  return "unknown";
}

enum class DiagnosticCode : u32 {
  DuplicateTalkerName = 301,
  UnusedTalker = 302,
  UnreachableLine = 303,
  NextOverridesChoices = 304,
  EndLineHasLinks = 305,
  EmptyChoiceList = 306,
  DuplicateChoiceText = 307,
  DeadEndWithoutEndFlag = 308
};

/**
 * @brief A non-fatal finding about an authored script
 */
struct Diagnostic {
  DiagnosticCode code = DiagnosticCode::UnusedTalker;
  Severity severity = Severity::Warning;
  std::string message;
  std::optional<LineId> lineId; ///< Absent for talker-level findings

  [[nodiscard]] bool isError() const { return severity == Severity::Error; }
  [[nodiscard]] bool isWarning() const { return severity == Severity::Warning; }

  [[nodiscard]] std::string codeString() const {
    return "W" + std::to_string(static_cast<u32>(code));
  }

  /**
   * @brief e.g. "warning[W303] line 7: line 7 is not reachable from the start line"
   */
  [[nodiscard]] std::string format() const {
    std::ostringstream ss;
    ss << severityToString(severity) << "[" << codeString() << "]";
    if (lineId.has_value()) {
      ss << " line " << *lineId;
    }
    ss << ": " << message;
    return ss.str();
  }
};

class DiagnosticList {
public:
  void add(Diagnostic diagnostic) { m_items.push_back(std::move(diagnostic)); }

  void addWarning(DiagnosticCode code, std::string message,
                  std::optional<LineId> lineId = std::nullopt) {
    m_items.push_back(Diagnostic{code, Severity::Warning, std::move(message), lineId});
  }

  void addHint(DiagnosticCode code, std::string message,
               std::optional<LineId> lineId = std::nullopt) {
    m_items.push_back(Diagnostic{code, Severity::Hint, std::move(message), lineId});
  }

  [[nodiscard]] bool hasErrors() const {
    return std::any_of(m_items.begin(), m_items.end(),
                       [](const Diagnostic& d) { return d.isError(); });
  }

  [[nodiscard]] bool hasWarnings() const {
    return std::any_of(m_items.begin(), m_items.end(),
                       [](const Diagnostic& d) { return d.isWarning(); });
  }

  [[nodiscard]] usize count(DiagnosticCode code) const {
    return static_cast<usize>(std::count_if(m_items.begin(), m_items.end(),
                                            [code](const Diagnostic& d) { return d.code == code; }));
  }

  [[nodiscard]] bool contains(DiagnosticCode code) const { return count(code) > 0; }

  /// Promote every warning to an error.
  void promoteWarnings() {
    for (auto& d : m_items) {
      if (d.severity == Severity::Warning) {
        d.severity = Severity::Error;
      }
    }
  }

  [[nodiscard]] const std::vector<Diagnostic>& all() const { return m_items; }
  [[nodiscard]] bool empty() const { return m_items.empty(); }
  [[nodiscard]] usize size() const { return m_items.size(); }
  void clear() { m_items.clear(); }

private:
  std::vector<Diagnostic> m_items;
};

} // namespace TalkGraph::scripting

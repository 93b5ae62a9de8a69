#pragma once

/**
 * @file talk_validator.hpp
 * @brief Authoring lint for conversation scripts
 *
 * The validator looks for mistakes that still compile but are almost
 * certainly unintended:
 * - Talkers declared twice or never used
 * - Lines that cannot be reached from the start line
 * - Links that are ignored (`next` beside `choices`, links on `end` lines)
 * - Empty choice lists and repeated choice texts
 * - Dead ends that are not flagged `end`
 *
 * Unlike TalkCompiler it never stops early, and it does not repeat the
 * compiler's errors (missing talkers, unknown targets, duplicate ids).
 *
 * Example usage:
 * @code
 * TalkValidator validator;
 * ValidationResult result = validator.validate(script);
 * for (const auto& d : result.diagnostics.all()) {
 *     std::cerr << d.format() << std::endl;
 * }
 * @endcode
 */

#include "TalkGraph/scripting/talk_error.hpp"
#include "TalkGraph/scripting/talk_script.hpp"
#include <unordered_map>
#include <unordered_set>

namespace TalkGraph::scripting {

struct ValidationResult {
  DiagnosticList diagnostics;
  bool isValid = true;

  [[nodiscard]] bool hasErrors() const { return diagnostics.hasErrors(); }
  [[nodiscard]] bool hasWarnings() const { return diagnostics.hasWarnings(); }
};

class TalkValidator {
public:
  TalkValidator() = default;

  [[nodiscard]] ValidationResult validate(const TalkScript& script) const;

  void setReportUnused(bool report) { m_reportUnused = report; }
  void setReportUnreachable(bool report) { m_reportUnreachable = report; }

  /**
   * @brief Treat every warning as an error (hints stay hints)
   */
  void setWarningsAsErrors(bool enabled) { m_warningsAsErrors = enabled; }

  /**
   * @brief Whether `end: true` suppresses links; must match the compiler
   */
  void setHonourEndFlag(bool honour) { m_honourEndFlag = honour; }

private:
  void checkTalkers(const TalkScript& script, DiagnosticList& out) const;
  void checkLines(const TalkScript& script, DiagnosticList& out) const;
  void checkReachability(const TalkScript& script, DiagnosticList& out) const;

  bool m_reportUnused = true;
  bool m_reportUnreachable = true;
  bool m_warningsAsErrors = false;
  bool m_honourEndFlag = true;
};

} // namespace TalkGraph::scripting
